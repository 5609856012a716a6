//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "unified_state_merger.hpp"

#include "logging.hpp"
#include "plugin_registry.hpp"
#include "plugin_session.hpp"
#include "scope.hpp"
#include "state_provider_adapter.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/property.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{
namespace
{

constexpr const char* KernelAuthority = "kernel";

}  // namespace

/// State of a single query in progress - merges plugin answers as they arrive.
///
class UnifiedStateMerger::Gathering final
{
public:
    Gathering(const Scope&             scope,
              model::UnifiedSnapshot&& snapshot,
              const std::size_t        pending,
              QueryResult::Handler     handler,
              common::LoggerPtr        logger)
        : scope_{scope}
        , snapshot_{std::move(snapshot)}
        , pending_{pending}
        , handler_{std::move(handler)}
        , logger_{std::move(logger)}
    {
        // Kernel-reported values are the first authority of every property they carry.
        for (const auto& name_state : snapshot_.interfaces)
        {
            auto& authorities = authorities_[name_state.first];
            for (const auto& key_value : name_state.second.properties)
            {
                authorities[key_value.first] = KernelAuthority;
            }
        }
    }

    void onAnswer(const PluginSession& session, PluginSession::QueryResult::Var&& result)
    {
        if (const auto* const failure = cetl::get_if<PluginSession::QueryResult::Failure>(&result))
        {
            mergeFailure(session, *failure);
        }
        else
        {
            for (const auto& state : cetl::get<PluginSession::QueryResult::Success>(result))
            {
                mergeState(session, state);
            }
        }

        CETL_DEBUG_ASSERT(pending_ > 0, "");
        if (--pending_ == 0)
        {
            finish();
        }
    }

    void finish()
    {
        if (conflict_)
        {
            handler_(std::move(*conflict_));
            return;
        }

        logger_->trace("Snapshot is ready (ifaces={}, partial={}).", snapshot_.interfaces.size(), snapshot_.partial);
        handler_(std::move(snapshot_));
    }

private:
    void mergeFailure(const PluginSession& session, const model::Error& error)
    {
        logger_->warn("Plugin '{}' state is missing (kind={}, msg='{}').",
                      session.name(),
                      model::toString(error.kind),
                      error.message);

        snapshot_.partial = true;
        snapshot_.warnings.push_back(
            model::Error::make(error.kind, "Plugin '" + session.name() + "': " + error.message, error.interfaces));
    }

    void mergeState(const PluginSession& session, const model::InterfaceState& state)
    {
        if (!scope_.contains(state.name))
        {
            return;
        }

        auto it = snapshot_.interfaces.find(state.name);
        if (it == snapshot_.interfaces.end())
        {
            // Only the type owner may bring in an interface which the kernel doesn't know about.
            if (!session.ownsType(state.type))
            {
                logger_->debug("Plugin '{}' reported unknown interface '{}' (type='{}') - ignored.",
                               session.name(),
                               state.name,
                               state.type);
                return;
            }

            model::InterfaceState plugin_only;
            plugin_only.name   = state.name;
            plugin_only.type   = state.type;
            plugin_only.owner  = session.name();
            plugin_only.source = model::StateSource::PluginOnly;
            it                 = snapshot_.interfaces.emplace(state.name, std::move(plugin_only)).first;
        }

        auto&      merged      = it->second;
        auto&      authorities = authorities_[merged.name];
        const bool is_owner    = (merged.owner == session.name());
        for (const auto& key_value : state.properties)
        {
            const auto& key = key_value.first;
            if (!is_owner && !session.ownsProperty(key))
            {
                reportConflict(merged.name,
                               "Plugin '" + session.name() + "' reported property '" + key + "' of '" + merged.name +
                                   "' outside of its capabilities.");
                continue;
            }

            const auto prop_it = merged.properties.find(key);
            if (prop_it != merged.properties.end())
            {
                if (!model::isSameValue(prop_it->second, key_value.second))
                {
                    reportConflict(merged.name,
                                   "Property '" + key + "' of '" + merged.name + "' is reported as '" +
                                       model::toString(prop_it->second) + "' by '" + authorities[key] + "', but as '" +
                                       model::toString(key_value.second) + "' by '" + session.name() + "'.");
                }
                continue;
            }

            merged.properties.emplace(key, key_value.second);
            authorities[key] = session.name();
        }

        if (merged.source == model::StateSource::KernelOnly)
        {
            merged.source = model::StateSource::Merged;
        }
    }

    void reportConflict(const std::string& iface, const std::string& message)
    {
        logger_->error("Configuration conflict: {}", message);
        if (!conflict_)
        {
            conflict_ = model::Error::make(model::ErrorKind::ConfigurationConflict, message, {iface});
        }
    }

    using Authorities = std::map<std::string, std::string>;

    const Scope                        scope_;
    model::UnifiedSnapshot             snapshot_;
    std::size_t                        pending_;
    QueryResult::Handler               handler_;
    common::LoggerPtr                  logger_;
    std::map<std::string, Authorities> authorities_;
    cetl::optional<model::Error>       conflict_;

};  // Gathering

UnifiedStateMerger::UnifiedStateMerger(libcyphal::IExecutor&     executor,
                                       StateProviderAdapter&     provider,
                                       PluginRegistry&           registry,
                                       const libcyphal::Duration plugin_timeout)
    : provider_{provider}
    , registry_{registry}
    , plugin_timeout_{plugin_timeout}
    , deferred_{executor}
{
}

void UnifiedStateMerger::query(const Scope& scope, QueryResult::Handler handler)
{
    CETL_DEBUG_ASSERT(handler, "");

    auto kernel_result = provider_.getState(scope);
    if (auto* const failure = cetl::get_if<StateProviderAdapter::GetStateResult::Failure>(&kernel_result))
    {
        deferred_.post([handler = std::move(handler), failure = std::move(*failure)]() mutable {
            //
            handler(std::move(failure));
        });
        return;
    }

    model::UnifiedSnapshot snapshot;
    for (auto& state : cetl::get<StateProviderAdapter::GetStateResult::Success>(kernel_result))
    {
        state.source = model::StateSource::KernelOnly;
        state.owner.clear();
        if (const auto owner = registry_.findTypeOwner(state.type))
        {
            state.owner = owner->name();
        }
        auto name = state.name;
        snapshot.interfaces.emplace(std::move(name), std::move(state));
    }

    const auto sessions  = registry_.sessions();
    auto       gathering = std::make_shared<Gathering>(scope,  //
                                                 std::move(snapshot),
                                                 sessions.size(),
                                                 std::move(handler),
                                                 logger_);
    if (sessions.empty())
    {
        deferred_.post([gathering] { gathering->finish(); });
        return;
    }

    const auto single = scope.single();
    for (const auto& session : sessions)
    {
        session->query(single, plugin_timeout_, [gathering, session](auto&& result) {
            //
            gathering->onAnswer(*session, std::move(result));
        });
    }
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
