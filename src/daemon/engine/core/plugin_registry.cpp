//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin_registry.hpp"

#include "plugin_session.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/property.hpp"

#include <cetl/pf17/cetlpf.hpp>

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

PluginRegistry::PluginRegistry(TypePredicate is_provider_type)
    : is_provider_type_{std::move(is_provider_type)}
{
    CETL_DEBUG_ASSERT(is_provider_type_, "");
}

PluginRegistry::AddResult::Var PluginRegistry::add(PluginSession::Ptr session)
{
    CETL_DEBUG_ASSERT(session, "");

    if (session->name().empty())
    {
        return model::Error::make(model::ErrorKind::InvalidRequest, "Plugin name must not be empty.");
    }

    if (const auto conflict = findConflict(*session))
    {
        logger_->warn("Plugin '{}' registration is rejected: {}", session->name(), conflict.value());
        return model::Error::make(model::ErrorKind::ConfigurationConflict, conflict.value());
    }

    logger_->info("Plugin '{}' is registered (session={}, types={}, props={}).",
                  session->name(),
                  session->id(),
                  session->capabilities().interface_types.size(),
                  session->capabilities().property_prefixes.size());

    name_to_session_.emplace(session->name(), std::move(session));
    return cetl::monostate{};
}

void PluginRegistry::remove(const PluginSession& session)
{
    const auto it = name_to_session_.find(session.name());
    if ((it != name_to_session_.end()) && (it->second->id() == session.id()))
    {
        logger_->info("Plugin '{}' is unregistered (session={}).", session.name(), session.id());
        name_to_session_.erase(it);
    }
}

PluginSession::Ptr PluginRegistry::findByName(const std::string& name) const
{
    const auto it = name_to_session_.find(name);
    return (it != name_to_session_.end()) ? it->second : nullptr;
}

PluginSession::Ptr PluginRegistry::findTypeOwner(const std::string& type) const
{
    for (const auto& name_session : name_to_session_)
    {
        if (name_session.second->ownsType(type))
        {
            return name_session.second;
        }
    }
    return nullptr;
}

PluginSession::Ptr PluginRegistry::findPropertyOwner(const std::string& key) const
{
    for (const auto& name_session : name_to_session_)
    {
        if (name_session.second->ownsProperty(key))
        {
            return name_session.second;
        }
    }
    return nullptr;
}

std::vector<PluginSession::Ptr> PluginRegistry::sessions() const
{
    std::vector<PluginSession::Ptr> result;
    result.reserve(name_to_session_.size());
    for (const auto& name_session : name_to_session_)
    {
        result.push_back(name_session.second);
    }
    return result;
}

cetl::optional<std::string> PluginRegistry::findConflict(const PluginSession& candidate) const
{
    if (name_to_session_.find(candidate.name()) != name_to_session_.end())
    {
        return "name '" + candidate.name() + "' is already registered.";
    }

    const auto& caps = candidate.capabilities();
    for (const auto& type : caps.interface_types)
    {
        if (is_provider_type_(type))
        {
            return "type '" + type + "' is owned by the state provider.";
        }
        if (const auto owner = findTypeOwner(type))
        {
            return "type '" + type + "' is already owned by '" + owner->name() + "'.";
        }
    }

    for (const auto& prefix : caps.property_prefixes)
    {
        if (prefix.empty() || model::property::isReserved(prefix))
        {
            return "property '" + prefix + "' is reserved.";
        }

        for (const auto& name_session : name_to_session_)
        {
            for (const auto& other : name_session.second->capabilities().property_prefixes)
            {
                if (matchesPropertyPrefix(prefix, other) || matchesPropertyPrefix(other, prefix))
                {
                    return "property '" + prefix + "' overlaps with '" + other + "' of '" + name_session.first + "'.";
                }
            }
        }
    }

    return cetl::nullopt;
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
