//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "state_provider_adapter.hpp"

#include "scope.hpp"
#include "state_provider.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"
#include "netcfgd/model/property.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

StateProviderAdapter::StateProviderAdapter(libcyphal::IExecutor&     executor,
                                           StateProvider&            provider,
                                           const libcyphal::Duration timeout)
    : executor_{executor}
    , provider_{provider}
    , timeout_{timeout}
{
}

StateProviderAdapter::GetStateResult::Var StateProviderAdapter::getState(const Scope& scope)
{
    // A multi-interface scope is served by a single "all" call, and then filtered.
    const auto single = scope.single();
    auto       result = callWithDeadline<GetStateResult>("get_state", [this, &single] {
        //
        return provider_.getState(single);
    });

    if (auto* const states = cetl::get_if<GetStateResult::Success>(&result))
    {
        states->erase(std::remove_if(states->begin(),
                                     states->end(),
                                     [&scope](const auto& state) { return !scope.contains(state.name); }),
                      states->end());

        logger_->trace("Provider reported {} interface(s).", states->size());
    }
    return result;
}

StateProviderAdapter::ApplyStateResult::Var StateProviderAdapter::apply(const model::Operation& operation)
{
    CETL_DEBUG_ASSERT(operation.targetsStateProvider(), "");

    model::InterfaceState desired;
    desired.name = operation.interface;
    desired.type = operation.type;

    switch (operation.kind)
    {
    case model::OperationKind::Create:
        break;

    case model::OperationKind::Modify: {
        auto current = getState(Scope::one(operation.interface));
        if (auto* const failure = cetl::get_if<GetStateResult::Failure>(&current))
        {
            return std::move(*failure);
        }
        const auto& states = cetl::get<GetStateResult::Success>(current);
        if (states.empty())
        {
            return model::Error::make(model::ErrorKind::OperationFailed,
                                      "Interface '" + operation.interface + "' doesn't exist.",
                                      {operation.interface});
        }
        desired = states.front();
        break;
    }

    case model::OperationKind::Delete:
        desired.properties[model::property::State] = std::string{model::property::StateAbsent};
        break;
    }

    if (operation.kind != model::OperationKind::Delete)
    {
        for (const auto& key_value : operation.desired)
        {
            if (cetl::holds_alternative<cetl::monostate>(key_value.second))
            {
                desired.properties.erase(key_value.first);
            }
            else
            {
                desired.properties[key_value.first] = key_value.second;
            }
        }
    }

    logger_->debug("Applying {} of '{}' (type='{}', props={}).",
                   model::toString(operation.kind),
                   desired.name,
                   desired.type,
                   desired.properties.size());

    return callWithDeadline<ApplyStateResult>("apply_state", [this, &desired] {
        //
        return provider_.applyState(desired);
    });
}

bool StateProviderAdapter::supportsType(const std::string& type) const
{
    return provider_.supportsType(type);
}

template <typename Result, typename Action>
typename Result::Var StateProviderAdapter::callWithDeadline(const char* const what, Action&& action)
{
    const auto started_at = executor_.now();
    try
    {
        auto result = std::forward<Action>(action)();

        // The provider is synchronous, so the deadline can only be checked after the fact.
        const auto elapsed = executor_.now() - started_at;
        if (elapsed > timeout_)
        {
            logger_->warn("Provider '{}' call exceeded its deadline ({}ms > {}ms).",
                          what,
                          std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(),
                          std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count());
            return model::Error::make(model::ErrorKind::BackendUnavailable,
                                      std::string{"State provider '"} + what + "' call has timed out.");
        }

        if (const auto* const failure = cetl::get_if<typename Result::Failure>(&result))
        {
            logger_->info("Provider '{}' call failed (kind={}, msg='{}').",
                          what,
                          model::toString(failure->kind),
                          failure->message);
        }
        return result;

    } catch (const std::exception& ex)
    {
        logger_->error("Provider '{}' call has thrown: {}", what, ex.what());
        return model::Error::make(model::ErrorKind::BackendUnavailable,
                                  std::string{"State provider '"} + what + "' call failed: " + ex.what());
    }
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
