//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_ADAPTER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_ADAPTER_HPP_INCLUDED

#include "logging.hpp"
#include "scope.hpp"
#include "state_provider.hpp"

#include "netcfgd/model/operation.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <string>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Synchronous wrapper around the kernel state provider.
///
/// Has no state of its own: it maps scopes to provider calls, turns per-operation patches
/// into the complete configuration the provider expects, and enforces the call deadline.
///
class StateProviderAdapter final
{
public:
    using GetStateResult   = StateProvider::GetStateResult;
    using ApplyStateResult = StateProvider::ApplyStateResult;

    StateProviderAdapter(libcyphal::IExecutor& executor, StateProvider& provider, const libcyphal::Duration timeout);

    StateProviderAdapter(const StateProviderAdapter&)                = delete;
    StateProviderAdapter(StateProviderAdapter&&) noexcept            = delete;
    StateProviderAdapter& operator=(const StateProviderAdapter&)     = delete;
    StateProviderAdapter& operator=(StateProviderAdapter&&) noexcept = delete;

    ~StateProviderAdapter() = default;

    CETL_NODISCARD GetStateResult::Var getState(const Scope& scope);

    /// Applies a single planned operation which targets the state provider.
    ///
    /// `Modify` overlays the operation properties (`monostate` removes a property) on top of
    /// freshly fetched current state; `Create` starts from an empty state; `Delete` requests `absent` state.
    ///
    CETL_NODISCARD ApplyStateResult::Var apply(const model::Operation& operation);

    CETL_NODISCARD bool supportsType(const std::string& type) const;

private:
    template <typename Result, typename Action>
    CETL_NODISCARD typename Result::Var callWithDeadline(const char* const what, Action&& action);

    libcyphal::IExecutor&     executor_;
    StateProvider&            provider_;
    const libcyphal::Duration timeout_;
    common::LoggerPtr         logger_{common::getLogger(common::logger_names::Core)};

};  // StateProviderAdapter

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_ADAPTER_HPP_INCLUDED
