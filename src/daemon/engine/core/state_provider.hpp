//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_HPP_INCLUDED

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Abstract kernel-state backend.
///
/// Calls are synchronous. Implementations report `BackendUnavailable` when the backend can't be reached,
/// and `OperationFailed` when a write has been rejected.
///
class StateProvider
{
public:
    using Ptr = std::unique_ptr<StateProvider>;

    struct GetStateResult final
    {
        using Success = std::vector<model::InterfaceState>;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct ApplyStateResult final
    {
        using Success = cetl::monostate;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
    };

    StateProvider(const StateProvider&)                = delete;
    StateProvider(StateProvider&&) noexcept            = delete;
    StateProvider& operator=(const StateProvider&)     = delete;
    StateProvider& operator=(StateProvider&&) noexcept = delete;

    virtual ~StateProvider() = default;

    /// Gets state of the given interface, or of all interfaces if `name` is empty.
    ///
    /// A missing interface is not an error - the result is just empty.
    ///
    CETL_NODISCARD virtual GetStateResult::Var getState(const cetl::optional<std::string>& name) = 0;

    /// Applies complete desired configuration of a single interface.
    ///
    /// Creates the interface if it doesn't exist yet, and deletes it if its `state` is `absent`.
    ///
    CETL_NODISCARD virtual ApplyStateResult::Var applyState(const model::InterfaceState& desired) = 0;

    CETL_NODISCARD virtual bool supportsType(const std::string& type) const = 0;

protected:
    StateProvider() = default;

};  // StateProvider

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_HPP_INCLUDED
