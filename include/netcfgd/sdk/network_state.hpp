//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_NETWORK_STATE_HPP_INCLUDED
#define NETCFGD_SDK_NETWORK_STATE_HPP_INCLUDED

#include "execution.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace netcfgd
{
namespace sdk
{

/// Defines client side interface of the netcfgd network state component.
///
/// Failures of the connection to the daemon itself are reported as `BackendUnavailable` errors.
///
class NetworkState
{
public:
    /// Defines the shared pointer type for the interface.
    ///
    using Ptr = std::shared_ptr<NetworkState>;

    NetworkState(NetworkState&&)                 = delete;
    NetworkState(const NetworkState&)            = delete;
    NetworkState& operator=(NetworkState&&)      = delete;
    NetworkState& operator=(const NetworkState&) = delete;

    virtual ~NetworkState() = default;

    /// Defines the result type of the state query.
    ///
    /// A snapshot is `partial` (with `warnings`) if some plugin hasn't answered in time.
    ///
    struct Query final
    {
        using Success = model::UnifiedSnapshot;
        using Failure = model::Error;
        using Result  = cetl::variant<Success, Failure>;

    };  // Query

    /// Queries current state of a single interface, or of all interfaces (if `iface` is empty).
    ///
    /// @param iface Name of the interface of interest; empty means all interfaces.
    /// @param timeout Request timeout; zero means the daemon default.
    /// @return An execution sender which emits the async result of the query.
    ///
    virtual SenderOf<Query::Result>::Ptr query(const std::string&              iface,
                                               const std::chrono::microseconds timeout = {}) = 0;

    /// Defines the result type of the desired state application.
    ///
    /// Even a "successful" result might carry an error - see `ExecutionResult::state`.
    /// `Failure` is reported only if the request has not been served at all.
    ///
    struct Apply final
    {
        struct Success final
        {
            /// Planned operations, in their execution order.
            std::vector<model::Operation> operations;
            model::ExecutionResult        result;
        };
        using Failure = model::Error;
        using Result  = cetl::variant<Success, Failure>;

    };  // Apply

    /// Applies desired state of interfaces.
    ///
    /// @param desired The desired state; only listed interfaces and properties are changed.
    /// @param auto_commit If `true` the change is committed as soon as all operations have succeeded;
    ///                    otherwise it stays pending until explicit `commit` or `rollback`.
    /// @param timeout Request timeout; zero means the daemon default.
    /// @return An execution sender which emits the async result of the application.
    ///
    virtual SenderOf<Apply::Result>::Ptr apply(const model::DesiredState&      desired,
                                               const bool                      auto_commit,
                                               const std::chrono::microseconds timeout = {}) = 0;

    /// Defines the result type of the checkpoint commit.
    ///
    struct Commit final
    {
        using Success = cetl::monostate;
        using Failure = model::Error;
        using Result  = cetl::variant<Success, Failure>;

    };  // Commit

    /// Commits a pending checkpoint.
    ///
    virtual SenderOf<Commit::Result>::Ptr commit(const model::CheckpointId checkpoint_id) = 0;

    /// Defines the result type of the checkpoint rollback.
    ///
    struct Rollback final
    {
        using Success = model::ExecutionResult;
        using Failure = model::Error;
        using Result  = cetl::variant<Success, Failure>;

    };  // Rollback

    /// Restores pre-change state of a pending checkpoint.
    ///
    virtual SenderOf<Rollback::Result>::Ptr rollback(const model::CheckpointId       checkpoint_id,
                                                     const std::chrono::microseconds timeout = {}) = 0;

protected:
    NetworkState() = default;

};  // NetworkState

}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_NETWORK_STATE_HPP_INCLUDED
