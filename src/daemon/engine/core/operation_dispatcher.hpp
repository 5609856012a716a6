//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_OPERATION_DISPATCHER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_OPERATION_DISPATCHER_HPP_INCLUDED

#include "executor_helpers.hpp"
#include "logging.hpp"
#include "plugin_registry.hpp"
#include "state_provider_adapter.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <functional>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Routes a single operation to its target - the state provider or a plugin session.
///
class OperationDispatcher final
{
public:
    struct DispatchResult final
    {
        using Success = cetl::monostate;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    OperationDispatcher(libcyphal::IExecutor&     executor,
                        StateProviderAdapter&     provider,
                        PluginRegistry&           registry,
                        const libcyphal::Duration plugin_timeout);

    OperationDispatcher(const OperationDispatcher&)                = delete;
    OperationDispatcher(OperationDispatcher&&) noexcept            = delete;
    OperationDispatcher& operator=(const OperationDispatcher&)     = delete;
    OperationDispatcher& operator=(OperationDispatcher&&) noexcept = delete;

    ~OperationDispatcher() = default;

    /// The handler is called exactly once, never from within this call.
    ///
    /// Fails with `PluginLost` if the target plugin is not registered (anymore).
    ///
    void dispatch(const model::Operation& operation, DispatchResult::Handler handler);

private:
    StateProviderAdapter&     provider_;
    PluginRegistry&           registry_;
    const libcyphal::Duration plugin_timeout_;
    Deferred                  deferred_;
    common::LoggerPtr         logger_{common::getLogger(common::logger_names::Core)};

};  // OperationDispatcher

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_OPERATION_DISPATCHER_HPP_INCLUDED
