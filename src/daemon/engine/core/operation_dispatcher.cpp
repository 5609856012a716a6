//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "operation_dispatcher.hpp"

#include "plugin_registry.hpp"
#include "plugin_session.hpp"
#include "state_provider_adapter.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

OperationDispatcher::OperationDispatcher(libcyphal::IExecutor&     executor,
                                         StateProviderAdapter&     provider,
                                         PluginRegistry&           registry,
                                         const libcyphal::Duration plugin_timeout)
    : provider_{provider}
    , registry_{registry}
    , plugin_timeout_{plugin_timeout}
    , deferred_{executor}
{
}

void OperationDispatcher::dispatch(const model::Operation& operation, DispatchResult::Handler handler)
{
    logger_->debug("Dispatching op (id={}, iface='{}', kind={}, target='{}').",
                   operation.id,
                   operation.interface,
                   model::toString(operation.kind),
                   operation.plugin);

    if (operation.targetsStateProvider())
    {
        auto result = provider_.apply(operation);
        deferred_.post([handler = std::move(handler), result = std::move(result)]() mutable {
            //
            if (auto* const failure = cetl::get_if<StateProviderAdapter::ApplyStateResult::Failure>(&result))
            {
                handler(std::move(*failure));
                return;
            }
            handler(cetl::monostate{});
        });
        return;
    }

    const auto session = registry_.findByName(operation.plugin);
    if (!session)
    {
        logger_->warn("Plugin '{}' is gone (op_id={}).", operation.plugin, operation.id);
        auto error = model::Error::make(model::ErrorKind::PluginLost,
                                        "Plugin '" + operation.plugin + "' is not available.",
                                        {operation.interface});
        deferred_.post([handler = std::move(handler), error = std::move(error)]() mutable {
            //
            handler(std::move(error));
        });
        return;
    }

    model::InterfaceTarget target{operation.interface, operation.type, operation.desired};
    session->apply(operation.kind, target, plugin_timeout_, [handler = std::move(handler)](auto&& result) {
        //
        if (auto* const failure = cetl::get_if<PluginSession::ApplyResult::Failure>(&result))
        {
            handler(std::move(*failure));
            return;
        }
        handler(cetl::monostate{});
    });
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
