//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "config.hpp"
#include "core/pipeline.hpp"
#include "io/socket_address.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "ipc/pipe/socket_server.hpp"
#include "ipc/server_router.hpp"
#include "kernel/sysfs_state_provider.hpp"
#include "plugin/session_service.hpp"
#include "plugin/supervisor.hpp"
#include "svc/net/services.hpp"
#include "svc/svc_helpers.hpp"

#include "netcfgd/platform/defines.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Bring up the kernel state provider and the request pipeline on top of it.
    //
    provider_ = kernel::SysfsStateProvider::make();

    core::Pipeline::Settings settings;
    settings.provider_timeout        = config_->getProviderTimeout();
    settings.plugin_query_timeout    = config_->getPluginsQueryTimeout();
    settings.plugin_apply_timeout    = config_->getPluginsApplyTimeout();
    settings.checkpoint_retention    = config_->getCheckpointsRetention();
    settings.default_request_timeout = config_->getRequestsDefaultTimeout();
    settings.max_concurrent_requests = config_->getIpcMaxConcurrentRequests();
    settings.max_queued_requests     = config_->getIpcMaxQueuedRequests();
    pipeline_.emplace(executor_, *provider_, settings);

    // 2. Bring up the client IPC router and its services.
    //
    {
        const auto ipc_connections = config_->getIpcConnections();
        logger_->debug("Starting with IPC connection '{}'...", ipc_connections.front());

        ServerPipePtr server_pipe;
        if (auto failure = makeServerPipe(ipc_connections.front(), "IPC", server_pipe))
        {
            return failure;
        }
        ipc_router_ = common::ipc::ServerRouter::make(memory_, std::move(server_pipe));

        const svc::ScvContext svc_context{memory_, executor_, *ipc_router_, *pipeline_};
        svc::net::registerAllServices(svc_context);

        if (0 != ipc_router_->start())
        {
            std::string msg = "Failed to start IPC router.";
            logger_->error(msg);
            return msg;
        }
    }

    // 3. Bring up the plugin IPC router with its session service.
    //
    const auto plugins_connection = config_->getPluginsConnection();
    {
        logger_->debug("Starting with plugin connection '{}'...", plugins_connection);

        ServerPipePtr server_pipe;
        if (auto failure = makeServerPipe(plugins_connection, "plugin", server_pipe))
        {
            return failure;
        }
        plugin_router_ = common::ipc::ServerRouter::make(memory_, std::move(server_pipe));

        const plugin::SessionContext session_context{memory_, executor_, *plugin_router_, pipeline_->registry()};
        plugin::SessionService::registerWithContext(session_context);

        if (0 != plugin_router_->start())
        {
            std::string msg = "Failed to start plugin IPC router.";
            logger_->error(msg);
            return msg;
        }
    }

    // 4. Spawn plugins (if any) - they will connect to the plugin router.
    //
    {
        plugin::Supervisor::Settings supervisor_settings;
        supervisor_settings.directory     = config_->getPluginsDirectory();
        supervisor_settings.connection    = plugins_connection;
        supervisor_settings.restart_delay = config_->getPluginsRestartDelay();
        if (const char* const plugin_dir = std::getenv("NETCFGD_PLUGIN_DIR"))  // NOLINT(concurrency-mt-unsafe)
        {
            supervisor_settings.directory = plugin_dir;
        }

        supervisor_ = std::make_unique<plugin::Supervisor>(executor_, std::move(supervisor_settings));
        if (const int err = supervisor_->start())
        {
            // No plugins is a valid setup - the daemon still serves kernel interfaces.
            logger_->warn("Failed to start plugins (err={}).", err);
        }
    }

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    const auto stats = platform::waitPollingUntil(executor_, [&loop_predicate] {
        //
        return !loop_predicate();
    });
    logger_->debug("Run loop is finished (spins={}, worst_lateness={}us).",
                   stats.spins,
                   std::chrono::duration_cast<std::chrono::microseconds>(stats.worst_lateness).count());

    if (supervisor_)
    {
        supervisor_->stop();
    }
}

cetl::optional<std::string> Engine::makeServerPipe(const std::string& connection,
                                                   const char* const  what,
                                                   ServerPipePtr&     out_server_pipe)
{
    using ParseResult = common::io::SocketAddress::ParseResult;

    auto maybe_socket_address = common::io::SocketAddress::parse(connection);
    if (const auto* const failure = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
    {
        std::string msg = fmt::format("Failed to parse {} connection '{}' (err={}).", what, connection, *failure);
        logger_->error(msg);
        return msg;
    }
    const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);

    out_server_pipe = std::make_unique<common::ipc::pipe::SocketServer>(executor_,
                                                                        socket_address,
                                                                        config_->getIpcMaxRequestSize());
    return cetl::nullopt;
}

}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
