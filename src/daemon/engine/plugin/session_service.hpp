//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_PLUGIN_SESSION_SERVICE_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_PLUGIN_SESSION_SERVICE_HPP_INCLUDED

#include "core/plugin_registry.hpp"
#include "ipc/server_router.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace plugin
{

struct SessionContext
{
    cetl::pmr::memory_resource& memory;
    libcyphal::IExecutor&       executor;
    common::ipc::ServerRouter&  ipc_router;
    core::PluginRegistry&       registry;

};  // SessionContext

/// Defines registration factory of the plugin session service.
///
/// Every plugin process opens a single long living session channel; the session is registered
/// in the plugin registry for as long as the channel lives.
///
class SessionService
{
public:
    SessionService() = delete;
    static void registerWithContext(const SessionContext& context);

};  // SessionService

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_PLUGIN_SESSION_SERVICE_HPP_INCLUDED
