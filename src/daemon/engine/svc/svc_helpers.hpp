//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED

#include "core/pipeline.hpp"
#include "ipc/server_router.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace svc
{

struct ScvContext
{
    cetl::pmr::memory_resource& memory;
    libcyphal::IExecutor&       executor;
    common::ipc::ServerRouter&  ipc_router;
    core::Pipeline&             pipeline;

};  // ScvContext

}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_SVC_HELPERS_HPP_INCLUDED
