//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_HPP_INCLUDED

#include "config.hpp"
#include "core/pipeline.hpp"
#include "core/state_provider.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "ipc/server_router.hpp"
#include "logging.hpp"
#include "plugin/supervisor.hpp"

#include "netcfgd/platform/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <string>

namespace netcfgd
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    CETL_NODISCARD cetl::optional<std::string> init();
    void                                       runWhile(const std::function<bool()>& loop_predicate);

private:
    using ServerPipePtr = common::ipc::pipe::ServerPipe::Ptr;

    CETL_NODISCARD cetl::optional<std::string> makeServerPipe(const std::string& connection,
                                                              const char* const  what,
                                                              ServerPipePtr&     out_server_pipe);

    Config::Ptr                      config_;
    common::LoggerPtr                logger_{common::getLogger(common::logger_names::Engine)};
    platform::SingleThreadedExecutor executor_;
    cetl::pmr::memory_resource&      memory_{*cetl::pmr::get_default_resource()};
    core::StateProvider::Ptr         provider_;
    cetl::optional<core::Pipeline>   pipeline_;
    common::ipc::ServerRouter::Ptr   ipc_router_;
    common::ipc::ServerRouter::Ptr   plugin_router_;
    std::unique_ptr<plugin::Supervisor> supervisor_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_HPP_INCLUDED
