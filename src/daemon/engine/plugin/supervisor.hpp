//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_PLUGIN_SUPERVISOR_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_PLUGIN_SUPERVISOR_HPP_INCLUDED

#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace plugin
{

/// Spawns plugin processes, and restarts them when they exit.
///
/// Each plugin executable gets the plugin connection string as its single argument.
/// A restarted plugin registers as a new session - nothing is carried over from the previous one.
///
class Supervisor final
{
public:
    static constexpr const char* ExecutablePrefix = "netcfgd-plugin-";

    struct Settings final
    {
        std::string         directory;
        std::string         connection;
        libcyphal::Duration restart_delay{std::chrono::seconds{1}};
        libcyphal::Duration poll_period{std::chrono::milliseconds{200}};
    };

    Supervisor(libcyphal::IExecutor& executor, Settings settings);

    Supervisor(const Supervisor&)                = delete;
    Supervisor(Supervisor&&) noexcept            = delete;
    Supervisor& operator=(const Supervisor&)     = delete;
    Supervisor& operator=(Supervisor&&) noexcept = delete;

    ~Supervisor();

    /// Scans the plugin directory and spawns every plugin found there.
    ///
    /// A missing directory is not an error - the daemon just runs without plugins.
    ///
    CETL_NODISCARD int start();

    /// Terminates (SIGTERM) all running plugins; nothing is restarted afterward.
    ///
    void stop();

    /// Sorted full paths of plugin executables in the given directory.
    ///
    static std::vector<std::string> findPlugins(const std::string& directory);

private:
    struct Child final
    {
        std::string          path;
        pid_t                pid{-1};
        libcyphal::TimePoint restart_at{};
    };

    void spawn(Child& child);
    void poll(const libcyphal::TimePoint now);

    libcyphal::IExecutor&               executor_;
    const Settings                      settings_;
    std::vector<Child>                  children_;
    bool                                is_stopping_{false};
    libcyphal::IExecutor::Callback::Any poll_callback_;
    common::LoggerPtr                   logger_{common::getLogger(common::logger_names::Plugin)};

};  // Supervisor

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_PLUGIN_SUPERVISOR_HPP_INCLUDED
