//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define NETCFGD_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "engine/config.hpp"
#include "logging.hpp"
#include "setup_file_logging.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <sys/syslog.h>
#include <utility>

namespace netcfgd
{
namespace daemon
{

/// Sets up the daemon loggers.
///
/// The default logger writes both to syslog and to a rotating log file; the subsystem loggers
/// (`engine`, `core`, `plugin` etc.) write to the file only, so syslog gets the important process-wide events.
///
/// Levels come from the `[logging]` configuration table, and then from `SPDLOG_LEVEL=` &
/// `SPDLOG_FLUSH_LEVEL=` command line arguments (f.e. `SPDLOG_LEVEL=debug,ipc=trace`).
///
/// Throws (spdlog exceptions) if a sink can't be created.
///
inline void setupLogging(const bool                 is_daemonized,
                         const int                  argc,
                         const char** const         argv,
                         const engine::Config::Ptr& config)
{
    using spdlog::sinks::syslog_sink_st;
    using spdlog::sinks::rotating_file_sink_st;
    namespace names = common::logger_names;

    constexpr const char* ident             = "netcfgd";
    constexpr std::size_t log_max_files     = 4;
    constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

    std::string log_file_path = std::string{is_daemonized ? "/var/log/" : "./"} + ident + ".log";
    if (auto configured_path = config->getLoggingFile())
    {
        log_file_path = std::move(configured_path.value());
    }

    spdlog::drop_all();

    const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, log_file_max_size, log_max_files);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

    const auto syslog_sink = std::make_shared<syslog_sink_st>(  //
        ident,
        LOG_PID,
        is_daemonized ? LOG_DAEMON : LOG_USER,
        true);
    syslog_sink->set_pattern("[%l] '%n' | %v");

    const auto default_logger = std::make_shared<spdlog::logger>("", spdlog::sinks_init_list{syslog_sink, file_sink});
    spdlog::register_logger(default_logger);
    spdlog::set_default_logger(default_logger);

    for (const auto* const name :
         {names::Io, names::Ipc, names::Engine, names::Core, names::Plugin, names::Kernel, names::Svc})
    {
        spdlog::register_logger(std::make_shared<spdlog::logger>(name, file_sink));
    }

    if (const auto level = config->getLoggingLevel())
    {
        spdlog::cfg::helpers::load_levels(level.value());
    }
    if (const auto flush_level = config->getLoggingFlushLevel())
    {
        common::detail::loadFlushLevels(flush_level.value());
    }
    spdlog::cfg::load_argv_levels(argc, argv);
    common::detail::loadArgvFlushLevels(argc, argv);

    // Separates runs in the log file (written to the file sink directly, so syslog doesn't see it).
    if (default_logger->should_log(spdlog::level::info))
    {
        file_sink->log({"", spdlog::level::info, "--------------------------"});
    }
}

}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_SETUP_LOGGING_HPP_INCLUDED
