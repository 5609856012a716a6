//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_SETUP_FILE_LOGGING_HPP_INCLUDED
#define NETCFGD_COMMON_SETUP_FILE_LOGGING_HPP_INCLUDED

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace netcfgd
{
namespace common
{
namespace detail
{

inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    auto key_vals = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (auto& name_level : key_vals)
    {
        auto&      level_name = spdlog::cfg::helpers::to_lower_(name_level.second);  // NOLINT
        const auto level      = spdlog::level::from_str(level_name);
        // Ignore unrecognized level names.
        if (level == spdlog::level::off && level_name != "off")
        {
            continue;
        }

        if (name_level.first.empty())
        {
            spdlog::default_logger()->flush_on(level);
        }
        else if (const auto logger = spdlog::get(name_level.first))
        {
            logger->flush_on(level);
        }
    }

    // Default flush level goes to the rest of loggers.
    //
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&key_vals, default_flush_level](const auto& logger) {
        //
        if (!logger->name().empty() && (key_vals.find(logger->name()) == key_vals.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    static const std::string spdlog_level_prefix = "SPDLOG_FLUSH_LEVEL=";

    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, spdlog_level_prefix.size(), spdlog_level_prefix))
        {
            loadFlushLevels(arg_str.substr(spdlog_level_prefix.size()));
        }
    }
}

}  // namespace detail

/// Sets up logging of a short-lived tool process (the CLI, a plugin).
///
/// A rotating `./<log_prefix>.log` file sink is used for all loggers (with Info default level).
/// Levels could be adjusted by `SPDLOG_LEVEL=` & `SPDLOG_FLUSH_LEVEL=` arguments (like `SPDLOG_LEVEL=debug,ipc=trace`).
///
inline void setupFileLogging(const int                                argc,
                             const char** const                       argv,
                             const std::string&                       log_prefix,
                             const std::initializer_list<const char*> subsystems)
{
    using spdlog::sinks::rotating_file_sink_st;

    try
    {
        constexpr std::size_t log_max_files     = 4;
        constexpr std::size_t log_file_max_size = 4UL * 1048576UL;  // 4 MB

        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(  //
            "./" + log_prefix + ".log",
            log_file_max_size,
            log_max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        for (const auto* const subsystem : subsystems)
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(subsystem, file_sink));
        }

        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevels(argc, argv);

        // Separates runs of different processes in the log file.
        spdlog::info("--------------------------");

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_SETUP_FILE_LOGGING_HPP_INCLUDED
