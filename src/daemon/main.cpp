//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "daemonizer.hpp"
#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "io/io.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <signal.h>  // NOLINT
#include <string>
#include <unistd.h>

namespace
{

using netcfgd::daemon::Daemonizer;
using netcfgd::daemon::engine::Config;

constexpr const char* PidFilePath = "/var/run/netcfgd.pid";

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

extern "C" void onTerminationSignal(const int)
{
    g_running = 0;
}

void setupSignalHandlers()
{
    struct sigaction on_term
    {};
    on_term.sa_handler = &onTerminationSignal;
    ::sigaction(SIGINT, &on_term, nullptr);
    ::sigaction(SIGTERM, &on_term, nullptr);
}

struct Options
{
    bool        daemonize{true};
    std::string config_file_path;
};

/// Recognizes `--dev` (stay in foreground) and `CONFIG_FILE=<path>`.
///
/// Other arguments (like `SPDLOG_LEVEL=...`) are left for the logging setup.
///
Options parseOptions(const int argc, const char** const argv)
{
    static const std::string config_file_prefix = "CONFIG_FILE=";

    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--dev")
        {
            options.daemonize = false;
        }
        else if (0 == arg.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            options.config_file_path = arg.substr(config_file_prefix.size());
        }
    }
    if (options.config_file_path.empty())
    {
        options.config_file_path = options.daemonize ? "/etc/netcfgd/netcfgd.toml" : "./netcfgd.toml";
    }
    return options;
}

[[noreturn]] void exitWithStartupFailure(const Daemonizer& daemonizer, const std::string& msg)
{
    (void) netcfgd::common::io::writeString(daemonizer.statusFd(), msg + "\n");
    ::exit(EXIT_FAILURE);
}

Config::Ptr loadConfig(const Daemonizer& daemonizer, const Options& options)
{
    try
    {
        return Config::make(options.config_file_path);

    } catch (const std::exception& ex)
    {
        exitWithStartupFailure(daemonizer,
                               "Failed to load configuration (path='" + options.config_file_path + "'): " + ex.what());
    }
}

}  // namespace

int main(const int argc, const char** const argv)
{
    const auto options = parseOptions(argc, argv);

    // In dev mode startup failures go to the standard error output,
    // otherwise they are passed (by the daemonizer) to the process which has started the daemon.
    Daemonizer daemonizer{PidFilePath};
    if (options.daemonize)
    {
        daemonizer.detach();
    }
    setupSignalHandlers();

    const auto config = loadConfig(daemonizer, options);
    try
    {
        netcfgd::daemon::setupLogging(options.daemonize, argc, argv, config);

    } catch (const std::exception& ex)
    {
        exitWithStartupFailure(daemonizer, std::string{"Failed to setup logging: "} + ex.what());
    }

    spdlog::info("NETCFGD started (ver='{}.{}', pid={}, config='{}').",
                 VERSION_MAJOR,
                 VERSION_MINOR,
                 ::getpid(),
                 options.config_file_path);

    int result = EXIT_SUCCESS;
    try
    {
        netcfgd::daemon::engine::Engine engine{config};
        if (const auto failure = engine.init())
        {
            spdlog::critical("Failed to init engine: {}", failure.value());
            exitWithStartupFailure(daemonizer, "Failed to init engine: " + failure.value());
        }
        daemonizer.reportReady();

        engine.runWhile([] { return g_running == 1; });
        spdlog::debug("Termination is requested.");

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }

    spdlog::info("NETCFGD terminated.");
    return result;
}
