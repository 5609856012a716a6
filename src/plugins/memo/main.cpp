//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "memo_handler.hpp"
#include "setup_file_logging.hpp"

#include <netcfgd/platform/defines.hpp>
#include <netcfgd/sdk/plugin.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

}  // namespace

/// The daemon spawns the plugin with its plugin socket connection string as the first argument.
///
int main(const int argc, const char** const argv)
{
    using netcfgd::plugins::memo::MemoHandler;
    using Executor = netcfgd::platform::SingleThreadedExecutor;

    if ((argc < 2) || (0 == std::string{argv[1]}.compare(0, 7, "SPDLOG_")))  // NOLINT
    {
        std::cerr << "Usage: netcfgd-plugin-memo <plugin-connection> [SPDLOG_LEVEL=...]\n";
        return EXIT_FAILURE;
    }
    const std::string connection = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    setupSignalHandlers();
    netcfgd::common::setupFileLogging(argc,
                                      argv,
                                      std::string{"netcfgd-plugin-"} + MemoHandler::Name,
                                      {"io", "ipc", "sdk", "plugin"});

    spdlog::info("NETCFGD memo plugin started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        auto&       memory = *cetl::pmr::new_delete_resource();
        Executor    executor;
        MemoHandler handler;

        const auto plugin =
            netcfgd::sdk::Plugin::make(memory, executor, connection, MemoHandler::capabilities(), handler);
        if (!plugin)
        {
            spdlog::critical("Failed to create plugin.");
            return EXIT_FAILURE;
        }

        netcfgd::platform::waitPollingUntil(executor, [&plugin] {
            //
            return (g_running == 0) || !plugin->isRunning();
        });

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("NETCFGD memo plugin terminated.");

    return result;
}
