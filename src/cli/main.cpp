//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "desired_state_reader.hpp"
#include "printer.hpp"
#include "setup_file_logging.hpp"

#include <netcfgd/model/execution_result.hpp>
#include <netcfgd/platform/defines.hpp>
#include <netcfgd/sdk/daemon.hpp>
#include <netcfgd/sdk/execution.hpp>
#include <netcfgd/sdk/network_state.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>
#include <utility>
#include <vector>

namespace
{

using netcfgd::sdk::NetworkState;
using Executor = netcfgd::platform::SingleThreadedExecutor;

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

void printUsage()
{
    std::cerr << "Usage:\n"
                 "  netcfgctl query [<iface>]\n"
                 "  netcfgctl apply <file.toml> [--no-commit] [--timeout=<ms>]\n"
                 "  netcfgctl commit <checkpoint-id>\n"
                 "  netcfgctl rollback <checkpoint-id> [--timeout=<ms>]\n"
                 "\n"
                 "Environment: NETCFGD_CONNECTION (default 'unix:/run/netcfgd/netcfgd.sock').\n"
                 "Logging arguments (f.e. SPDLOG_LEVEL=debug) go to './netcfgctl.log'.\n";
}

struct Arguments final
{
    std::string              command;
    std::vector<std::string> positional;
    bool                     no_commit{false};
    std::chrono::milliseconds timeout{0};
};

/// Parses command line, ignoring `SPDLOG_*=` logging arguments.
///
cetl::optional<Arguments> parseArguments(const int argc, const char** const argv)
{
    static const std::string timeout_prefix = "--timeout=";

    Arguments args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg.compare(0, 7, "SPDLOG_"))
        {
            continue;
        }
        if (arg == "--no-commit")
        {
            args.no_commit = true;
        }
        else if (0 == arg.compare(0, timeout_prefix.size(), timeout_prefix))
        {
            const auto value = arg.substr(timeout_prefix.size());
            char*      end   = nullptr;
            const auto ms    = std::strtoll(value.c_str(), &end, 10);
            if (value.empty() || (*end != '\0') || (ms <= 0))
            {
                std::cerr << "Invalid timeout: '" << value << "'.\n";
                return cetl::nullopt;
            }
            args.timeout = std::chrono::milliseconds{ms};
        }
        else if (0 == arg.compare(0, 2, "--"))
        {
            std::cerr << "Unknown option: '" << arg << "'.\n";
            return cetl::nullopt;
        }
        else if (args.command.empty())
        {
            args.command = arg;
        }
        else
        {
            args.positional.push_back(arg);
        }
    }
    return args;
}

cetl::optional<netcfgd::model::CheckpointId> parseCheckpointId(const std::vector<std::string>& positional)
{
    if (positional.size() != 1)
    {
        std::cerr << "Exactly one checkpoint id is expected.\n";
        return cetl::nullopt;
    }
    char*      end = nullptr;
    const auto id  = std::strtoull(positional.front().c_str(), &end, 10);
    if (positional.front().empty() || (*end != '\0') || (id == 0))
    {
        std::cerr << "Invalid checkpoint id: '" << positional.front() << "'.\n";
        return cetl::nullopt;
    }
    return static_cast<netcfgd::model::CheckpointId>(id);
}

/// Waits for the result.
///
/// The daemon enforces request timeouts itself, so normally the result (or a transport failure)
/// comes first; the local wait only ends early on a termination signal.
///
template <typename Result, typename Sender>
cetl::optional<Result> waitFor(Executor& executor, Sender&& sender)
{
    auto result = netcfgd::sdk::sync_wait_while<Result>(executor, sender, [] { return g_running != 0; });
    if (!result)
    {
        spdlog::warn("Interrupted while waiting for the daemon.");
    }
    return result;
}

int runQuery(Executor& executor, NetworkState& network_state, const Arguments& args)
{
    if (args.positional.size() > 1)
    {
        printUsage();
        return EXIT_FAILURE;
    }
    const auto iface = args.positional.empty() ? std::string{} : args.positional.front();

    auto result = waitFor<NetworkState::Query::Result>(executor, network_state.query(iface, args.timeout));
    if (!result)
    {
        return EXIT_FAILURE;
    }
    if (const auto* const err = cetl::get_if<NetworkState::Query::Failure>(&*result))
    {
        netcfgd::cli::printError(std::cerr, *err);
        return EXIT_FAILURE;
    }
    const auto& snapshot = cetl::get<NetworkState::Query::Success>(*result);
    spdlog::info("Query of '{}' returned {} interface(s) (partial={}).",
                 iface,
                 snapshot.interfaces.size(),
                 snapshot.partial);
    netcfgd::cli::printSnapshot(std::cout, snapshot);
    return EXIT_SUCCESS;
}

int runApply(Executor& executor, NetworkState& network_state, const Arguments& args)
{
    using netcfgd::cli::DesiredStateReader;

    if (args.positional.size() != 1)
    {
        printUsage();
        return EXIT_FAILURE;
    }

    auto desired = DesiredStateReader::readFile(args.positional.front());
    if (const auto* const err = cetl::get_if<DesiredStateReader::Result::Failure>(&desired))
    {
        std::cerr << "Failed to read desired state from '" << args.positional.front() << "': " << *err << '\n';
        return EXIT_FAILURE;
    }

    auto sender = network_state.apply(cetl::get<DesiredStateReader::Result::Success>(desired),
                                      !args.no_commit,
                                      args.timeout);
    auto result = waitFor<NetworkState::Apply::Result>(executor, std::move(sender));
    if (!result)
    {
        return EXIT_FAILURE;
    }
    if (const auto* const err = cetl::get_if<NetworkState::Apply::Failure>(&*result))
    {
        netcfgd::cli::printError(std::cerr, *err);
        return EXIT_FAILURE;
    }
    const auto& success = cetl::get<NetworkState::Apply::Success>(*result);
    spdlog::info("Apply has finished (ops={}, state={}, checkpoint={}).",
                 success.operations.size(),
                 netcfgd::model::toString(success.result.state),
                 success.result.checkpoint_id);

    netcfgd::cli::printOperations(std::cout, success.operations);
    netcfgd::cli::printResult(std::cout, success.result);
    return netcfgd::cli::isSuccess(success.result) ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runCommit(Executor& executor, NetworkState& network_state, const Arguments& args)
{
    const auto checkpoint_id = parseCheckpointId(args.positional);
    if (!checkpoint_id)
    {
        return EXIT_FAILURE;
    }

    auto result = waitFor<NetworkState::Commit::Result>(executor, network_state.commit(*checkpoint_id));
    if (!result)
    {
        return EXIT_FAILURE;
    }
    if (const auto* const err = cetl::get_if<NetworkState::Commit::Failure>(&*result))
    {
        netcfgd::cli::printError(std::cerr, *err);
        return EXIT_FAILURE;
    }
    std::cout << "checkpoint " << *checkpoint_id << " committed\n";
    return EXIT_SUCCESS;
}

int runRollback(Executor& executor, NetworkState& network_state, const Arguments& args)
{
    const auto checkpoint_id = parseCheckpointId(args.positional);
    if (!checkpoint_id)
    {
        return EXIT_FAILURE;
    }

    auto result = waitFor<NetworkState::Rollback::Result>(executor,
                                                          network_state.rollback(*checkpoint_id, args.timeout));
    if (!result)
    {
        return EXIT_FAILURE;
    }
    if (const auto* const err = cetl::get_if<NetworkState::Rollback::Failure>(&*result))
    {
        netcfgd::cli::printError(std::cerr, *err);
        return EXIT_FAILURE;
    }
    const auto& rollback_result = cetl::get<NetworkState::Rollback::Success>(*result);
    netcfgd::cli::printResult(std::cout, rollback_result);
    return netcfgd::cli::isSuccess(rollback_result) ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    setupSignalHandlers();
    netcfgd::common::setupFileLogging(argc, argv, "netcfgctl", {"io", "ipc", "sdk", "svc"});

    const auto args = parseArguments(argc, argv);
    if (!args || args->command.empty())
    {
        printUsage();
        return EXIT_FAILURE;
    }

    spdlog::info("NETCFGCTL started (ver='{}.{}', cmd='{}').", VERSION_MAJOR, VERSION_MINOR, args->command);
    int result = EXIT_FAILURE;
    try
    {
        auto&    memory = *cetl::pmr::new_delete_resource();
        Executor executor;

        std::string ipc_connection = "unix:/run/netcfgd/netcfgd.sock";
        if (const auto* const env_connection_str = std::getenv("NETCFGD_CONNECTION"))
        {
            ipc_connection = env_connection_str;
        }

        const auto daemon = netcfgd::sdk::Daemon::make(memory, executor, ipc_connection);
        if (!daemon)
        {
            spdlog::critical("Failed to create daemon.");
            std::cerr << "Failed to connect to the daemon ('" << ipc_connection << "').\n";
            return EXIT_FAILURE;
        }
        auto& network_state = *daemon->getNetworkState();

        if (args->command == "query")
        {
            result = runQuery(executor, network_state, *args);
        }
        else if (args->command == "apply")
        {
            result = runApply(executor, network_state, *args);
        }
        else if (args->command == "commit")
        {
            result = runCommit(executor, network_state, *args);
        }
        else if (args->command == "rollback")
        {
            result = runRollback(executor, network_state, *args);
        }
        else
        {
            std::cerr << "Unknown command: '" << args->command << "'.\n";
            printUsage();
        }

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        std::cerr << "Unhandled exception: " << ex.what() << '\n';
        result = EXIT_FAILURE;
    }
    spdlog::info("NETCFGCTL terminated (result={}).", result);

    return result;
}
