//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <netcfgd/sdk/daemon.hpp>

#include "io/socket_address.hpp"
#include "ipc/client_router.hpp"
#include "ipc/pipe/socket_client.hpp"
#include "logging.hpp"
#include "sdk_factory.hpp"

#include "netcfgd/sdk/network_state.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace netcfgd
{
namespace sdk
{
namespace
{

class DaemonImpl final : public Daemon
{
public:
    explicit DaemonImpl(NetworkState::Ptr network_state)
        : network_state_{std::move(network_state)}
    {
    }

    // Daemon

    NetworkState::Ptr getNetworkState() const override
    {
        return network_state_;
    }

private:
    // Owns the IPC router (and so the connection).
    const NetworkState::Ptr network_state_;

};  // DaemonImpl

}  // namespace

cetl::optional<common::io::SocketAddress> Factory::parseConnection(const std::string& connection,
                                                                   common::Logger&    logger)
{
    using ParseResult = common::io::SocketAddress::ParseResult;

    auto maybe_socket_address = common::io::SocketAddress::parse(connection);
    if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
    {
        logger.error("Malformed connection string '{}' (err={}): {}.", connection, *err, std::strerror(*err));
        return cetl::nullopt;
    }
    return cetl::get<ParseResult::Success>(maybe_socket_address);
}

CETL_NODISCARD Daemon::Ptr Daemon::make(cetl::pmr::memory_resource& memory,
                                        libcyphal::IExecutor&       executor,
                                        const std::string&          connection)
{
    const auto logger = common::getLogger(common::logger_names::Sdk);
    logger->info("Connecting to the daemon at '{}'...", connection);

    const auto socket_address = Factory::parseConnection(connection, *logger);
    if (!socket_address)
    {
        return nullptr;
    }

    auto ipc_router = common::ipc::ClientRouter::make(  //
        memory,
        std::make_unique<common::ipc::pipe::SocketClient>(executor, *socket_address));

    auto network_state = Factory::makeNetworkState(memory, ipc_router);
    if (const int err = ipc_router->start())
    {
        logger->error("Failed to start IPC router (err={}): {}.", err, std::strerror(err));
        return nullptr;
    }

    return std::make_shared<DaemonImpl>(std::move(network_state));
}

}  // namespace sdk
}  // namespace netcfgd
