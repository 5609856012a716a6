//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED

#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "ipc/ipc_types.hpp"
#include "netcfgd/platform/posix_executor_extension.hpp"
#include "server_pipe.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <cstddef>
#include <unordered_map>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Listening stream socket - every accepted connection becomes a client of the pipe.
///
/// The socket file (if any) is unlinked on destruction.
///
class SocketServer final : public SocketBase, public ServerPipe
{
public:
    SocketServer(libcyphal::IExecutor&    executor,
                 const io::SocketAddress& address,
                 const std::size_t        max_payload_size = DefaultMaxPayloadSize);

    SocketServer(const SocketServer&)                = delete;
    SocketServer(SocketServer&&) noexcept            = delete;
    SocketServer& operator=(const SocketServer&)     = delete;
    SocketServer& operator=(SocketServer&&) noexcept = delete;

    ~SocketServer() override;

    // ServerPipe

    CETL_NODISCARD int start(EventHandler event_handler) override;
    CETL_NODISCARD int send(const ClientId client_id, const Payloads payloads) override;

private:
    CETL_NODISCARD int listen();
    void               acceptClient();
    void               receiveFrom(const ClientId client_id);
    void               closeClient(const ClientId client_id);

    io::SocketAddress                                   address_;
    platform::IPosixExecutorExtension* const            posix_executor_ext_;
    io::OwnFd                                           listen_fd_;
    platform::IPosixExecutorExtension::Awaitable        accept_awaitable_;
    ClientId                                            last_client_id_{0};
    std::unordered_map<ClientId, FramedConnection::Ptr> clients_;
    EventHandler                                        event_handler_;

};  // SocketServer

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED
