//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED

#include "client_pipe.hpp"
#include "io/socket_address.hpp"
#include "ipc/ipc_types.hpp"
#include "netcfgd/platform/posix_executor_extension.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <cstddef>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Stream socket connection to the daemon.
///
/// The connection is made once; a failed attempt is reported as `Disconnected` (instead of `Connected`),
/// and it is up to the user to retry with a new client.
///
class SocketClient final : public SocketBase, public ClientPipe
{
public:
    SocketClient(libcyphal::IExecutor&    executor,
                 const io::SocketAddress& address,
                 const std::size_t        max_payload_size = DefaultMaxPayloadSize);

    SocketClient(const SocketClient&)                = delete;
    SocketClient(SocketClient&&) noexcept            = delete;
    SocketClient& operator=(const SocketClient&)     = delete;
    SocketClient& operator=(SocketClient&&) noexcept = delete;

    ~SocketClient() override = default;

    // ClientPipe

    CETL_NODISCARD int start(EventHandler event_handler) override;
    CETL_NODISCARD int send(const Payloads payloads) override;

private:
    CETL_NODISCARD int connect();
    void               onConnectCompleted();
    void               onReadable();
    void               disconnect();

    io::SocketAddress                        address_;
    platform::IPosixExecutorExtension* const posix_executor_ext_;
    FramedConnection                         conn_;
    EventHandler                             event_handler_;

};  // SocketClient

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
