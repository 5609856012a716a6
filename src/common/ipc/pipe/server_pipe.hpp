//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED

#include "ipc/ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <functional>
#include <memory>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Daemon side of message pipes - serves connections of many client processes.
///
/// Every accepted connection gets its own `ClientId`, which is never reused during the pipe lifetime.
/// Per client, events come in the `Connected`, `Message`s, `Disconnected` order.
///
class ServerPipe
{
public:
    using Ptr      = std::unique_ptr<ServerPipe>;
    using ClientId = std::size_t;

    struct Event final
    {
        struct Connected final
        {
            ClientId client_id;
        };

        /// A complete message of the client; the payload is valid during the handler call only.
        struct Message final
        {
            ClientId client_id;
            Payload  payload;
        };

        struct Disconnected final
        {
            ClientId client_id;
        };

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    /// A non-zero result of the handler is only logged by the pipe.
    using EventHandler = std::function<int(const Event::Var&)>;

    ServerPipe(const ServerPipe&)                = delete;
    ServerPipe(ServerPipe&&) noexcept            = delete;
    ServerPipe& operator=(const ServerPipe&)     = delete;
    ServerPipe& operator=(ServerPipe&&) noexcept = delete;

    virtual ~ServerPipe() = default;

    /// Starts accepting client connections. Could be called only once.
    ///
    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends a single message (composed of the payload fragments) to the client.
    ///
    /// @return `ErrorCode::NotConnected` if the client has gone, otherwise `errno` of the failure (if any).
    ///
    CETL_NODISCARD virtual int send(const ClientId client_id, const Payloads payloads) = 0;

protected:
    ServerPipe() = default;

};  // ServerPipe

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED
