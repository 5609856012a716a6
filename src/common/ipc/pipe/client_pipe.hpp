//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED

#include "ipc/ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

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

/// Message pipe from a client process (CLI, SDK user, plugin) to the daemon.
///
/// Events are delivered from within the executor spin. The expected order is `Connected`, any number of
/// `Message`s, and finally `Disconnected`; a failed connection attempt goes straight to `Disconnected`.
///
class ClientPipe
{
public:
    using Ptr = std::unique_ptr<ClientPipe>;

    struct Event final
    {
        struct Connected final
        {};

        /// A complete message; the payload is valid during the handler call only.
        struct Message final
        {
            Payload payload;
        };

        struct Disconnected final
        {};

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    /// A non-zero result of the handler is only logged by the pipe.
    using EventHandler = std::function<int(const Event::Var&)>;

    ClientPipe(const ClientPipe&)                = delete;
    ClientPipe(ClientPipe&&) noexcept            = delete;
    ClientPipe& operator=(const ClientPipe&)     = delete;
    ClientPipe& operator=(ClientPipe&&) noexcept = delete;

    virtual ~ClientPipe() = default;

    /// Initiates the connection. Could be called only once.
    ///
    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends a single message composed of the payload fragments.
    ///
    CETL_NODISCARD virtual int send(const Payloads payloads) = 0;

protected:
    ClientPipe() = default;

};  // ClientPipe

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
