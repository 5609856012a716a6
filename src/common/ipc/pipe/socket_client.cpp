//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_client.hpp"

#include "io/socket_address.hpp"
#include "ipc/ipc_types.hpp"
#include "netcfgd/platform/posix_executor_extension.hpp"
#include "netcfgd/platform/posix_utils.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <sys/socket.h>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace pipe
{

SocketClient::SocketClient(libcyphal::IExecutor&    executor,
                           const io::SocketAddress& address,
                           const std::size_t        max_payload_size)
    : SocketBase{max_payload_size}
    , address_{address}
    , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
{
    CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");
}

int SocketClient::start(EventHandler event_handler)
{
    CETL_DEBUG_ASSERT(event_handler, "");
    CETL_DEBUG_ASSERT(conn_.fd.get() == -1, "");

    if (posix_executor_ext_ == nullptr)
    {
        logger().error("Executor has no POSIX extension - can't connect to '{}'.", address_.toString());
        return EINVAL;
    }
    event_handler_ = std::move(event_handler);

    if (const int err = connect())
    {
        return err;
    }

    // Completion of the non-blocking `connect` is signalled by the socket becoming writable.
    conn_.awaitable = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            onConnectCompleted();
        },
        platform::IPosixExecutorExtension::Trigger::Writable{conn_.fd.get()});
    return conn_.awaitable ? 0 : EIO;
}

int SocketClient::connect()
{
    using SocketResult = io::SocketAddress::SocketResult;

    auto maybe_socket = address_.socket(SOCK_STREAM);
    if (const auto* const err = cetl::get_if<SocketResult::Failure>(&maybe_socket))
    {
        logger().error("Failed to create client socket (addr='{}'): {}.", address_.toString(), std::strerror(*err));
        return *err;
    }
    auto socket_fd = cetl::get<SocketResult::Success>(std::move(maybe_socket));

    if (const int err = address_.connect(socket_fd))
    {
        return err;
    }

    conn_.fd = std::move(socket_fd);
    return 0;
}

int SocketClient::send(const Payloads payloads)
{
    return SocketBase::send(conn_, payloads);
}

void SocketClient::onConnectCompleted()
{
    conn_.awaitable.reset();

    int       so_error = 0;
    socklen_t len      = sizeof(so_error);
    if (const int err = platform::posixSyscallError([this, &so_error, &len] {
            //
            return ::getsockopt(conn_.fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
        }))
    {
        so_error = err;
    }
    if (so_error != 0)
    {
        logger().debug("Can't connect to '{}': {}.", address_.toString(), std::strerror(so_error));
        disconnect();
        return;
    }

    logger().debug("Connected to '{}' (fd={}).", address_.toString(), conn_.fd.get());
    conn_.awaitable = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            onReadable();
        },
        platform::IPosixExecutorExtension::Trigger::Readable{conn_.fd.get()});

    (void) event_handler_(Event::Connected{});
}

void SocketClient::onReadable()
{
    const int err = receive(conn_, [this](const Payload payload) {
        //
        return event_handler_(Event::Message{payload});
    });
    if (err == -1)
    {
        logger().debug("Daemon has closed the connection.");
        disconnect();
    }
    else if (err != 0)
    {
        logger().warn("Closing connection to the daemon (err={}): {}.", err, std::strerror(err));
        disconnect();
    }
}

void SocketClient::disconnect()
{
    conn_.awaitable.reset();
    conn_.fd.reset();
    conn_.resetRx();

    (void) event_handler_(Event::Disconnected{});
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd
