//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_server.hpp"

#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"
#include "netcfgd/platform/posix_executor_extension.hpp"
#include "netcfgd/platform/posix_utils.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <memory>
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
namespace
{

constexpr int ListenBacklog = 32;

}  // namespace

SocketServer::SocketServer(libcyphal::IExecutor&    executor,
                           const io::SocketAddress& address,
                           const std::size_t        max_payload_size)
    : SocketBase{max_payload_size}
    , address_{address}
    , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
{
    CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");
}

SocketServer::~SocketServer()
{
    clients_.clear();
    accept_awaitable_.reset();

    if (listen_fd_.get() != -1)
    {
        listen_fd_.reset();
        address_.unlink();
    }
}

int SocketServer::start(EventHandler event_handler)
{
    CETL_DEBUG_ASSERT(event_handler, "");
    CETL_DEBUG_ASSERT(listen_fd_.get() == -1, "");

    if (posix_executor_ext_ == nullptr)
    {
        logger().error("Executor has no POSIX extension - can't listen on '{}'.", address_.toString());
        return EINVAL;
    }
    event_handler_ = std::move(event_handler);

    if (const int err = listen())
    {
        return err;
    }

    accept_awaitable_ = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            acceptClient();
        },
        platform::IPosixExecutorExtension::Trigger::Readable{listen_fd_.get()});
    if (!accept_awaitable_)
    {
        return EIO;
    }

    logger().info("Listening on '{}'.", address_.toString());
    return 0;
}

int SocketServer::listen()
{
    using SocketResult = io::SocketAddress::SocketResult;

    auto maybe_socket = address_.socket(SOCK_STREAM);
    if (const auto* const err = cetl::get_if<SocketResult::Failure>(&maybe_socket))
    {
        logger().error("Failed to create server socket (addr='{}'): {}.", address_.toString(), std::strerror(*err));
        return *err;
    }
    auto socket_fd = cetl::get<SocketResult::Success>(std::move(maybe_socket));

    if (const int err = address_.bind(socket_fd))
    {
        logger().error("Failed to bind server socket (addr='{}'): {}.", address_.toString(), std::strerror(err));
        return err;
    }
    if (const int err = platform::posixSyscallError([&socket_fd] {
            //
            return ::listen(socket_fd.get(), ListenBacklog);
        }))
    {
        logger().error("Failed to listen (addr='{}'): {}.", address_.toString(), std::strerror(err));
        return err;
    }

    listen_fd_ = std::move(socket_fd);
    return 0;
}

int SocketServer::send(const ClientId client_id, const Payloads payloads)
{
    const auto it = clients_.find(client_id);
    if (it == clients_.end())
    {
        logger().debug("Can't send to unknown client (id={}).", client_id);
        return static_cast<int>(ErrorCode::NotConnected);
    }
    return SocketBase::send(*it->second, payloads);
}

void SocketServer::acceptClient()
{
    io::SocketAddress peer_address;
    auto              maybe_fd = peer_address.accept(listen_fd_);
    if (!maybe_fd)
    {
        return;
    }

    const ClientId client_id = ++last_client_id_;
    auto           conn      = std::make_unique<FramedConnection>();
    conn->fd                 = std::move(*maybe_fd);
    logger().debug("Client is accepted (id={}, fd={}).", client_id, conn->fd.get());

    conn->awaitable = posix_executor_ext_->registerAwaitableCallback(  //
        [this, client_id](const auto&) {
            //
            receiveFrom(client_id);
        },
        platform::IPosixExecutorExtension::Trigger::Readable{conn->fd.get()});

    clients_.emplace(client_id, std::move(conn));
    (void) event_handler_(Event::Connected{client_id});
}

void SocketServer::receiveFrom(const ClientId client_id)
{
    const auto it = clients_.find(client_id);
    if (it == clients_.end())
    {
        return;
    }

    const int err = receive(*it->second, [this, client_id](const Payload payload) {
        //
        return event_handler_(Event::Message{client_id, payload});
    });
    if (err == -1)
    {
        logger().debug("Client has closed its connection (id={}).", client_id);
        closeClient(client_id);
    }
    else if (err != 0)
    {
        logger().warn("Closing client connection (id={}, err={}): {}.", client_id, err, std::strerror(err));
        closeClient(client_id);
    }
}

void SocketServer::closeClient(const ClientId client_id)
{
    if (clients_.erase(client_id) > 0)
    {
        (void) event_handler_(Event::Disconnected{client_id});
    }
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd
