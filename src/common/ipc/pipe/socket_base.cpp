//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_base.hpp"

#include "ipc/ipc_types.hpp"
#include "netcfgd/platform/posix_utils.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

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

constexpr std::uint32_t FrameSignature = 0x4746434E;  // 'NCFG'

/// How long a sender may wait for the peer to drain its socket buffer.
constexpr int SendWaitTimeoutMs = 1000;

}  // namespace

int SocketBase::send(const FramedConnection& conn, const Payloads payloads) const
{
    const int fd = conn.fd.get();
    if (fd == -1)
    {
        return static_cast<int>(ErrorCode::NotConnected);
    }

    std::size_t payload_size = 0;
    for (const auto payload : payloads)
    {
        payload_size += payload.size();
    }
    if ((payload_size == 0) || (payload_size > max_payload_size_))
    {
        logger_->error("Can't send frame of {} bytes (fd={}, max={}).", payload_size, fd, max_payload_size_);
        return EMSGSIZE;
    }

    const FrameHeader header{FrameSignature, static_cast<std::uint32_t>(payload_size)};
    // NOLINTNEXTLINE(*-reinterpret-cast)
    int err = sendAll(fd, reinterpret_cast<const std::uint8_t*>(&header), sizeof(header));
    for (auto it = payloads.begin(); (err == 0) && (it != payloads.end()); ++it)
    {
        err = sendAll(fd, it->data(), it->size());
    }
    if (err != 0)
    {
        logger_->error("Failed to send frame (fd={}, size={}): {}.", fd, payload_size, std::strerror(err));
    }
    return err;
}

int SocketBase::sendAll(const int fd, const std::uint8_t* data, std::size_t size) const
{
    while (size > 0)
    {
        ssize_t bytes_sent = 0;
        const int err      = platform::posixSyscallInto(bytes_sent, [fd, data, size] {
            //
            return ::send(fd, data, size, MSG_DONTWAIT | MSG_NOSIGNAL);
        });
        if (err == 0)
        {
            data += bytes_sent;  // NOLINT(*-pointer-arithmetic)
            size -= static_cast<std::size_t>(bytes_sent);
            continue;
        }
        if ((err != EAGAIN) && (err != EWOULDBLOCK))
        {
            return err;
        }

        // The peer is slow to read - wait (bounded) until its socket buffer is drained.
        logger_->trace("Send would block (fd={}).", fd);
        pollfd poll_fd{fd, POLLOUT, 0};
        int    ready = 0;
        if (const int poll_err = platform::posixSyscallInto(ready, [&poll_fd] {
                //
                return ::poll(&poll_fd, 1, SendWaitTimeoutMs);
            }))
        {
            return poll_err;
        }
        if (ready == 0)
        {
            return ETIMEDOUT;
        }
    }
    return 0;
}

int SocketBase::receiveFrame(FramedConnection& conn) const
{
    const int fd = conn.fd.get();

    if (!conn.rx_payload)
    {
        // NOLINTNEXTLINE(*-reinterpret-cast)
        auto* const header_bytes = reinterpret_cast<std::uint8_t*>(&conn.rx_header);
        if (const int err = receivePart(fd, header_bytes, sizeof(conn.rx_header), conn.rx_received))
        {
            return err;
        }
        if (conn.rx_received < sizeof(conn.rx_header))
        {
            return 0;
        }

        const auto& header = conn.rx_header;
        if ((header.signature != FrameSignature) || (header.payload_size == 0) ||
            (header.payload_size > max_payload_size_))
        {
            logger_->error("Invalid frame header (fd={}, signature=0x{:08X}, size={}, max={}).",
                           fd,
                           header.signature,
                           header.payload_size,
                           max_payload_size_);
            return EINVAL;
        }

        conn.rx_received = 0;
        conn.rx_payload  = std::make_unique<std::uint8_t[]>(header.payload_size);  // NOLINT(*-avoid-c-arrays)
    }

    return receivePart(fd, conn.rx_payload.get(), conn.rx_header.payload_size, conn.rx_received);
}

int SocketBase::receivePart(const int           fd,
                            std::uint8_t* const part,
                            const std::size_t   size,
                            std::size_t&        received) const
{
    if (received >= size)
    {
        return 0;
    }

    ssize_t   bytes_read = 0;
    const int err        = platform::posixSyscallInto(bytes_read, [fd, part, size, received] {
        //
        // NOLINTNEXTLINE(*-pointer-arithmetic)
        return ::recv(fd, part + received, size - received, MSG_DONTWAIT);
    });
    if ((err == EAGAIN) || (err == EWOULDBLOCK))
    {
        return 0;
    }
    if (err != 0)
    {
        logger_->error("Failed to receive (fd={}): {}.", fd, std::strerror(err));
        return err;
    }
    if (bytes_read == 0)
    {
        logger_->debug("End of stream (fd={}).", fd);
        return -1;
    }

    received += static_cast<std::size_t>(bytes_read);
    return 0;
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd
