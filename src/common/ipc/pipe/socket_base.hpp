//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED

#include "io/io.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"
#include "netcfgd/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Frame header which precedes every message on the wire.
///
struct FrameHeader final
{
    std::uint32_t signature{0};
    std::uint32_t payload_size{0};

};  // FrameHeader

/// A connected stream socket, together with its partially received frame (if any).
///
struct FramedConnection final
{
    using Ptr = std::unique_ptr<FramedConnection>;

    /// Drops the partially received frame (if any).
    ///
    void resetRx() noexcept
    {
        rx_header   = FrameHeader{};
        rx_received = 0;
        rx_payload.reset();
    }

    io::OwnFd                                    fd;
    platform::IPosixExecutorExtension::Awaitable awaitable;

    FrameHeader rx_header;
    // Bytes received of the header, or (if `rx_payload` is allocated) of the payload.
    std::size_t                     rx_received{0};
    std::unique_ptr<std::uint8_t[]> rx_payload;  // NOLINT(*-avoid-c-arrays)

};  // FramedConnection

/// Framing of messages over stream sockets, shared by the socket client and server.
///
/// A frame is the `FrameHeader` followed by `payload_size` bytes. A frame with a bad signature,
/// an empty payload, or a payload bigger than the limit is a protocol violation, and the connection is closed.
///
class SocketBase
{
public:
    static constexpr std::size_t DefaultMaxPayloadSize = 1ULL << 20ULL;  // 1 MB

    SocketBase(const SocketBase&)                = delete;
    SocketBase(SocketBase&&) noexcept            = delete;
    SocketBase& operator=(const SocketBase&)     = delete;
    SocketBase& operator=(SocketBase&&) noexcept = delete;

protected:
    explicit SocketBase(const std::size_t max_payload_size)
        : max_payload_size_{max_payload_size}
    {
    }
    ~SocketBase() = default;

    Logger& logger() const noexcept
    {
        return *logger_;
    }

    /// Sends a single frame, with the payload composed of the given fragments.
    ///
    /// @return Zero on success, otherwise `errno` of the failure.
    ///
    CETL_NODISCARD int send(const FramedConnection& conn, const Payloads payloads) const;

    /// Reads whatever is available on the socket, and passes a complete frame payload to the `on_payload`.
    ///
    /// A payload rejected by `on_payload` is only logged.
    ///
    /// @return Zero if the connection is still usable, `-1` on end of stream, otherwise `errno` of the failure.
    ///
    template <typename OnPayload>
    CETL_NODISCARD int receive(FramedConnection& conn, OnPayload&& on_payload) const
    {
        if (const int err = receiveFrame(conn))
        {
            return err;
        }
        if (!isFrameComplete(conn))
        {
            return 0;
        }

        const auto        payload      = std::move(conn.rx_payload);
        const std::size_t payload_size = conn.rx_header.payload_size;
        conn.resetRx();

        if (const int err = std::forward<OnPayload>(on_payload)(Payload{payload.get(), payload_size}))
        {
            logger_->debug("Frame payload is rejected (fd={}, size={}, err={}).", conn.fd.get(), payload_size, err);
        }
        return 0;
    }

private:
    CETL_NODISCARD int receiveFrame(FramedConnection& conn) const;
    CETL_NODISCARD int receivePart(const int           fd,
                                   std::uint8_t* const part,
                                   const std::size_t   size,
                                   std::size_t&        received)
        const;
    CETL_NODISCARD int sendAll(const int fd, const std::uint8_t* data, std::size_t size) const;

    static bool isFrameComplete(const FramedConnection& conn) noexcept
    {
        return conn.rx_payload && (conn.rx_received == conn.rx_header.payload_size);
    }

    const std::size_t max_payload_size_;
    LoggerPtr         logger_{getLogger(common::logger_names::Ipc)};

};  // SocketBase

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED
