//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_address.hpp"

#include "io.hpp"
#include "logging.hpp"
#include "netcfgd/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace io
{
namespace
{

constexpr const char* UnixPrefix         = "unix:";
constexpr const char* AbstractUnixPrefix = "unix-abstract:";

bool startsWith(const std::string& str, const char* const prefix)
{
    return 0 == str.compare(0, std::strlen(prefix), prefix);
}

Logger& logger()
{
    static const auto io_logger = getLogger(common::logger_names::Io);
    return *io_logger;
}

}  // namespace

SocketAddress::SocketAddress() noexcept
    : addr_len_{0}
    , addr_un_{}
{
}

std::size_t SocketAddress::pathLength() const noexcept
{
    constexpr auto PathOffset = offsetof(sockaddr_un, sun_path);
    return (addr_len_ > PathOffset) ? (addr_len_ - PathOffset) : 0;
}

std::pair<const sockaddr*, socklen_t> SocketAddress::getRaw() const noexcept
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const sockaddr*>(&addr_un_), addr_len_};
}

bool SocketAddress::isAbstract() const noexcept
{
    return isUnix() && (pathLength() > 0) && (addr_un_.sun_path[0] == '\0');
}

std::string SocketAddress::toString() const
{
    if (!isUnix() || (pathLength() == 0))
    {
        return "<none>";
    }
    if (isAbstract())
    {
        // The name follows the leading null byte, and may contain nulls itself.
        // NOLINTNEXTLINE(*-pointer-arithmetic)
        return AbstractUnixPrefix + std::string(&addr_un_.sun_path[1], pathLength() - 1);
    }
    // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay)
    return UnixPrefix + std::string(addr_un_.sun_path);
}

SocketAddress::SocketResult::Var SocketAddress::socket(const int type) const
{
    int        raw_fd = -1;
    const auto err    = platform::posixSyscallInto(raw_fd, [this, type] {
        //
        return ::socket(addr_un_.sun_family, type | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    });
    if (err != 0)
    {
        logger().error("Failed to create socket (addr='{}'): {}.", toString(), std::strerror(err));
        return err;
    }
    return OwnFd{raw_fd};
}

int SocketAddress::bind(const OwnFd& socket_fd) const
{
    CETL_DEBUG_ASSERT(socket_fd.get() != -1, "");

    unlink();

    const auto raw_addr = getRaw();
    return platform::posixSyscallError([&socket_fd, &raw_addr] {
        //
        return ::bind(socket_fd.get(), raw_addr.first, raw_addr.second);
    });
}

int SocketAddress::connect(const OwnFd& socket_fd) const
{
    CETL_DEBUG_ASSERT(socket_fd.get() != -1, "");

    const auto raw_addr = getRaw();
    const auto err      = platform::posixSyscallError([&socket_fd, &raw_addr] {
        //
        return ::connect(socket_fd.get(), raw_addr.first, raw_addr.second);
    });
    if ((err != 0) && (err != EINPROGRESS))
    {
        logger().debug("Failed to connect (addr='{}'): {}.", toString(), std::strerror(err));
        return err;
    }
    return 0;
}

cetl::optional<OwnFd> SocketAddress::accept(const OwnFd& server_fd)
{
    CETL_DEBUG_ASSERT(server_fd.get() != -1, "");

    for (;;)
    {
        addr_len_ = sizeof(addr_un_);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        auto* const raw_addr = reinterpret_cast<sockaddr*>(&addr_un_);

        OwnFd client_fd{::accept4(server_fd.get(), raw_addr, &addr_len_, SOCK_NONBLOCK | SOCK_CLOEXEC)};
        if (client_fd.get() >= 0)
        {
            return client_fd;
        }

        const int err = errno;
        if ((err == EAGAIN) || (err == EWOULDBLOCK))
        {
            return cetl::nullopt;
        }
        // The pending connection has gone (or a signal has interrupted) - try the next one.
        if ((err == EINTR) || (err == ECONNABORTED) || (err == EPROTO))
        {
            logger().debug("Retrying accept (fd={}, err={}).", server_fd.get(), err);
            continue;
        }

        logger().warn("Failed to accept connection (fd={}): {}.", server_fd.get(), std::strerror(err));
        return cetl::nullopt;
    }
}

void SocketAddress::unlink() const
{
    if (!isUnix() || isAbstract() || (pathLength() == 0))
    {
        return;
    }

    // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay)
    if ((::unlink(addr_un_.sun_path) < 0) && (errno != ENOENT))
    {
        const int err = errno;
        logger().warn("Failed to unlink socket file (addr='{}'): {}.", toString(), std::strerror(err));
    }
}

SocketAddress::ParseResult::Var SocketAddress::parse(const std::string& str)
{
    if (startsWith(str, UnixPrefix))
    {
        return makeUnixDomain(str.substr(std::strlen(UnixPrefix)), false);
    }
    if (startsWith(str, AbstractUnixPrefix))
    {
        return makeUnixDomain(str.substr(std::strlen(AbstractUnixPrefix)), true);
    }

    logger().error("Unsupported socket address '{}' (expected 'unix:<path>' or 'unix-abstract:<name>').", str);
    return EINVAL;
}

SocketAddress::ParseResult::Var SocketAddress::makeUnixDomain(const std::string& name, const bool is_abstract)
{
    if (name.empty() && !is_abstract)
    {
        logger().error("Unix domain socket path is empty.");
        return EINVAL;
    }

    SocketAddress result;
    auto&         addr_un = result.addr_un_;

    // Abstract names start after the leading null byte. The trailing null terminator is always reserved,
    // although only filesystem paths need it.
    const std::size_t offset = is_abstract ? 1 : 0;
    if ((offset + name.size() + 1) > sizeof(addr_un.sun_path))
    {
        logger().error("Unix domain socket name is too long (name='{}', max={}).",
                       name,
                       sizeof(addr_un.sun_path) - offset - 1);
        return EINVAL;
    }

    addr_un.sun_family = AF_UNIX;
    // `memcpy` b/c abstract names may contain null characters.
    // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay, *-pointer-arithmetic)
    std::memcpy(&addr_un.sun_path[offset], name.data(), name.size());

    // Either the leading null byte (abstract) or the terminator (filesystem path) is counted.
    result.addr_len_ = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + name.size() + 1);
    return result;
}

}  // namespace io
}  // namespace common
}  // namespace netcfgd
