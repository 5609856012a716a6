//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define NETCFGD_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace io
{

/// Local (unix domain) socket address.
///
/// Supported forms are `unix:<path>` (filesystem socket) and `unix-abstract:<name>` (Linux abstract namespace).
///
class SocketAddress final
{
public:
    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    static ParseResult::Var parse(const std::string& str);

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    bool isUnix() const noexcept
    {
        return addr_un_.sun_family == AF_UNIX;
    }

    bool isAbstract() const noexcept;

    /// Gets back the textual form of the address (suitable for `parse`).
    ///
    std::string toString() const;

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    SocketResult::Var socket(const int type) const;

    /// Binds the socket. A stale filesystem socket left by a previous run is removed first.
    int                   bind(const OwnFd& socket_fd) const;
    int                   connect(const OwnFd& socket_fd) const;
    cetl::optional<OwnFd> accept(const OwnFd& socket_fd);

    /// Removes filesystem socket (if any) - abstract addresses have nothing to remove.
    void unlink() const;

private:
    static ParseResult::Var makeUnixDomain(const std::string& name, const bool is_abstract);

    std::size_t pathLength() const noexcept;

    socklen_t   addr_len_;
    sockaddr_un addr_un_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
