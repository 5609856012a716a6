//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IO_HPP_INCLUDED
#define NETCFGD_COMMON_IO_HPP_INCLUDED

#include <cstddef>
#include <string>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace io
{

/// RAII wrapper for a file descriptor.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        const OwnFd old{std::move(*this)};
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    OwnFd& operator=(std::nullptr_t)
    {
        const OwnFd old{std::move(*this)};
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    int get() const noexcept
    {
        return fd_;
    }

    /// Gives up ownership of the file descriptor (f.e. before `execv` of a child process).
    int release() noexcept
    {
        return std::exchange(fd_, -1);
    }

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

/// Both ends of an anonymous pipe.
///
struct OwnPipe
{
    OwnFd read_end;
    OwnFd write_end;
};

/// Creates a new anonymous pipe (with both ends closed on `exec`).
///
/// @return Zero on success, otherwise `errno` of the failed `pipe2` call.
///
int makePipe(OwnPipe& out_pipe);

/// Writes the whole string to the given file descriptor (retrying on `EINTR` and partial writes).
///
/// @return Zero on success, otherwise `errno` of the failed `write` call.
///
int writeString(const int fd, const std::string& str);

}  // namespace io
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IO_HPP_INCLUDED
