//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"
#include "netcfgd/platform/posix_utils.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace netcfgd
{
namespace common
{
namespace io
{

void OwnFd::reset() noexcept
{
    if (fd_ >= 0)
    {
        // Do not use `posixSyscallError` here b/c `close` should not be repeated on `EINTR`.
        if (::close(fd_) < 0)
        {
            const int err = errno;
            getLogger(common::logger_names::Io)
                ->error("Failed to close file descriptor {}: {}.", fd_, std::strerror(err));
        }

        fd_ = -1;
    }
}

OwnFd::~OwnFd()
{
    reset();
}

int makePipe(OwnPipe& out_pipe)
{
    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0)
    {
        return errno;
    }
    out_pipe.read_end  = OwnFd{fds[0]};
    out_pipe.write_end = OwnFd{fds[1]};
    return 0;
}

int writeString(const int fd, const std::string& str)
{
    std::size_t offset = 0;
    while (offset < str.size())
    {
        ssize_t written = 0;
        if (const int err = platform::posixSyscallInto(written, [fd, &str, offset] {
                //
                return ::write(fd, str.data() + offset, str.size() - offset);  // NOLINT(*-pointer-arithmetic)
            }))
        {
            return err;
        }
        offset += static_cast<std::size_t>(written);
    }
    return 0;
}

}  // namespace io
}  // namespace common
}  // namespace netcfgd
