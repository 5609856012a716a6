//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define NETCFGD_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <cerrno>

namespace netcfgd
{
namespace platform
{

/// Calls a POSIX syscall (again and again while it gets interrupted by a signal).
///
/// @return Zero if the call has succeeded, otherwise its `errno`.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    for (;;)
    {
        if (call() >= 0)
        {
            return 0;
        }
        const int err = errno;
        if (EINTR != err)
        {
            return err;
        }
    }
}

/// Same as `posixSyscallError`, but also keeps the (non-negative) result of the successful call,
/// f.e. number of bytes of `read` or `write`.
///
template <typename Result, typename Call>
int posixSyscallInto(Result& out_result, const Call& call)
{
    return posixSyscallError([&out_result, &call] {
        //
        return out_result = call();
    });
}

}  // namespace platform
}  // namespace netcfgd

#endif  // NETCFGD_PLATFORM_POSIX_UTILS_HPP_INCLUDED
