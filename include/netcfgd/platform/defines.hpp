//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_PLATFORM_DEFINES_HPP_INCLUDED
#define NETCFGD_PLATFORM_DEFINES_HPP_INCLUDED

#include "linux/epoll_single_threaded_executor.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>

namespace netcfgd
{
namespace platform
{

using SingleThreadedExecutor = Linux::EpollSingleThreadedExecutor;

/// The longest time the polling loop sleeps in the `epoll_wait`, even if nothing is scheduled.
///
constexpr std::chrono::milliseconds MaxPollingInterval{1000};

struct PollingStats final
{
    std::size_t         spins{0};
    libcyphal::Duration worst_lateness{0};

};  // PollingStats

namespace detail
{

template <typename Executor, typename SpinResult>
libcyphal::Duration pollingTimeoutOf(const Executor& executor, const SpinResult& spin_result)
{
    const libcyphal::Duration max_timeout{MaxPollingInterval};
    if (!spin_result.next_exec_time)
    {
        return max_timeout;
    }
    return std::max(libcyphal::Duration::zero(),
                    std::min(max_timeout, spin_result.next_exec_time.value() - executor.now()));
}

}  // namespace detail

/// Runs the executor (its scheduled callbacks, and polling of its file descriptors) until the predicate holds.
///
/// The predicate is checked before and after each spin, so it may become fulfilled by a callback.
///
template <typename Executor, typename Predicate>
PollingStats waitPollingUntil(Executor& executor, Predicate predicate)
{
    PollingStats stats;
    while (!predicate())
    {
        const auto spin_result = executor.spinOnce();
        ++stats.spins;
        stats.worst_lateness = std::max(stats.worst_lateness, spin_result.worst_lateness);
        if (predicate())
        {
            break;
        }

        const auto timeout = detail::pollingTimeoutOf(executor, spin_result);
        if (const auto poll_err = executor.pollAwaitableResourcesFor(cetl::make_optional(timeout)))
        {
            spdlog::warn("Polling of awaitable resources has failed (err={}).", poll_err);
        }
    }
    return stats;
}

}  // namespace platform
}  // namespace netcfgd

#endif  // NETCFGD_PLATFORM_DEFINES_HPP_INCLUDED
