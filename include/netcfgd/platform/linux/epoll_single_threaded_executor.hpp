//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
#define NETCFGD_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

#include "netcfgd/platform/posix_executor_extension.hpp"
#include "netcfgd/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <sys/epoll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <map>
#include <utility>

namespace netcfgd
{
namespace platform
{
namespace Linux
{

/// Single-threaded executor which in addition to timed callbacks is also able
/// to wait (using `epoll`) for readiness of file descriptors.
///
class EpollSingleThreadedExecutor final : public libcyphal::platform::SingleThreadedExecutor,
                                          public IPosixExecutorExtension
{
    using Base = SingleThreadedExecutor;

public:
    EpollSingleThreadedExecutor()
        : epollfd_{::epoll_create1(EPOLL_CLOEXEC)}
    {
        if (epollfd_ < 0)
        {
            spdlog::critical("Failed to create epoll instance (err={}).", errno);
        }
    }

    EpollSingleThreadedExecutor(const EpollSingleThreadedExecutor&)                = delete;
    EpollSingleThreadedExecutor(EpollSingleThreadedExecutor&&) noexcept            = delete;
    EpollSingleThreadedExecutor& operator=(const EpollSingleThreadedExecutor&)     = delete;
    EpollSingleThreadedExecutor& operator=(EpollSingleThreadedExecutor&&) noexcept = delete;

    ~EpollSingleThreadedExecutor() override
    {
        if (epollfd_ >= 0)
        {
            ::close(epollfd_);
        }
    }

    /// Waits (at most for the given timeout) for any registered file descriptor to become ready,
    /// and schedules the corresponding callbacks for immediate execution by the next `spinOnce`.
    ///
    /// @return `0` on success, or `errno` of the failed `epoll_wait` call.
    ///
    CETL_NODISCARD int pollAwaitableResourcesFor(const cetl::optional<libcyphal::Duration> timeout)
    {
        if (epollfd_ < 0)
        {
            return EBADF;
        }

        int clamped_timeout_ms = -1;
        if (timeout)
        {
            // Round up to the nearest millisecond so that we don't wake up too early.
            const auto timeout_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(*timeout + std::chrono::microseconds{999});
            clamped_timeout_ms = static_cast<int>(std::max<std::int64_t>(0, timeout_ms.count()));
        }

        std::array<epoll_event, MaxEvents> evs{};
        const int epoll_result = ::epoll_wait(epollfd_, evs.data(), static_cast<int>(evs.size()), clamped_timeout_ms);
        if (epoll_result < 0)
        {
            const int error_num = errno;
            if (error_num == EINTR)
            {
                // Interrupted by a signal, which is fine - the caller will decide whether to continue or not.
                return 0;
            }
            return error_num;
        }

        const auto now_time = now();
        for (int i = 0; i < epoll_result; ++i)
        {
            const auto& ev = evs[static_cast<std::size_t>(i)];  // NOLINT
            const auto  it = awaitables_.find(ev.data.u64);
            if (it != awaitables_.end())
            {
                (void) it->second.callback.schedule(Callback::Schedule::Once{now_time});
            }
        }
        return 0;
    }

    // MARK: - IExecutor

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        return std::chrono::time_point_cast<libcyphal::Duration>(std::chrono::steady_clock::now());
    }

    // MARK: - IPosixExecutorExtension

    CETL_NODISCARD Awaitable registerAwaitableCallback(Callback::Function&&     function,
                                                       const Trigger::Variant& trigger) override
    {
        int           fd     = -1;
        std::uint32_t events = 0;
        cetl::visit(  //
            cetl::make_overloaded(
                [&fd, &events](const Trigger::Readable& readable) {
                    //
                    fd     = readable.fd;
                    events = EPOLLIN;
                },
                [&fd, &events](const Trigger::Writable& writable) {
                    //
                    fd     = writable.fd;
                    events = EPOLLOUT;
                }),
            trigger);

        const auto awaitable_id = ++last_awaitable_id_;

        epoll_event ev{};
        ev.events   = events;
        ev.data.u64 = awaitable_id;
        if (const auto err = posixSyscallError([this, fd, &ev] {
                //
                return ::epoll_ctl(epollfd_, EPOLL_CTL_ADD, fd, &ev);
            }))
        {
            spdlog::error("Failed to add fd to epoll (fd={}, err={}).", fd, err);
            return Awaitable{};
        }

        awaitables_.emplace(awaitable_id, AwaitableNode{fd, registerCallback(std::move(function))});
        return Awaitable{*this, awaitable_id};
    }

protected:
    void releaseAwaitable(const Awaitable::Id id) noexcept override
    {
        const auto it = awaitables_.find(id);
        if (it == awaitables_.end())
        {
            return;
        }

        // ENOENT is fine - the fd might be already closed (and so auto-removed from the epoll set).
        const int fd = it->second.fd;
        if (const auto err = posixSyscallError([this, fd] {
                //
                return ::epoll_ctl(epollfd_, EPOLL_CTL_DEL, fd, nullptr);
            }))
        {
            if ((err != ENOENT) && (err != EBADF))
            {
                spdlog::warn("Failed to remove fd from epoll (fd={}, err={}).", fd, err);
            }
        }
        awaitables_.erase(it);
    }

    // MARK: - RTTI

    CETL_NODISCARD void* _cast_(const cetl::type_id& id) & noexcept override
    {
        if (IPosixExecutorExtension::_get_type_id_() == id)
        {
            return static_cast<IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

    CETL_NODISCARD const void* _cast_(const cetl::type_id& id) const& noexcept override
    {
        if (IPosixExecutorExtension::_get_type_id_() == id)
        {
            return static_cast<const IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

private:
    static constexpr std::size_t MaxEvents = 16;

    struct AwaitableNode
    {
        int           fd;
        Callback::Any callback;
    };

    int                                   epollfd_;
    Awaitable::Id                         last_awaitable_id_{0};
    std::map<Awaitable::Id, AwaitableNode> awaitables_;

};  // EpollSingleThreadedExecutor

}  // namespace Linux
}  // namespace platform
}  // namespace netcfgd

#endif  // NETCFGD_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
