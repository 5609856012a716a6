//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_EXECUTOR_HELPERS_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_EXECUTOR_HELPERS_HPP_INCLUDED

#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Runs posted actions on the next executor spin (never from within `post` itself).
///
/// A single executor callback is reused for all actions, so that no callback is ever destroyed
/// while it's being executed.
///
class Deferred final
{
public:
    explicit Deferred(libcyphal::IExecutor& executor)
        : executor_{executor}
        , callback_{executor.registerCallback([this](const auto&) {
            //
            drain();
        })}
    {
    }

    Deferred(const Deferred&)                = delete;
    Deferred(Deferred&&) noexcept            = delete;
    Deferred& operator=(const Deferred&)     = delete;
    Deferred& operator=(Deferred&&) noexcept = delete;

    ~Deferred() = default;

    void post(std::function<void()> action)
    {
        actions_.push_back(std::move(action));
        (void) callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{executor_.now()});
    }

private:
    void drain()
    {
        // Actions might post new ones - they will be executed on the next spin.
        auto actions = std::move(actions_);
        actions_.clear();
        for (auto& action : actions)
        {
            action();
        }
    }

    libcyphal::IExecutor&              executor_;
    libcyphal::IExecutor::Callback::Any callback_;
    std::vector<std::function<void()>> actions_;

};  // Deferred

/// Tracks deadlines of many keyed entities using a single executor callback.
///
/// The `on_expired` handler is called (from the executor spin) once per expired key;
/// the key is already disarmed at that moment, so the handler is free to (re)arm or disarm any keys.
///
class TimerQueue final
{
public:
    using Key       = std::uint64_t;
    using OnExpired = std::function<void(const Key key)>;

    TimerQueue(libcyphal::IExecutor& executor, OnExpired on_expired)
        : on_expired_{std::move(on_expired)}
        , callback_{executor.registerCallback([this](const auto& arg) {
            //
            onTimer(arg.approx_now);
        })}
    {
    }

    TimerQueue(const TimerQueue&)                = delete;
    TimerQueue(TimerQueue&&) noexcept            = delete;
    TimerQueue& operator=(const TimerQueue&)     = delete;
    TimerQueue& operator=(TimerQueue&&) noexcept = delete;

    ~TimerQueue() = default;

    void arm(const Key key, const libcyphal::TimePoint deadline)
    {
        deadlines_[key] = deadline;
        reschedule();
    }

    void disarm(const Key key)
    {
        // Callback stays scheduled (if any) - it will find nothing expired and reschedule itself.
        deadlines_.erase(key);
    }

    bool isArmed(const Key key) const
    {
        return deadlines_.find(key) != deadlines_.end();
    }

private:
    void onTimer(const libcyphal::TimePoint now)
    {
        std::vector<Key> expired;
        for (auto it = deadlines_.begin(); it != deadlines_.end();)
        {
            if (it->second <= now)
            {
                expired.push_back(it->first);
                it = deadlines_.erase(it);
            }
            else
            {
                ++it;
            }
        }

        for (const auto key : expired)
        {
            on_expired_(key);
        }

        reschedule();
    }

    void reschedule()
    {
        if (deadlines_.empty())
        {
            return;
        }

        auto earliest = deadlines_.begin()->second;
        for (const auto& key_deadline : deadlines_)
        {
            earliest = std::min(earliest, key_deadline.second);
        }
        (void) callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{earliest});
    }

    OnExpired                           on_expired_;
    libcyphal::IExecutor::Callback::Any callback_;
    std::map<Key, libcyphal::TimePoint> deadlines_;

};  // TimerQueue

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_EXECUTOR_HELPERS_HPP_INCLUDED
