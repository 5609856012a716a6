//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_REQUEST_GATE_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_REQUEST_GATE_HPP_INCLUDED

#include "executor_helpers.hpp"
#include "logging.hpp"

#include "netcfgd/model/error.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Bounds the number of requests in the pipeline.
///
/// At most `max_concurrent` requests are admitted at once; up to `max_queued` more wait FIFO.
/// A request which doesn't fit into the queue, or whose deadline comes while it's queued,
/// is rejected with `RequestTimeout`.
///
class RequestGate final
{
public:
    using TicketId = std::uint64_t;

    /// RAII admission - frees the slot (and admits the next waiter) on destruction.
    ///
    class Ticket final
    {
    public:
        Ticket() = default;
        Ticket(RequestGate& gate, const TicketId id);

        Ticket(const Ticket&)            = delete;
        Ticket& operator=(const Ticket&) = delete;

        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& other) noexcept;

        ~Ticket();

        bool isValid() const
        {
            return gate_ != nullptr;
        }

        void release();

    private:
        RequestGate* gate_{nullptr};
        TicketId     id_{0};

    };  // Ticket

    struct AdmitResult final
    {
        using Success = Ticket;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    RequestGate(libcyphal::IExecutor& executor, const std::size_t max_concurrent, const std::size_t max_queued);

    RequestGate(const RequestGate&)                = delete;
    RequestGate(RequestGate&&) noexcept            = delete;
    RequestGate& operator=(const RequestGate&)     = delete;
    RequestGate& operator=(RequestGate&&) noexcept = delete;

    ~RequestGate() = default;

    /// The handler is called exactly once (never from within this call, and never after `cancel`).
    ///
    CETL_NODISCARD TicketId admit(const libcyphal::TimePoint deadline, AdmitResult::Handler handler);

    void cancel(const TicketId id);

    CETL_NODISCARD std::size_t activeCount() const
    {
        return active_;
    }

    CETL_NODISCARD std::size_t queuedCount() const
    {
        return queue_.size();
    }

private:
    struct Entry final
    {
        AdmitResult::Handler handler;
        bool                 is_admitted{false};
    };

    void release(const TicketId id);
    void admitNext();
    void deliver(const TicketId id);
    void onTimeout(const TicketId id);

    const std::size_t         max_concurrent_;
    const std::size_t         max_queued_;
    std::size_t               active_{0};
    TicketId                  last_id_{0};
    std::deque<TicketId>      queue_;
    std::map<TicketId, Entry> entries_;
    TimerQueue                timers_;
    Deferred                  deferred_;
    common::LoggerPtr         logger_{common::getLogger(common::logger_names::Core)};

};  // RequestGate

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_REQUEST_GATE_HPP_INCLUDED
