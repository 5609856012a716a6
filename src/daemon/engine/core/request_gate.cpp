//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "request_gate.hpp"

#include "netcfgd/model/error.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

RequestGate::Ticket::Ticket(RequestGate& gate, const TicketId id)
    : gate_{&gate}
    , id_{id}
{
}

RequestGate::Ticket::Ticket(Ticket&& other) noexcept
    : gate_{other.gate_}
    , id_{other.id_}
{
    other.gate_ = nullptr;
}

RequestGate::Ticket& RequestGate::Ticket::operator=(Ticket&& other) noexcept
{
    if (this != &other)
    {
        release();
        gate_       = other.gate_;
        id_         = other.id_;
        other.gate_ = nullptr;
    }
    return *this;
}

RequestGate::Ticket::~Ticket()
{
    release();
}

void RequestGate::Ticket::release()
{
    if (gate_ != nullptr)
    {
        auto* const gate = gate_;
        gate_            = nullptr;
        gate->release(id_);
    }
}

RequestGate::RequestGate(libcyphal::IExecutor& executor, const std::size_t max_concurrent, const std::size_t max_queued)
    : max_concurrent_{std::max<std::size_t>(max_concurrent, 1)}
    , max_queued_{max_queued}
    , timers_{executor,
              [this](const TimerQueue::Key id) {
                  //
                  onTimeout(id);
              }}
    , deferred_{executor}
{
}

RequestGate::TicketId RequestGate::admit(const libcyphal::TimePoint deadline, AdmitResult::Handler handler)
{
    const auto id = ++last_id_;

    if ((active_ < max_concurrent_) && queue_.empty())
    {
        ++active_;
        entries_[id] = Entry{std::move(handler), true};
        deferred_.post([this, id] {
            //
            deliver(id);
        });
        return id;
    }

    if (queue_.size() >= max_queued_)
    {
        logger_->warn("Request is rejected - admission queue is full (active={}, queued={}).", active_, queue_.size());
        deferred_.post([handler = std::move(handler)]() {
            //
            handler(model::Error::make(model::ErrorKind::RequestTimeout, "Too many requests are queued."));
        });
        return id;
    }

    entries_[id] = Entry{std::move(handler), false};
    queue_.push_back(id);
    timers_.arm(id, deadline);
    logger_->debug("Request is queued (id={}, active={}, queued={}).", id, active_, queue_.size());
    return id;
}

void RequestGate::cancel(const TicketId id)
{
    const auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return;
    }

    const bool was_admitted = it->second.is_admitted;
    entries_.erase(it);
    if (was_admitted)
    {
        // Admitted, but the ticket hasn't been delivered yet.
        release(id);
        return;
    }

    timers_.disarm(id);
    queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
}

void RequestGate::release(const TicketId id)
{
    CETL_DEBUG_ASSERT(active_ > 0, "");
    logger_->trace("Request slot is released (id={}).", id);

    --active_;
    admitNext();
}

void RequestGate::admitNext()
{
    while ((active_ < max_concurrent_) && !queue_.empty())
    {
        const auto id = queue_.front();
        queue_.pop_front();
        timers_.disarm(id);

        const auto it = entries_.find(id);
        if (it == entries_.end())
        {
            continue;
        }
        it->second.is_admitted = true;
        ++active_;
        deferred_.post([this, id] {
            //
            deliver(id);
        });
    }
}

void RequestGate::deliver(const TicketId id)
{
    const auto it = entries_.find(id);
    if (it == entries_.end())
    {
        // Cancelled meanwhile.
        return;
    }

    auto handler = std::move(it->second.handler);
    entries_.erase(it);
    handler(Ticket{*this, id});
}

void RequestGate::onTimeout(const TicketId id)
{
    const auto it = entries_.find(id);
    if ((it == entries_.end()) || it->second.is_admitted)
    {
        return;
    }

    logger_->info("Queued request has timed out (id={}).", id);

    auto handler = std::move(it->second.handler);
    entries_.erase(it);
    queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
    handler(model::Error::make(model::ErrorKind::RequestTimeout, "Timed out waiting for admission."));
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
