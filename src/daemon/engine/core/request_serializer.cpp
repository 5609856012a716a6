//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "request_serializer.hpp"

#include "scope.hpp"

#include "netcfgd/model/error.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <string>
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

constexpr const char* RequestSerializer::RootResource;

RequestSerializer::Lease::Lease(RequestSerializer& serializer, const RequestId id)
    : serializer_{&serializer}
    , id_{id}
{
}

RequestSerializer::Lease::Lease(Lease&& other) noexcept
    : serializer_{other.serializer_}
    , id_{other.id_}
{
    other.serializer_ = nullptr;
}

RequestSerializer::Lease& RequestSerializer::Lease::operator=(Lease&& other) noexcept
{
    if (this != &other)
    {
        release();
        serializer_       = other.serializer_;
        id_               = other.id_;
        other.serializer_ = nullptr;
    }
    return *this;
}

RequestSerializer::Lease::~Lease()
{
    release();
}

void RequestSerializer::Lease::release()
{
    if (serializer_ != nullptr)
    {
        auto* const serializer = serializer_;
        serializer_            = nullptr;
        serializer->release(id_);
    }
}

RequestSerializer::RequestSerializer(libcyphal::IExecutor& executor)
    : timers_{executor,
              [this](const TimerQueue::Key id) {
                  //
                  onTimeout(id);
              }}
    , deferred_{executor}
{
}

bool RequestSerializer::areCompatible(const LockMode held, const LockMode requested)
{
    switch (held)
    {
    case LockMode::IntentShared:
        return requested != LockMode::Exclusive;
    case LockMode::IntentExclusive:
        return (requested == LockMode::IntentShared) || (requested == LockMode::IntentExclusive);
    case LockMode::Shared:
        return (requested == LockMode::IntentShared) || (requested == LockMode::Shared);
    case LockMode::Exclusive:
        return false;
    }
    return false;
}

RequestSerializer::LockMode RequestSerializer::strongest(const LockMode lhs, const LockMode rhs)
{
    if (lhs == rhs)
    {
        return lhs;
    }
    // Shared plus intent-exclusive has no mode of its own here, so it becomes exclusive.
    if (((lhs == LockMode::Shared) && (rhs == LockMode::IntentExclusive)) ||
        ((lhs == LockMode::IntentExclusive) && (rhs == LockMode::Shared)))
    {
        return LockMode::Exclusive;
    }
    return std::max(lhs, rhs);
}

std::vector<RequestSerializer::LockRequest> RequestSerializer::forQuery(const Scope& scope)
{
    if (scope.isAll())
    {
        return {{RootResource, LockMode::Shared}};
    }

    std::vector<LockRequest> locks{{RootResource, LockMode::IntentShared}};
    for (const auto& name : scope.names())
    {
        locks.push_back({name, LockMode::Shared});
    }
    return locks;
}

std::vector<RequestSerializer::LockRequest> RequestSerializer::forApply(const std::set<std::string>& names)
{
    std::vector<LockRequest> locks{{RootResource, LockMode::IntentExclusive}};
    for (const auto& name : names)
    {
        locks.push_back({name, LockMode::Exclusive});
    }
    return locks;
}

std::vector<RequestSerializer::LockRequest> RequestSerializer::forApply(const Scope& scope)
{
    if (scope.isAll())
    {
        return {{RootResource, LockMode::Exclusive}};
    }
    return forApply(scope.names());
}

RequestSerializer::RequestId RequestSerializer::acquire(std::vector<LockRequest>   locks,
                                                        const libcyphal::TimePoint deadline,
                                                        AcquireResult::Handler     handler)
{
    // Sort by resource name and merge duplicates (keeping the strongest mode).
    std::map<std::string, LockMode> merged;
    for (const auto& lock : locks)
    {
        const auto it = merged.find(lock.resource);
        if (it == merged.end())
        {
            merged.emplace(lock.resource, lock.mode);
        }
        else
        {
            it->second = strongest(it->second, lock.mode);
        }
    }

    const auto id = ++last_id_;

    Request request;
    request.handler = std::move(handler);
    for (const auto& resource_mode : merged)
    {
        request.locks.push_back({resource_mode.first, resource_mode.second});
    }
    requests_.emplace(id, std::move(request));

    timers_.arm(id, deadline);
    advance(id);
    return id;
}

void RequestSerializer::cancel(const RequestId id)
{
    const auto it = requests_.find(id);
    if ((it != requests_.end()) && !it->second.handler)
    {
        // Already delivered - the lease owns it now.
        return;
    }
    if (it != requests_.end())
    {
        logger_->debug("Lock request is cancelled (req_id={}).", id);
        release(id);
    }
}

std::size_t RequestSerializer::waitingCount() const
{
    return static_cast<std::size_t>(std::count_if(requests_.cbegin(), requests_.cend(), [](const auto& id_request) {
        //
        return !id_request.second.is_granted;
    }));
}

bool RequestSerializer::isIdle() const
{
    return requests_.empty();
}

bool RequestSerializer::canGrant(const Resource& resource, const LockMode mode) const
{
    return std::all_of(resource.holders.cbegin(), resource.holders.cend(), [mode](const auto& holder) {
        //
        return areCompatible(holder.second, mode);
    });
}

void RequestSerializer::advance(const RequestId id)
{
    auto& request = requests_.at(id);
    while (request.acquired < request.locks.size())
    {
        const auto& lock     = request.locks[request.acquired];
        auto&       resource = resources_[lock.resource];

        const bool is_front = !resource.waiters.empty() && (resource.waiters.front() == id);
        if ((resource.waiters.empty() || is_front) && canGrant(resource, lock.mode))
        {
            if (is_front)
            {
                resource.waiters.pop_front();
            }
            resource.holders.emplace(id, lock.mode);
            ++request.acquired;
            continue;
        }

        if (!is_front && (std::find(resource.waiters.cbegin(), resource.waiters.cend(), id) == resource.waiters.cend()))
        {
            logger_->trace("Lock request waits (req_id={}, res='{}', mode={}).",  //
                           id,
                           lock.resource,
                           toString(lock.mode));
            resource.waiters.push_back(id);
        }
        return;
    }

    request.is_granted = true;
    timers_.disarm(id);
    logger_->trace("Lock request is granted (req_id={}, locks={}).", id, request.locks.size());

    deferred_.post([this, id] {
        //
        const auto it = requests_.find(id);
        if ((it == requests_.end()) || !it->second.handler)
        {
            return;
        }
        auto handler = std::move(it->second.handler);
        it->second.handler = nullptr;
        handler(Lease{*this, id});
    });
}

void RequestSerializer::pump(const std::string& resource_name)
{
    const auto res_it = resources_.find(resource_name);
    if (res_it == resources_.end())
    {
        return;
    }

    auto& resource = res_it->second;
    while (!resource.waiters.empty())
    {
        const auto front_id = resource.waiters.front();
        const auto& request = requests_.at(front_id);
        if (!canGrant(resource, request.locks[request.acquired].mode))
        {
            break;
        }
        // `advance` takes this resource (and pops the waiter), and continues with the next ones.
        advance(front_id);
    }

    if (resource.holders.empty() && resource.waiters.empty())
    {
        resources_.erase(res_it);
    }
}

void RequestSerializer::release(const RequestId id)
{
    const auto it = requests_.find(id);
    if (it == requests_.end())
    {
        return;
    }

    std::vector<std::string> touched;
    for (const auto& lock : it->second.locks)
    {
        const auto res_it = resources_.find(lock.resource);
        if (res_it == resources_.end())
        {
            continue;
        }
        auto& resource = res_it->second;
        resource.holders.erase(id);
        resource.waiters.erase(std::remove(resource.waiters.begin(), resource.waiters.end(), id),
                               resource.waiters.end());
        touched.push_back(lock.resource);
    }

    timers_.disarm(id);
    requests_.erase(it);

    for (const auto& resource_name : touched)
    {
        pump(resource_name);
    }
}

void RequestSerializer::onTimeout(const RequestId id)
{
    const auto it = requests_.find(id);
    if ((it == requests_.end()) || it->second.is_granted)
    {
        return;
    }

    logger_->debug("Lock request has timed out (req_id={}, acquired={}/{}).",
                   id,
                   it->second.acquired,
                   it->second.locks.size());

    auto handler = std::move(it->second.handler);
    release(id);
    if (handler)
    {
        handler(model::Error::make(model::ErrorKind::RequestTimeout, "Timed out waiting for interface locks."));
    }
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
