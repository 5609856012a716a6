//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_REQUEST_SERIALIZER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_REQUEST_SERIALIZER_HPP_INCLUDED

#include "executor_helpers.hpp"
#include "logging.hpp"
#include "scope.hpp"

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
#include <set>
#include <string>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Per-interface resource locks with a multi-granularity root resource.
///
/// The root resource has an empty name (so it sorts first). Resources of a request are acquired
/// one by one in ascending name order, which makes deadlocks between requests impossible.
/// Waiters of a resource are served FIFO - a newcomer never overtakes a compatible waiter.
///
class RequestSerializer final
{
public:
    using RequestId = std::uint64_t;

    enum class LockMode : std::uint8_t
    {
        IntentShared,
        IntentExclusive,
        Shared,
        Exclusive,

    };  // LockMode

    struct LockRequest final
    {
        std::string resource;
        LockMode    mode;
    };

    /// RAII holder of granted locks - they are released on destruction (or explicit `release`).
    ///
    class Lease final
    {
    public:
        Lease() = default;
        Lease(RequestSerializer& serializer, const RequestId id);

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        ~Lease();

        bool isValid() const
        {
            return serializer_ != nullptr;
        }

        void release();

    private:
        RequestSerializer* serializer_{nullptr};
        RequestId          id_{0};

    };  // Lease

    struct AcquireResult final
    {
        using Success = Lease;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    static constexpr const char* RootResource = "";

    explicit RequestSerializer(libcyphal::IExecutor& executor);

    RequestSerializer(const RequestSerializer&)                = delete;
    RequestSerializer(RequestSerializer&&) noexcept            = delete;
    RequestSerializer& operator=(const RequestSerializer&)     = delete;
    RequestSerializer& operator=(RequestSerializer&&) noexcept = delete;

    ~RequestSerializer() = default;

    static bool areCompatible(const LockMode held, const LockMode requested);

    /// "all" takes the root shared; otherwise the root intent-shared plus each interface shared.
    static std::vector<LockRequest> forQuery(const Scope& scope);

    /// The root intent-exclusive plus each interface exclusive.
    static std::vector<LockRequest> forApply(const std::set<std::string>& names);

    /// "all" takes the root exclusive; otherwise the same as `forApply` of the scope names.
    static std::vector<LockRequest> forApply(const Scope& scope);

    /// Starts acquisition of the given locks.
    ///
    /// The handler is called exactly once (never from within this call, and never after `cancel`) with either
    /// the lease or `RequestTimeout` if the deadline has come first - in the latter case nothing stays held.
    ///
    CETL_NODISCARD RequestId acquire(std::vector<LockRequest> locks,
                                     const libcyphal::TimePoint deadline,
                                     AcquireResult::Handler     handler);

    /// Abandons a request which is still waiting (or whose lease hasn't been delivered yet).
    ///
    void cancel(const RequestId id);

    CETL_NODISCARD std::size_t waitingCount() const;
    CETL_NODISCARD bool        isIdle() const;

private:
    struct Request final
    {
        std::vector<LockRequest> locks;
        std::size_t              acquired{0};
        bool                     is_granted{false};
        AcquireResult::Handler   handler;
    };

    struct Resource final
    {
        std::map<RequestId, LockMode> holders;
        std::deque<RequestId>         waiters;
    };

    static LockMode strongest(const LockMode lhs, const LockMode rhs);

    bool canGrant(const Resource& resource, const LockMode mode) const;
    void advance(const RequestId id);
    void pump(const std::string& resource_name);
    void release(const RequestId id);
    void onTimeout(const RequestId id);

    RequestId                       last_id_{0};
    std::map<RequestId, Request>    requests_;
    std::map<std::string, Resource> resources_;
    TimerQueue                      timers_;
    Deferred                        deferred_;
    common::LoggerPtr               logger_{common::getLogger(common::logger_names::Core)};

};  // RequestSerializer

inline const char* toString(const RequestSerializer::LockMode mode)
{
    switch (mode)
    {
    case RequestSerializer::LockMode::IntentShared:
        return "IS";
    case RequestSerializer::LockMode::IntentExclusive:
        return "IX";
    case RequestSerializer::LockMode::Shared:
        return "S";
    case RequestSerializer::LockMode::Exclusive:
        return "X";
    }
    return "?";
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_REQUEST_SERIALIZER_HPP_INCLUDED
