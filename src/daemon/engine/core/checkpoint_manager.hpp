//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_CHECKPOINT_MANAGER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_CHECKPOINT_MANAGER_HPP_INCLUDED

#include "executor_helpers.hpp"
#include "logging.hpp"
#include "operation_dispatcher.hpp"
#include "plan.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
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

/// Owns checkpoints - pre-change state of the touched interfaces plus the list of applied operations.
///
/// Rollback is a compensation (saga): applied operations are reversed one by one, in reverse order,
/// through the same dispatcher the forward operations went through. A reversal failure doesn't stop
/// the rollback - the interface is reported as indeterminate, and the rest are still reversed.
///
/// Checkpoint life cycle:
/// ```
/// Open --arm--> Pending --commit--> Committed
///   |              |--rollback--> RolledBack
///   |              `--retention--> Expired
///   `--revert (executor failure)--> RolledBack
/// ```
/// Committed and expired checkpoints are remembered (without their data) for a while,
/// so that late requests get a meaningful error.
///
class CheckpointManager final
{
public:
    enum class Status : std::uint8_t
    {
        Open,
        Pending,
        Committed,
        RolledBack,
        Expired,

    };  // Status

    struct RevertResult final
    {
        std::vector<std::string> reverted;
        std::vector<std::string> indeterminate;

        using Handler = std::function<void(RevertResult&&)>;
    };

    struct CommitResult final
    {
        using Success = cetl::monostate;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct RollbackResult final
    {
        using Success = RevertResult;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    static constexpr std::size_t MaxTombstones = 1024;

    CheckpointManager(libcyphal::IExecutor&     executor,
                      OperationDispatcher&      dispatcher,
                      const libcyphal::Duration retention);

    CheckpointManager(const CheckpointManager&)                = delete;
    CheckpointManager(CheckpointManager&&) noexcept            = delete;
    CheckpointManager& operator=(const CheckpointManager&)     = delete;
    CheckpointManager& operator=(CheckpointManager&&) noexcept = delete;

    ~CheckpointManager() = default;

    /// Opens a new checkpoint, capturing the plan's snapshot as the pre-change state.
    ///
    /// Must be called before the first operation of the plan is dispatched.
    ///
    CETL_NODISCARD model::CheckpointId open(const Plan& plan);

    /// Records a successfully applied operation (so it will be reversed on rollback).
    ///
    void recordApplied(const model::CheckpointId id, const model::Operation& operation);

    /// Records an operation which has failed but may have left a partial change behind.
    ///
    /// It is reversed on rollback as if it was applied. Its inverse carries the full prior values,
    /// so reversal of an operation which has changed nothing is harmless.
    ///
    void recordAttempted(const model::CheckpointId id, const model::Operation& operation);

    /// Makes an open checkpoint pending - it waits for commit or rollback until the retention window elapses.
    ///
    void arm(const model::CheckpointId id);

    /// Marks pending checkpoint as committed. Committing an already committed one is a no-op.
    ///
    CETL_NODISCARD CommitResult::Var commit(const model::CheckpointId id);

    /// Rolls back a pending checkpoint.
    ///
    /// The handler is called exactly once, never from within this call.
    /// Fails with `CheckpointExpired` if the retention window has elapsed,
    /// and with `InvalidRequest` for unknown, committed or already rolled back checkpoints.
    ///
    void rollback(const model::CheckpointId id, RollbackResult::Handler handler);

    /// Reverts an open (or pending) checkpoint. Used by the executor when a plan fails.
    ///
    void revert(const model::CheckpointId id, RevertResult::Handler handler);

    CETL_NODISCARD cetl::optional<Status> statusOf(const model::CheckpointId id) const;

    /// Interfaces touched by the checkpoint's plan (empty if the checkpoint data is gone).
    ///
    CETL_NODISCARD std::vector<std::string> touchedInterfaces(const model::CheckpointId id) const;

    /// Pre-change state captured by `open` (nullptr if the checkpoint data is gone).
    ///
    CETL_NODISCARD const model::UnifiedSnapshot* preState(const model::CheckpointId id) const;

private:
    struct Checkpoint final
    {
        Status                   status{Status::Open};
        libcyphal::TimePoint     created_at;
        bool                     is_reverting{false};
        std::vector<std::string> touched;
        model::UnifiedSnapshot   pre_state;

        std::vector<model::Operation> applied;
    };

    class Reverting;

    void onExpired(const model::CheckpointId id);
    void retire(const model::CheckpointId id, const Status status);
    void finishRevert(const model::CheckpointId id, RevertResult&& result, RevertResult::Handler handler);

    static model::Operation inverseOf(const model::Operation& operation);

    libcyphal::IExecutor&                     executor_;
    OperationDispatcher&                      dispatcher_;
    const libcyphal::Duration                 retention_;
    model::CheckpointId                       last_id_{0};
    std::map<model::CheckpointId, Checkpoint> checkpoints_;
    std::map<model::CheckpointId, Status>     tombstones_;
    std::deque<model::CheckpointId>           tombstones_order_;
    TimerQueue                                timers_;
    Deferred                                  deferred_;
    common::LoggerPtr                         logger_{common::getLogger(common::logger_names::Core)};

};  // CheckpointManager

inline const char* toString(const CheckpointManager::Status status)
{
    switch (status)
    {
    case CheckpointManager::Status::Open:
        return "open";
    case CheckpointManager::Status::Pending:
        return "pending";
    case CheckpointManager::Status::Committed:
        return "committed";
    case CheckpointManager::Status::RolledBack:
        return "rolled back";
    case CheckpointManager::Status::Expired:
        return "expired";
    }
    return "unknown";
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_CHECKPOINT_MANAGER_HPP_INCLUDED
