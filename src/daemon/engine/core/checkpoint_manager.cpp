//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "checkpoint_manager.hpp"

#include "operation_dispatcher.hpp"
#include "plan.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"
#include "netcfgd/model/property.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstddef>
#include <memory>
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

constexpr std::size_t CheckpointManager::MaxTombstones;

/// Reverses applied operations one at a time.
///
class CheckpointManager::Reverting final : public std::enable_shared_from_this<Reverting>
{
public:
    Reverting(CheckpointManager&              manager,
              const model::CheckpointId       id,
              std::vector<model::Operation>&& inverse_ops,
              RevertResult::Handler&&         handler)
        : manager_{manager}
        , id_{id}
        , inverse_ops_{std::move(inverse_ops)}
        , handler_{std::move(handler)}
    {
    }

    void start()
    {
        for (const auto& op : inverse_ops_)
        {
            touched_.insert(op.interface);
        }
        next();
    }

private:
    void next()
    {
        if (index_ == inverse_ops_.size())
        {
            finish();
            return;
        }

        const auto& op = inverse_ops_[index_];
        manager_.dispatcher_.dispatch(op, [self = shared_from_this()](auto&& result) {
            //
            self->onDispatched(std::forward<decltype(result)>(result));
        });
    }

    void onDispatched(OperationDispatcher::DispatchResult::Var&& result)
    {
        const auto& op = inverse_ops_[index_];
        if (const auto* const failure = cetl::get_if<OperationDispatcher::DispatchResult::Failure>(&result))
        {
            manager_.logger_->error("Failed to revert op (cp_id={}, iface='{}', kind={}, target='{}'): {}",
                                    id_,
                                    op.interface,
                                    model::toString(op.kind),
                                    op.plugin,
                                    failure->message);
            indeterminate_.insert(op.interface);
        }

        ++index_;
        next();
    }

    void finish()
    {
        RevertResult result;
        for (const auto& name : touched_)
        {
            if (indeterminate_.find(name) == indeterminate_.end())
            {
                result.reverted.push_back(name);
            }
        }
        result.indeterminate.assign(indeterminate_.cbegin(), indeterminate_.cend());

        auto handler = std::move(handler_);
        manager_.finishRevert(id_, std::move(result), std::move(handler));
    }

    CheckpointManager&            manager_;
    const model::CheckpointId     id_;
    std::vector<model::Operation> inverse_ops_;
    RevertResult::Handler         handler_;
    std::size_t                   index_{0};
    std::set<std::string>         touched_;
    std::set<std::string>         indeterminate_;

};  // Reverting

CheckpointManager::CheckpointManager(libcyphal::IExecutor&     executor,
                                     OperationDispatcher&      dispatcher,
                                     const libcyphal::Duration retention)
    : executor_{executor}
    , dispatcher_{dispatcher}
    , retention_{retention}
    , timers_{executor,
              [this](const TimerQueue::Key id) {
                  //
                  onExpired(id);
              }}
    , deferred_{executor}
{
}

model::CheckpointId CheckpointManager::open(const Plan& plan)
{
    const auto id = ++last_id_;

    Checkpoint checkpoint;
    checkpoint.created_at = executor_.now();
    checkpoint.touched    = plan.touchedInterfaces();
    checkpoint.pre_state  = plan.snapshot;
    checkpoints_.emplace(id, std::move(checkpoint));

    logger_->debug("Checkpoint opened (cp_id={}, ops={}).", id, plan.operations.size());
    return id;
}

void CheckpointManager::recordApplied(const model::CheckpointId id, const model::Operation& operation)
{
    const auto it = checkpoints_.find(id);
    if ((it == checkpoints_.end()) || (it->second.status != Status::Open))
    {
        logger_->error("Can't record op on checkpoint (cp_id={}, op_id={}).", id, operation.id);
        return;
    }
    it->second.applied.push_back(operation);
}

void CheckpointManager::recordAttempted(const model::CheckpointId id, const model::Operation& operation)
{
    logger_->debug("Recording partially applied op (cp_id={}, op_id={}, iface='{}').",
                   id,
                   operation.id,
                   operation.interface);
    recordApplied(id, operation);
}

void CheckpointManager::arm(const model::CheckpointId id)
{
    const auto it = checkpoints_.find(id);
    if ((it == checkpoints_.end()) || (it->second.status != Status::Open))
    {
        logger_->error("Can't arm checkpoint (cp_id={}).", id);
        return;
    }

    it->second.status = Status::Pending;
    timers_.arm(id, executor_.now() + retention_);
    logger_->info("Checkpoint is pending (cp_id={}, ops={}).", id, it->second.applied.size());
}

CheckpointManager::CommitResult::Var CheckpointManager::commit(const model::CheckpointId id)
{
    const auto it = checkpoints_.find(id);
    if (it != checkpoints_.end())
    {
        auto& checkpoint = it->second;
        if ((checkpoint.status == Status::Open) || checkpoint.is_reverting)
        {
            return model::Error::make(model::ErrorKind::InvalidRequest,
                                      "Checkpoint " + std::to_string(id) + " is still in progress.",
                                      checkpoint.touched);
        }
        if (checkpoint.status == Status::Pending)
        {
            // Committed data is kept for the retention window (for audit), and then purged.
            checkpoint.status = Status::Committed;
            checkpoint.applied.clear();
            timers_.arm(id, executor_.now() + retention_);
            logger_->info("Checkpoint committed (cp_id={}).", id);
        }
        return cetl::monostate{};
    }

    const auto tomb_it = tombstones_.find(id);
    if (tomb_it != tombstones_.end())
    {
        switch (tomb_it->second)
        {
        case Status::Committed:
            return cetl::monostate{};
        case Status::Expired:
            return model::Error::make(model::ErrorKind::CheckpointExpired,
                                      "Checkpoint " + std::to_string(id) + " has expired.");
        default:
            return model::Error::make(model::ErrorKind::InvalidRequest,
                                      "Checkpoint " + std::to_string(id) + " is " + toString(tomb_it->second) + ".");
        }
    }

    return model::Error::make(model::ErrorKind::InvalidRequest, "Unknown checkpoint " + std::to_string(id) + ".");
}

void CheckpointManager::rollback(const model::CheckpointId id, RollbackResult::Handler handler)
{
    const auto fail = [this, &handler](model::Error&& error) {
        //
        logger_->info("Rollback request rejected: {}", error.message);
        deferred_.post([handler = std::move(handler), error = std::move(error)]() mutable {
            //
            handler(std::move(error));
        });
    };

    const auto it = checkpoints_.find(id);
    if (it != checkpoints_.end())
    {
        const auto& checkpoint = it->second;
        if ((checkpoint.status != Status::Pending) || checkpoint.is_reverting)
        {
            fail(model::Error::make(model::ErrorKind::InvalidRequest,
                                    "Checkpoint " + std::to_string(id) + " is " +
                                        (checkpoint.is_reverting ? "being rolled back" : toString(checkpoint.status)) +
                                        ".",
                                    checkpoint.touched));
            return;
        }

        revert(id, [handler = std::move(handler)](RevertResult&& result) {
            //
            handler(std::move(result));
        });
        return;
    }

    const auto tomb_it = tombstones_.find(id);
    if (tomb_it != tombstones_.end())
    {
        if (tomb_it->second == Status::Expired)
        {
            fail(model::Error::make(model::ErrorKind::CheckpointExpired,
                                    "Checkpoint " + std::to_string(id) +
                                        " has expired - the last applied state is left as is."));
            return;
        }
        fail(model::Error::make(model::ErrorKind::InvalidRequest,
                                "Checkpoint " + std::to_string(id) + " is " + toString(tomb_it->second) + "."));
        return;
    }

    fail(model::Error::make(model::ErrorKind::InvalidRequest, "Unknown checkpoint " + std::to_string(id) + "."));
}

void CheckpointManager::revert(const model::CheckpointId id, RevertResult::Handler handler)
{
    const auto it = checkpoints_.find(id);
    if ((it == checkpoints_.end()) || it->second.is_reverting ||
        ((it->second.status != Status::Open) && (it->second.status != Status::Pending)))
    {
        logger_->error("Can't revert checkpoint (cp_id={}).", id);
        deferred_.post([handler = std::move(handler)]() {
            //
            handler(RevertResult{});
        });
        return;
    }

    auto& checkpoint        = it->second;
    checkpoint.is_reverting = true;
    timers_.disarm(id);

    std::vector<model::Operation> inverse_ops;
    inverse_ops.reserve(checkpoint.applied.size());
    for (auto op_it = checkpoint.applied.crbegin(); op_it != checkpoint.applied.crend(); ++op_it)
    {
        inverse_ops.push_back(inverseOf(*op_it));
    }
    logger_->info("Reverting checkpoint (cp_id={}, ops={}).", id, inverse_ops.size());

    auto reverting = std::make_shared<Reverting>(*this, id, std::move(inverse_ops), std::move(handler));
    reverting->start();
}

cetl::optional<CheckpointManager::Status> CheckpointManager::statusOf(const model::CheckpointId id) const
{
    const auto it = checkpoints_.find(id);
    if (it != checkpoints_.end())
    {
        return it->second.status;
    }
    const auto tomb_it = tombstones_.find(id);
    if (tomb_it != tombstones_.end())
    {
        return tomb_it->second;
    }
    return cetl::nullopt;
}

std::vector<std::string> CheckpointManager::touchedInterfaces(const model::CheckpointId id) const
{
    const auto it = checkpoints_.find(id);
    return (it != checkpoints_.end()) ? it->second.touched : std::vector<std::string>{};
}

const model::UnifiedSnapshot* CheckpointManager::preState(const model::CheckpointId id) const
{
    const auto it = checkpoints_.find(id);
    return (it != checkpoints_.end()) ? &it->second.pre_state : nullptr;
}

void CheckpointManager::onExpired(const model::CheckpointId id)
{
    const auto it = checkpoints_.find(id);
    if (it == checkpoints_.end())
    {
        return;
    }

    switch (it->second.status)
    {
    case Status::Pending: {
        std::string touched;
        for (const auto& name : it->second.touched)
        {
            touched += touched.empty() ? name : (", " + name);
        }
        logger_->warn("Checkpoint has expired without commit or rollback (cp_id={}, ifaces=[{}]).", id, touched);
        retire(id, Status::Expired);
        break;
    }
    case Status::Committed:
        logger_->debug("Committed checkpoint is purged (cp_id={}).", id);
        retire(id, Status::Committed);
        break;
    default:
        break;
    }
}

void CheckpointManager::retire(const model::CheckpointId id, const Status status)
{
    timers_.disarm(id);
    checkpoints_.erase(id);

    tombstones_[id] = status;
    tombstones_order_.push_back(id);
    while (tombstones_order_.size() > MaxTombstones)
    {
        tombstones_.erase(tombstones_order_.front());
        tombstones_order_.pop_front();
    }
}

void CheckpointManager::finishRevert(const model::CheckpointId id,
                                     RevertResult&&            result,
                                     RevertResult::Handler     handler)
{
    if (result.indeterminate.empty())
    {
        logger_->info("Checkpoint is rolled back (cp_id={}, reverted={}).", id, result.reverted.size());
    }
    else
    {
        logger_->error("Checkpoint rollback is incomplete (cp_id={}, reverted={}, indeterminate={}).",
                       id,
                       result.reverted.size(),
                       result.indeterminate.size());
    }
    retire(id, Status::RolledBack);

    // Nothing might have been dispatched at all, so the handler is deferred.
    deferred_.post([handler = std::move(handler), result = std::move(result)]() mutable {
        //
        handler(std::move(result));
    });
}

model::Operation CheckpointManager::inverseOf(const model::Operation& operation)
{
    model::Operation inverse{operation};
    inverse.predecessors.clear();
    inverse.previous = operation.desired;

    switch (operation.kind)
    {
    case model::OperationKind::Create:
        inverse.kind    = model::OperationKind::Delete;
        inverse.desired = {{model::property::State, std::string{model::property::StateAbsent}}};
        break;
    case model::OperationKind::Delete:
        inverse.kind    = model::OperationKind::Create;
        inverse.desired = operation.previous;
        break;
    case model::OperationKind::Modify:
        inverse.desired = operation.previous;
        break;
    }
    return inverse;
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
