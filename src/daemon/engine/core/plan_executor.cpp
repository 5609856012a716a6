//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plan_executor.hpp"

#include "checkpoint_manager.hpp"
#include "operation_dispatcher.hpp"
#include "plan.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

class PlanExecutor::Run final : public std::enable_shared_from_this<Run>
{
public:
    Run(PlanExecutor& owner, Plan&& plan, const bool auto_commit, Handler&& handler)
        : owner_{owner}
        , plan_{std::move(plan)}
        , auto_commit_{auto_commit}
        , handler_{std::move(handler)}
    {
    }

    void start()
    {
        result_.state         = model::ExecutionState::Running;
        result_.checkpoint_id = owner_.checkpoints_.open(plan_);
        owner_.logger_->info("Executing plan (cp_id={}, ops={}, auto_commit={}).",
                             result_.checkpoint_id,
                             plan_.operations.size(),
                             auto_commit_);
        next();
    }

private:
    void next()
    {
        if (index_ == plan_.operations.size())
        {
            succeed();
            return;
        }

        owner_.dispatcher_.dispatch(plan_.operations[index_], [self = shared_from_this()](auto&& result) {
            //
            self->onDispatched(std::forward<decltype(result)>(result));
        });
    }

    void onDispatched(OperationDispatcher::DispatchResult::Var&& result)
    {
        const auto& op = plan_.operations[index_];
        if (auto* const failure = cetl::get_if<OperationDispatcher::DispatchResult::Failure>(&result))
        {
            owner_.logger_->warn("Op has failed (cp_id={}, op_id={}, iface='{}', kind={}, target='{}'): {}",
                                 result_.checkpoint_id,
                                 op.id,
                                 op.interface,
                                 model::toString(op.kind),
                                 op.plugin,
                                 failure->message);

            // A provider applies a configuration step by step, so a failure may leave some of it behind.
            if (op.targetsStateProvider())
            {
                owner_.checkpoints_.recordAttempted(result_.checkpoint_id, op);
            }
            fail(std::move(*failure));
            return;
        }

        owner_.checkpoints_.recordApplied(result_.checkpoint_id, op);
        ++index_;
        next();
    }

    void succeed()
    {
        if (auto_commit_)
        {
            owner_.checkpoints_.arm(result_.checkpoint_id);
            const auto committed = owner_.checkpoints_.commit(result_.checkpoint_id);
            if (const auto* const failure = cetl::get_if<CheckpointManager::CommitResult::Failure>(&committed))
            {
                owner_.logger_->error("Can't commit checkpoint (cp_id={}): {}",
                                      result_.checkpoint_id,
                                      failure->message);
            }
            result_.state = model::ExecutionState::Committed;
        }
        else
        {
            owner_.checkpoints_.arm(result_.checkpoint_id);
            result_.state = model::ExecutionState::Applied;
        }

        owner_.logger_->info("Plan is {} (cp_id={}).", model::toString(result_.state), result_.checkpoint_id);
        handler_(std::move(result_));
    }

    void fail(model::Error&& error)
    {
        // Affected interfaces: everything applied so far plus the one which has failed.
        std::set<std::string> affected{error.interfaces.cbegin(), error.interfaces.cend()};
        for (std::size_t i = 0; i <= index_; ++i)
        {
            affected.insert(plan_.operations[i].interface);
        }
        error.interfaces.assign(affected.cbegin(), affected.cend());
        result_.error = std::move(error);

        owner_.checkpoints_.revert(result_.checkpoint_id,
                                   [self = shared_from_this()](CheckpointManager::RevertResult&& reverted) {
                                       //
                                       self->onReverted(std::move(reverted));
                                   });
    }

    void onReverted(CheckpointManager::RevertResult&& reverted)
    {
        result_.reverted      = std::move(reverted.reverted);
        result_.indeterminate = std::move(reverted.indeterminate);
        result_.state         = result_.indeterminate.empty() ? model::ExecutionState::RolledBack
                                                              : model::ExecutionState::Failed;

        owner_.logger_->info("Plan is {} (cp_id={}, reverted={}, indeterminate={}).",
                             model::toString(result_.state),
                             result_.checkpoint_id,
                             result_.reverted.size(),
                             result_.indeterminate.size());
        handler_(std::move(result_));
    }

    PlanExecutor&          owner_;
    Plan                   plan_;
    const bool             auto_commit_;
    Handler                handler_;
    std::size_t            index_{0};
    model::ExecutionResult result_;

};  // Run

PlanExecutor::PlanExecutor(libcyphal::IExecutor& executor,
                           OperationDispatcher&  dispatcher,
                           CheckpointManager&    checkpoints)
    : dispatcher_{dispatcher}
    , checkpoints_{checkpoints}
    , deferred_{executor}
{
}

void PlanExecutor::execute(Plan plan, const bool auto_commit, Handler handler)
{
    if (plan.operations.empty())
    {
        logger_->debug("Nothing to execute - plan is empty.");
        deferred_.post([handler = std::move(handler)]() {
            //
            model::ExecutionResult result;
            result.state = model::ExecutionState::Committed;
            handler(std::move(result));
        });
        return;
    }

    auto run = std::make_shared<Run>(*this, std::move(plan), auto_commit, std::move(handler));
    run->start();
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
