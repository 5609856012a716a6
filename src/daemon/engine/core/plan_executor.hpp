//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_PLAN_EXECUTOR_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_PLAN_EXECUTOR_HPP_INCLUDED

#include "checkpoint_manager.hpp"
#include "executor_helpers.hpp"
#include "logging.hpp"
#include "operation_dispatcher.hpp"
#include "plan.hpp"

#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/operation.hpp"

#include <libcyphal/executor.hpp>

#include <functional>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Runs a plan: `Planned -> Running -> {Committed | Applied, RolledBack, Failed}`.
///
/// Operations are dispatched one at a time, strictly in plan order. The first failure stops the run,
/// and whatever has been applied so far is reverted through the checkpoint.
/// Nothing is retried.
///
class PlanExecutor final
{
public:
    using Handler = std::function<void(model::ExecutionResult&&)>;

    PlanExecutor(libcyphal::IExecutor& executor, OperationDispatcher& dispatcher, CheckpointManager& checkpoints);

    PlanExecutor(const PlanExecutor&)                = delete;
    PlanExecutor(PlanExecutor&&) noexcept            = delete;
    PlanExecutor& operator=(const PlanExecutor&)     = delete;
    PlanExecutor& operator=(PlanExecutor&&) noexcept = delete;

    ~PlanExecutor() = default;

    /// Executes the plan. The handler is called exactly once, never from within this call.
    ///
    /// On success the run ends `Committed` if `auto_commit` is set, otherwise `Applied`
    /// (with the checkpoint left pending for an explicit commit or rollback).
    /// An empty plan is committed right away (without any checkpoint).
    ///
    void execute(Plan plan, const bool auto_commit, Handler handler);

private:
    class Run;

    OperationDispatcher& dispatcher_;
    CheckpointManager&   checkpoints_;
    Deferred             deferred_;
    common::LoggerPtr    logger_{common::getLogger(common::logger_names::Core)};

};  // PlanExecutor

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_PLAN_EXECUTOR_HPP_INCLUDED
