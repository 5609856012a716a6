//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "core/plan_executor.hpp"

#include "core/checkpoint_manager.hpp"
#include "core/operation_dispatcher.hpp"
#include "core/plan.hpp"
#include "core/plugin_registry.hpp"
#include "core/plugin_session.hpp"
#include "core/plugin_session_mock.hpp"
#include "core/state_provider_adapter.hpp"
#include "core/state_provider_mock.hpp"
#include "virtual_time_scheduler.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace
{

using namespace netcfgd::daemon::engine::core;  // NOLINT This our main concern here in the unit tests.
using namespace netcfgd::model;                 // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Field;
using testing::Invoke;
using testing::Return;
using testing::IsEmpty;
using testing::Optional;
using testing::NiceMock;
using testing::StrictMock;
using testing::InSequence;
using testing::VariantWith;
using testing::ElementsAre;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestPlanExecutor : public testing::Test
{
protected:
    using Status = CheckpointManager::Status;

    void SetUp() override
    {
        ON_CALL(provider_mock_, supportsType(_)).WillByDefault(Return(true));
        ON_CALL(provider_mock_, supportsType("memo")).WillByDefault(Return(false));

        memo_ = std::make_shared<StrictMock<PluginSessionMock>>(1,
                                                                "memo",
                                                                PluginSession::Capabilities{{"memo"}, {"note"}});
        ASSERT_THAT(registry_.add(memo_), VariantWith<PluginRegistry::AddResult::Success>(_));
    }

    static Operation makeOp(const Operation::Id id,
                            const std::string&  iface,
                            const OperationKind kind,
                            const std::string&  plugin = {})
    {
        Operation op;
        op.id        = id;
        op.interface = iface;
        op.type      = plugin.empty() ? "dummy" : "memo";
        op.kind      = kind;
        op.plugin    = plugin;
        if (id > 1)
        {
            op.predecessors.push_back(id - 1);
        }
        return op;
    }

    cetl::optional<ExecutionResult> executeAndSpin(Plan plan, const bool auto_commit)
    {
        cetl::optional<ExecutionResult> result;
        executor_.execute(std::move(plan), auto_commit, [&result](ExecutionResult&& res) {
            //
            result = std::move(res);
        });
        EXPECT_FALSE(result.has_value());
        scheduler_.spinFor(10s);
        return result;
    }

    // NOLINTBEGIN
    netcfgd::VirtualTimeScheduler      scheduler_{};
    NiceMock<StateProviderMock>        provider_mock_;
    StateProviderAdapter               adapter_{scheduler_, provider_mock_, 1s};
    PluginRegistry                     registry_{[this](const std::string& type) {
        //
        return adapter_.supportsType(type);
    }};
    OperationDispatcher                dispatcher_{scheduler_, adapter_, registry_, 500ms};
    CheckpointManager                  checkpoints_{scheduler_, dispatcher_, 60s};
    PlanExecutor                       executor_{scheduler_, dispatcher_, checkpoints_};
    std::shared_ptr<PluginSessionMock> memo_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestPlanExecutor, empty_plan_is_committed)
{
    const auto result = executeAndSpin(Plan{}, false);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::Committed);
    EXPECT_THAT(result->checkpoint_id, 0U);
    EXPECT_FALSE(result->error.has_value());
}

TEST_F(TestPlanExecutor, auto_commit)
{
    Plan plan;
    plan.operations.push_back(makeOp(1, "dummy0", OperationKind::Create));
    plan.operations.push_back(makeOp(2, "memo0", OperationKind::Create, "memo"));

    PluginSession::ApplyResult::Handler memo_handler;
    {
        InSequence seq;

        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "dummy0")))
            .WillOnce(Return(cetl::monostate{}));
        EXPECT_CALL(*memo_, apply(OperationKind::Create, Field(&InterfaceTarget::name, "memo0"), Eq(500ms), _))
            .WillOnce(Invoke([&memo_handler](const auto, const auto&, const auto, auto handler) {
                //
                memo_handler = std::move(handler);
            }));
    }
    scheduler_.scheduleAt(2s, [&](const auto&) {
        //
        ASSERT_TRUE(memo_handler);
        memo_handler(cetl::monostate{});
    });

    const auto result = executeAndSpin(std::move(plan), true);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::Committed);
    EXPECT_THAT(result->checkpoint_id, 1U);
    EXPECT_FALSE(result->error.has_value());
    EXPECT_THAT(checkpoints_.statusOf(1), Optional(Status::Committed));
}

TEST_F(TestPlanExecutor, without_auto_commit_checkpoint_is_pending)
{
    Plan plan;
    plan.operations.push_back(makeOp(1, "dummy0", OperationKind::Create));

    EXPECT_CALL(provider_mock_, applyState(_)).WillOnce(Return(cetl::monostate{}));

    const auto result = executeAndSpin(std::move(plan), false);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::Applied);
    EXPECT_THAT(result->checkpoint_id, 1U);
    EXPECT_THAT(checkpoints_.statusOf(1), Optional(Status::Pending));
}

TEST_F(TestPlanExecutor, failure_rolls_back_applied_operations)
{
    Plan plan;
    plan.operations.push_back(makeOp(1, "dummy0", OperationKind::Create));
    plan.operations.push_back(makeOp(2, "memo0", OperationKind::Create, "memo"));
    plan.operations.push_back(makeOp(3, "dummy9", OperationKind::Create));

    PluginSession::ApplyResult::Handler memo_handler;
    {
        InSequence seq;

        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "dummy0")))
            .WillOnce(Return(cetl::monostate{}));
        EXPECT_CALL(*memo_, apply(OperationKind::Create, _, _, _))
            .WillOnce(Invoke([&memo_handler](const auto, const auto&, const auto, auto handler) {
                //
                memo_handler = std::move(handler);
            }));
        // Reverse of the `dummy0` creation.
        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "dummy0")))
            .WillOnce(Return(cetl::monostate{}));
    }
    scheduler_.scheduleAt(1s, [&](const auto&) {
        //
        ASSERT_TRUE(memo_handler);
        memo_handler(Error::make(ErrorKind::PluginTimeout, "no answer", {"memo0"}));
    });

    const auto result = executeAndSpin(std::move(plan), true);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::RolledBack);
    EXPECT_THAT(result->checkpoint_id, 1U);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_THAT(result->error->kind, ErrorKind::PluginTimeout);
    EXPECT_THAT(result->error->interfaces, ElementsAre("dummy0", "memo0"));
    EXPECT_THAT(result->reverted, ElementsAre("dummy0"));
    EXPECT_THAT(result->indeterminate, IsEmpty());
    EXPECT_THAT(checkpoints_.statusOf(1), Optional(Status::RolledBack));
}

TEST_F(TestPlanExecutor, failed_reversal_leaves_state_indeterminate)
{
    Plan plan;
    plan.operations.push_back(makeOp(1, "dummy0", OperationKind::Create));
    plan.operations.push_back(makeOp(2, "dummy1", OperationKind::Create));

    {
        InSequence seq;

        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "dummy0")))
            .WillOnce(Return(cetl::monostate{}));
        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "dummy1")))
            .WillOnce(Return(Error::make(ErrorKind::OperationFailed, "no such device", {"dummy1"})));
        // Whatever the failed creation has left behind is removed first.
        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "dummy1")))
            .WillOnce(Return(cetl::monostate{}));
        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "dummy0")))
            .WillOnce(Return(Error::make(ErrorKind::BackendUnavailable, "netlink is down")));
    }

    const auto result = executeAndSpin(std::move(plan), false);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::Failed);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_THAT(result->error->kind, ErrorKind::OperationFailed);
    EXPECT_THAT(result->reverted, ElementsAre("dummy1"));
    EXPECT_THAT(result->indeterminate, ElementsAre("dummy0"));
}

TEST_F(TestPlanExecutor, partially_applied_provider_operation_is_reverted)
{
    InterfaceState eth0;
    eth0.name       = "eth0";
    eth0.type       = "dummy";
    eth0.properties = {{"mtu", std::int64_t{1500}}, {"state", std::string{"up"}}};

    auto op     = makeOp(1, "eth0", OperationKind::Modify);
    op.desired  = {{"controller", std::string{"br0"}}, {"mtu", std::int64_t{99999}}};
    op.previous = {{"controller", cetl::monostate{}}, {"mtu", std::int64_t{1500}}};
    Plan plan;
    plan.operations.push_back(op);

    EXPECT_CALL(provider_mock_, getState(_)).WillRepeatedly(Invoke([&eth0](const auto&) {
        //
        return StateProvider::GetStateResult::Success{eth0};
    }));
    {
        InSequence seq;

        // The controller gets written, and then the MTU is rejected.
        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "eth0")))
            .WillOnce(Invoke([&eth0](const InterfaceState& desired) -> StateProvider::ApplyStateResult::Var {
                //
                eth0.properties["controller"] = findValue(desired.properties, "controller");
                return Error::make(ErrorKind::OperationFailed, "MTU is out of range", {"eth0"});
            }));
        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "eth0")))
            .WillOnce(Invoke([&eth0](const InterfaceState& desired) -> StateProvider::ApplyStateResult::Var {
                //
                eth0.properties = desired.properties;
                return cetl::monostate{};
            }));
    }

    const auto result = executeAndSpin(std::move(plan), true);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::RolledBack);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_THAT(result->error->kind, ErrorKind::OperationFailed);
    EXPECT_THAT(result->reverted, ElementsAre("eth0"));
    EXPECT_THAT(result->indeterminate, IsEmpty());

    EXPECT_THAT(eth0.properties.count("controller"), 0U);
    EXPECT_THAT(findValue(eth0.properties, "mtu"), VariantWith<std::int64_t>(1500));
    EXPECT_THAT(findString(eth0.properties, "state"), Optional(std::string{"up"}));
}

TEST_F(TestPlanExecutor, failed_restore_of_partially_applied_operation_is_indeterminate)
{
    InterfaceState eth0;
    eth0.name       = "eth0";
    eth0.type       = "dummy";
    eth0.properties = {{"mtu", std::int64_t{1500}}};

    auto op     = makeOp(1, "eth0", OperationKind::Modify);
    op.desired  = {{"controller", std::string{"br0"}}, {"mtu", std::int64_t{99999}}};
    op.previous = {{"controller", cetl::monostate{}}, {"mtu", std::int64_t{1500}}};
    Plan plan;
    plan.operations.push_back(op);

    EXPECT_CALL(provider_mock_, getState(_)).WillRepeatedly(Invoke([&eth0](const auto&) {
        //
        return StateProvider::GetStateResult::Success{eth0};
    }));
    {
        InSequence seq;

        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "eth0")))
            .WillOnce(Return(Error::make(ErrorKind::OperationFailed, "MTU is out of range", {"eth0"})));
        EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "eth0")))
            .WillOnce(Return(Error::make(ErrorKind::BackendUnavailable, "netlink is down")));
    }

    const auto result = executeAndSpin(std::move(plan), true);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::Failed);
    EXPECT_THAT(result->reverted, IsEmpty());
    EXPECT_THAT(result->indeterminate, ElementsAre("eth0"));
}

TEST_F(TestPlanExecutor, lost_plugin_fails_plan)
{
    registry_.remove(*memo_);

    Plan plan;
    plan.operations.push_back(makeOp(1, "memo0", OperationKind::Modify, "memo"));

    const auto result = executeAndSpin(std::move(plan), true);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->state, ExecutionState::RolledBack);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_THAT(result->error->kind, ErrorKind::PluginLost);
    EXPECT_THAT(result->error->interfaces, ElementsAre("memo0"));
    EXPECT_THAT(result->reverted, IsEmpty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
