//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "svc/net/commit_service.hpp"
#include "svc/net/rollback_service.hpp"

#include "common/ipc/gateway_mock.hpp"
#include "core/checkpoint_manager.hpp"
#include "core/scope.hpp"
#include "core/unified_state_merger.hpp"
#include "model_dsdl.hpp"
#include "svc/net/apply_spec.hpp"
#include "svc/net/commit_spec.hpp"
#include "svc/net/net_service_fixture.hpp"
#include "svc/net/rollback_spec.hpp"
#include "svc/net/services.hpp"

#include "netcfgd/common/net/ExecutionResult_0_1.hpp"
#include "netcfgd/common/net/InterfaceTarget_0_1.hpp"
#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"
#include "netcfgd/model/property.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace netcfgd::daemon::engine;  // NOLINT This our main concern here in the unit tests.
using namespace netcfgd::model;           // NOLINT This our main concern here in the unit tests.

using netcfgd::common::fromDsdl;
using netcfgd::common::toDsdl;

using testing::_;
using testing::Field;
using testing::SizeIs;
using testing::IsEmpty;
using testing::NotNull;
using testing::Optional;
using testing::StrictMock;
using testing::ElementsAre;
using testing::VariantWith;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestCommitRollbackServices : public svc::net::NetServiceFixture
{
protected:
    using ApplySpec    = netcfgd::common::svc::net::ApplySpec;
    using CommitSpec   = netcfgd::common::svc::net::CommitSpec;
    using RollbackSpec = netcfgd::common::svc::net::RollbackSpec;
    using Status       = core::CheckpointManager::Status;

    void SetUp() override
    {
        NetServiceFixture::SetUp();

        addKernelInterface("eth0", "ethernet", {{"mtu", std::int64_t{1500}}, {"state", std::string{"up"}}});

        EXPECT_CALL(ipc_router_mock_, registerChannelFactoryByName(_)).Times(4);
        svc::net::registerAllServices(svc_context_);
    }

    /// Applies new MTU of `eth0` without committing it, and returns id of the pending checkpoint.
    CheckpointId applyPendingMtu(const std::int64_t mtu)
    {
        return applyPending({InterfaceTarget{"eth0", "", {{"mtu", mtu}}}});
    }

    CheckpointId applyPending(const std::vector<InterfaceTarget>& targets)
    {
        ApplySpec::Request request{&mr_};
        request.auto_commit = false;
        for (const auto& target : targets)
        {
            netcfgd::common::net::InterfaceTarget_0_1 dsdl_target{&mr_};
            EXPECT_THAT(toDsdl(target, dsdl_target, mr_), 0);
            request.interfaces.push_back(std::move(dsdl_target));
        }

        std::vector<ApplySpec::Response> responses;
        StrictMock<GatewayMock>          gateway_mock;
        collectResponses(gateway_mock, responses);
        EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
        EXPECT_CALL(gateway_mock, complete(0)).Times(1);
        EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

        openChannel<ApplySpec>(gateway_mock, request);
        scheduler_.spinFor(1s);

        // Operations first, then the result.
        EXPECT_THAT(responses, SizeIs(testing::Ge(2U)));
        const auto* const result = responses.empty()
                                       ? nullptr
                                       : cetl::get_if<netcfgd::common::net::ExecutionResult_0_1>(
                                             &responses.back().union_value);
        EXPECT_THAT(result, NotNull());
        if (result == nullptr)
        {
            return 0;
        }
        EXPECT_THAT(result->state, static_cast<std::uint8_t>(ExecutionState::Applied));
        return result->checkpoint_id;
    }

    cetl::optional<Error> commit(const CheckpointId checkpoint_id)
    {
        CommitSpec::Request request{&mr_};
        request.checkpoint_id = checkpoint_id;

        std::vector<CommitSpec::Response> responses;
        StrictMock<GatewayMock>           gateway_mock;
        collectResponses(gateway_mock, responses);
        EXPECT_CALL(gateway_mock, complete(0)).Times(1);
        EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

        openChannel<CommitSpec>(gateway_mock, request);

        EXPECT_THAT(responses, SizeIs(1));
        if (responses.empty() || responses[0].error.empty())
        {
            return cetl::nullopt;
        }
        return fromDsdl(responses[0].error[0]);
    }

    ExecutionResult rollback(const CheckpointId checkpoint_id)
    {
        RollbackSpec::Request request{&mr_};
        request.checkpoint_id = checkpoint_id;

        std::vector<RollbackSpec::Response> responses;
        StrictMock<GatewayMock>             gateway_mock;
        collectResponses(gateway_mock, responses);
        EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
        EXPECT_CALL(gateway_mock, complete(0)).Times(1);
        EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

        openChannel<RollbackSpec>(gateway_mock, request);
        scheduler_.spinFor(1s);

        EXPECT_THAT(responses, SizeIs(1));
        return responses.empty() ? ExecutionResult{} : fromDsdl(responses[0].result);
    }

    /// Unified view of all interfaces, as any query would see it.
    UnifiedSnapshot snapshot()
    {
        using QueryResult = core::UnifiedStateMerger::QueryResult;

        cetl::optional<QueryResult::Var> result;
        pipeline_.merger().query(core::Scope::all(), [&result](QueryResult::Var&& var) {
            //
            result = std::move(var);
        });
        scheduler_.spinFor(1s);

        EXPECT_TRUE(result.has_value());
        if (!result.has_value())
        {
            return {};
        }
        EXPECT_THAT(*result, VariantWith<QueryResult::Success>(_));
        auto* const success = cetl::get_if<QueryResult::Success>(&*result);
        return (success != nullptr) ? std::move(*success) : UnifiedSnapshot{};
    }

    /// Same interfaces, of the same types and with the same properties (kernel indices aside).
    static void expectSameInterfaces(const UnifiedSnapshot& actual, const UnifiedSnapshot& expected)
    {
        std::vector<std::string> actual_names;
        std::vector<std::string> expected_names;
        for (const auto& name_state : actual.interfaces)
        {
            actual_names.push_back(name_state.first);
        }
        for (const auto& name_state : expected.interfaces)
        {
            expected_names.push_back(name_state.first);
        }
        ASSERT_THAT(actual_names, testing::ContainerEq(expected_names));

        for (const auto& name_state : expected.interfaces)
        {
            const auto& name  = name_state.first;
            const auto& state = actual.interfaces.at(name);
            EXPECT_THAT(state.type, name_state.second.type) << name;
            EXPECT_THAT(state.properties.size(), name_state.second.properties.size()) << name;
            for (const auto& key_value : name_state.second.properties)
            {
                EXPECT_TRUE(isSameValue(findValue(state.properties, key_value.first), key_value.second))
                    << name << "." << key_value.first << " is not " << toString(key_value.second);
            }
        }
    }
};

// MARK: - Tests:

TEST_F(TestCommitRollbackServices, commit_pending_checkpoint)
{
    const auto cp_id = applyPendingMtu(9000);
    EXPECT_THAT(cp_id, 1U);
    EXPECT_THAT(pipeline_.checkpoints().statusOf(cp_id), Optional(Status::Pending));

    EXPECT_FALSE(commit(cp_id).has_value());
    EXPECT_THAT(pipeline_.checkpoints().statusOf(cp_id), Optional(Status::Committed));

    // Committing again is harmless.
    EXPECT_FALSE(commit(cp_id).has_value());

    EXPECT_THAT(kernel_.at("eth0").properties.at("mtu"), VariantWith<std::int64_t>(9000));
}

TEST_F(TestCommitRollbackServices, commit_of_unknown_checkpoint)
{
    const auto error = commit(42);
    ASSERT_TRUE(error.has_value());
    EXPECT_THAT(error->kind, ErrorKind::InvalidRequest);
}

TEST_F(TestCommitRollbackServices, rollback_pending_checkpoint)
{
    const auto cp_id = applyPendingMtu(9000);
    EXPECT_THAT(kernel_.at("eth0").properties.at("mtu"), VariantWith<std::int64_t>(9000));

    const auto result = rollback(cp_id);
    EXPECT_THAT(result.state, ExecutionState::RolledBack);
    EXPECT_THAT(result.checkpoint_id, cp_id);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_THAT(result.reverted, ElementsAre("eth0"));
    EXPECT_THAT(result.indeterminate, IsEmpty());

    EXPECT_THAT(kernel_.at("eth0").properties.at("mtu"), VariantWith<std::int64_t>(1500));
    EXPECT_THAT(pipeline_.checkpoints().statusOf(cp_id), Optional(Status::RolledBack));

    // Nothing to commit anymore.
    const auto error = commit(cp_id);
    ASSERT_TRUE(error.has_value());
    EXPECT_THAT(error->kind, ErrorKind::InvalidRequest);
}

TEST_F(TestCommitRollbackServices, rollback_restores_pre_apply_snapshot)
{
    addKernelInterface("br9", "bridge", {{"state", std::string{"up"}}});
    addKernelInterface("eth1",
                       "ethernet",
                       {{"mtu", std::int64_t{1500}}, {"state", std::string{"up"}}, {"controller", std::string{"br9"}}});
    addKernelInterface("dummy0", "dummy", {{"state", std::string{"up"}}});
    addKernelInterface(
        "dummy0.10",
        "vlan",
        {{"state", std::string{"down"}}, {"parent", std::string{"dummy0"}}, {"vlan_id", std::int64_t{10}}});

    const auto before = snapshot();
    ASSERT_THAT(before.interfaces, SizeIs(5));

    // Creates, modifies, attaches, detaches and deletes (with an unlisted child) all at once.
    const auto cp_id = applyPending({
        InterfaceTarget{"br0", "bridge", {{"state", std::string{"up"}}}},
        InterfaceTarget{"eth0", "", {{"mtu", std::int64_t{9000}}, {"controller", std::string{"br0"}}}},
        InterfaceTarget{"br9", "", {{"state", std::string{"absent"}}}},
        InterfaceTarget{"dummy0", "", {{"state", std::string{"absent"}}}},
    });
    ASSERT_THAT(cp_id, 1U);

    const auto during = snapshot();
    EXPECT_THAT(during.interfaces.count("br0"), 1U);
    EXPECT_THAT(during.interfaces.count("br9"), 0U);
    EXPECT_THAT(during.interfaces.count("dummy0"), 0U);
    EXPECT_THAT(during.interfaces.count("dummy0.10"), 0U);
    ASSERT_THAT(during.interfaces.count("eth1"), 1U);
    EXPECT_THAT(during.interfaces.at("eth1").properties.count("controller"), 0U);

    const auto result = rollback(cp_id);
    EXPECT_THAT(result.state, ExecutionState::RolledBack);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_THAT(result.reverted, ElementsAre("br0", "br9", "dummy0", "dummy0.10", "eth0", "eth1"));
    EXPECT_THAT(result.indeterminate, IsEmpty());

    expectSameInterfaces(snapshot(), before);
}

TEST_F(TestCommitRollbackServices, failed_reversal_is_indeterminate)
{
    const auto cp_id = applyPendingMtu(9000);

    EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "eth0")))
        .WillOnce(testing::Return(Error::make(ErrorKind::BackendUnavailable, "netlink is down")));

    const auto result = rollback(cp_id);
    EXPECT_THAT(result.state, ExecutionState::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(result.error->kind, ErrorKind::OperationFailed);
    EXPECT_THAT(result.reverted, IsEmpty());
    EXPECT_THAT(result.indeterminate, ElementsAre("eth0"));
}

TEST_F(TestCommitRollbackServices, rollback_of_committed_checkpoint)
{
    const auto cp_id = applyPendingMtu(9000);
    EXPECT_FALSE(commit(cp_id).has_value());

    const auto result = rollback(cp_id);
    EXPECT_THAT(result.state, ExecutionState::Committed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(result.error->kind, ErrorKind::InvalidRequest);

    EXPECT_THAT(kernel_.at("eth0").properties.at("mtu"), VariantWith<std::int64_t>(9000));
}

TEST_F(TestCommitRollbackServices, expired_checkpoint_keeps_applied_state)
{
    const auto cp_id = applyPendingMtu(9000);

    // Past the default retention.
    scheduler_.spinFor(61s);
    EXPECT_THAT(pipeline_.checkpoints().statusOf(cp_id), Optional(Status::Expired));

    const auto result = rollback(cp_id);
    EXPECT_THAT(result.state, ExecutionState::Applied);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(result.error->kind, ErrorKind::CheckpointExpired);

    const auto error = commit(cp_id);
    ASSERT_TRUE(error.has_value());
    EXPECT_THAT(error->kind, ErrorKind::CheckpointExpired);

    EXPECT_THAT(kernel_.at("eth0").properties.at("mtu"), VariantWith<std::int64_t>(9000));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
