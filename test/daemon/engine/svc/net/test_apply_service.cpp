//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "svc/net/apply_service.hpp"

#include "common/ipc/gateway_mock.hpp"
#include "core/checkpoint_manager.hpp"
#include "model_dsdl.hpp"
#include "svc/net/apply_spec.hpp"
#include "svc/net/net_service_fixture.hpp"

#include "netcfgd/common/net/ExecutionResult_0_1.hpp"
#include "netcfgd/common/net/InterfaceTarget_0_1.hpp"
#include "netcfgd/common/net/Operation_0_1.hpp"
#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

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
using testing::Return;
using testing::SizeIs;
using testing::IsEmpty;
using testing::NotNull;
using testing::Contains;
using testing::DoDefault;
using testing::Optional;
using testing::StrictMock;
using testing::AnyNumber;
using testing::ElementsAre;
using testing::VariantWith;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestApplyService : public svc::net::NetServiceFixture
{
protected:
    using ApplySpec  = netcfgd::common::svc::net::ApplySpec;
    using Response   = ApplySpec::Response;
    using DsdlOp     = netcfgd::common::net::Operation_0_1;
    using DsdlResult = netcfgd::common::net::ExecutionResult_0_1;
    using DsdlTarget = netcfgd::common::net::InterfaceTarget_0_1;

    void SetUp() override
    {
        NetServiceFixture::SetUp();

        addKernelInterface("eth0", "ethernet", {{"mtu", std::int64_t{1500}}, {"state", std::string{"up"}}});
        addKernelInterface("eth1", "ethernet", {{"mtu", std::int64_t{1500}}, {"state", std::string{"down"}}});

        registerService<svc::net::ApplyService>();
    }

    ApplySpec::Request makeRequest(const std::vector<InterfaceTarget>& targets, const bool auto_commit = true)
    {
        ApplySpec::Request request{&mr_};
        request.auto_commit = auto_commit;
        for (const auto& target : targets)
        {
            DsdlTarget dsdl_target{&mr_};
            EXPECT_THAT(toDsdl(target, dsdl_target, mr_), 0);
            request.interfaces.push_back(std::move(dsdl_target));
        }
        return request;
    }

    /// Runs a complete apply request, and returns everything the client has received.
    std::vector<Response> applyAndSpin(const ApplySpec::Request& request)
    {
        std::vector<Response>   responses;
        StrictMock<GatewayMock> gateway_mock;
        collectResponses(gateway_mock, responses);
        EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
        EXPECT_CALL(gateway_mock, complete(0)).Times(1);
        EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

        openChannel<ApplySpec>(gateway_mock, request);
        scheduler_.spinFor(1s);
        return responses;
    }

    static std::vector<Operation> operationsOf(const std::vector<Response>& responses)
    {
        std::vector<Operation> operations;
        for (const auto& response : responses)
        {
            if (const auto* const op = cetl::get_if<DsdlOp>(&response.union_value))
            {
                operations.push_back(fromDsdl(*op));
            }
        }
        return operations;
    }

    static ExecutionResult resultOf(const std::vector<Response>& responses)
    {
        EXPECT_THAT(responses, testing::Not(IsEmpty()));
        if (responses.empty())
        {
            return {};
        }
        const auto* const result = cetl::get_if<DsdlResult>(&responses.back().union_value);
        EXPECT_THAT(result, NotNull());
        return (result != nullptr) ? fromDsdl(*result) : ExecutionResult{};
    }
};

// MARK: - Tests:

TEST_F(TestApplyService, apply_with_auto_commit)
{
    const auto responses = applyAndSpin(makeRequest({{"eth0", "", {{"mtu", std::int64_t{1400}}}}}));

    const auto operations = operationsOf(responses);
    ASSERT_THAT(operations, SizeIs(1));
    EXPECT_THAT(operations[0].id, 1U);
    EXPECT_THAT(operations[0].interface, "eth0");
    EXPECT_THAT(operations[0].kind, OperationKind::Modify);
    EXPECT_THAT(operations[0].desired.at("mtu"), VariantWith<std::int64_t>(1400));

    const auto result = resultOf(responses);
    EXPECT_THAT(result.state, ExecutionState::Committed);
    EXPECT_THAT(result.checkpoint_id, 1U);
    EXPECT_FALSE(result.error.has_value());

    EXPECT_THAT(kernel_.at("eth0").properties.at("mtu"), VariantWith<std::int64_t>(1400));
    EXPECT_THAT(kernel_.at("eth0").properties.at("state"), VariantWith<std::string>("up"));
    EXPECT_THAT(pipeline_.checkpoints().statusOf(1), Optional(core::CheckpointManager::Status::Committed));
}

TEST_F(TestApplyService, apply_without_auto_commit_leaves_checkpoint_pending)
{
    const auto responses = applyAndSpin(makeRequest({{"eth1", "", {{"state", std::string{"up"}}}}}, false));

    EXPECT_THAT(operationsOf(responses), SizeIs(1));

    const auto result = resultOf(responses);
    EXPECT_THAT(result.state, ExecutionState::Applied);
    EXPECT_THAT(result.checkpoint_id, 1U);
    EXPECT_THAT(pipeline_.checkpoints().statusOf(1), Optional(core::CheckpointManager::Status::Pending));
    EXPECT_THAT(pipeline_.checkpoints().touchedInterfaces(1), ElementsAre("eth1"));
}

TEST_F(TestApplyService, nothing_to_change)
{
    EXPECT_CALL(provider_mock_, applyState(_)).Times(0);

    const auto responses = applyAndSpin(makeRequest({{"eth0", "", {{"mtu", std::int64_t{1500}}}}}));

    EXPECT_THAT(operationsOf(responses), IsEmpty());
    const auto result = resultOf(responses);
    EXPECT_THAT(result.state, ExecutionState::Committed);
    EXPECT_THAT(result.checkpoint_id, 0U);
}

TEST_F(TestApplyService, planning_failure_changes_nothing)
{
    EXPECT_CALL(provider_mock_, applyState(_)).Times(0);

    const auto responses = applyAndSpin(makeRequest({{"wg0", "wireguard", {}}}));

    EXPECT_THAT(operationsOf(responses), IsEmpty());
    const auto result = resultOf(responses);
    EXPECT_THAT(result.state, ExecutionState::Planned);
    EXPECT_THAT(result.checkpoint_id, 0U);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(result.error->kind, ErrorKind::UnknownInterfaceType);
}

TEST_F(TestApplyService, failed_operation_rolls_back_whole_plan)
{
    EXPECT_CALL(provider_mock_, applyState(_)).Times(AnyNumber());
    EXPECT_CALL(provider_mock_, applyState(Field(&InterfaceState::name, "eth0")))
        .WillOnce(Return(Error::make(ErrorKind::OperationFailed, "device or resource busy", {"eth0"})))
        .WillRepeatedly(DoDefault());

    const auto responses = applyAndSpin(makeRequest({
        {"br0", "bridge", {{"state", std::string{"up"}}}},
        {"eth0", "", {{"controller", std::string{"br0"}}}},
    }));

    // The bridge has to exist before its port is attached.
    const auto operations = operationsOf(responses);
    ASSERT_THAT(operations, SizeIs(2));
    EXPECT_THAT(operations[0].interface, "br0");
    EXPECT_THAT(operations[0].kind, OperationKind::Create);
    EXPECT_THAT(operations[1].interface, "eth0");
    EXPECT_THAT(operations[1].predecessors, ElementsAre(1U));

    const auto result = resultOf(responses);
    EXPECT_THAT(result.state, ExecutionState::RolledBack);
    EXPECT_THAT(result.checkpoint_id, 1U);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(result.error->kind, ErrorKind::OperationFailed);
    EXPECT_THAT(result.error->interfaces, Contains("eth0"));
    EXPECT_THAT(result.reverted, ElementsAre("br0", "eth0"));
    EXPECT_THAT(result.indeterminate, IsEmpty());

    EXPECT_THAT(kernel_.count("br0"), 0U);
    EXPECT_THAT(kernel_.at("eth0").properties.count("controller"), 0U);
}

TEST_F(TestApplyService, deleting_bridge_detaches_its_unlisted_ports)
{
    addKernelInterface("br0", "bridge", {{"state", std::string{"up"}}});
    kernel_.at("eth1").properties["controller"] = std::string{"br0"};

    const auto responses = applyAndSpin(makeRequest({{"br0", "", {{"state", std::string{"absent"}}}}}, false));

    const auto operations = operationsOf(responses);
    ASSERT_THAT(operations, SizeIs(2));
    EXPECT_THAT(operations[0].interface, "eth1");
    EXPECT_THAT(operations[0].kind, OperationKind::Modify);
    EXPECT_THAT(operations[1].interface, "br0");
    EXPECT_THAT(operations[1].kind, OperationKind::Delete);
    EXPECT_THAT(operations[1].predecessors, ElementsAre(1U));

    const auto result = resultOf(responses);
    EXPECT_THAT(result.state, ExecutionState::Applied);
    EXPECT_THAT(kernel_.count("br0"), 0U);
    EXPECT_THAT(kernel_.at("eth1").properties.count("controller"), 0U);

    // The port is a part of the checkpoint, so rollback re-attaches it.
    EXPECT_THAT(pipeline_.checkpoints().touchedInterfaces(result.checkpoint_id), ElementsAre("br0", "eth1"));
    const auto* const pre_state = pipeline_.checkpoints().preState(result.checkpoint_id);
    ASSERT_THAT(pre_state, NotNull());
    EXPECT_THAT(pre_state->interfaces.at("eth1").properties.at("controller"), VariantWith<std::string>("br0"));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
