//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin/session_service.hpp"

#include "common/ipc/gateway_mock.hpp"
#include "common/ipc/server_router_mock.hpp"
#include "core/plugin_registry.hpp"
#include "core/plugin_session.hpp"
#include "ipc/ipc_types.hpp"
#include "model_dsdl.hpp"
#include "svc/plugin/session_spec.hpp"
#include "tracking_memory_resource.hpp"
#include "virtual_time_scheduler.hpp"

#include "netcfgd/common/net/Interface_0_1.hpp"
#include "netcfgd/common/svc/plugin/ApplyRequest_0_1.hpp"
#include "netcfgd/common/svc/plugin/QueryRequest_0_1.hpp"
#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <uavcan/primitive/String_1_0.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace netcfgd::daemon::engine;  // NOLINT This our main concern here in the unit tests.
using namespace netcfgd::model;           // NOLINT This our main concern here in the unit tests.

using netcfgd::common::toDsdl;
using netcfgd::common::fillDsdlString;
using netcfgd::common::fromDsdlString;
using netcfgd::common::ipc::ErrorCode;

using testing::_;
using testing::Field;
using testing::IsNull;
using testing::SizeIs;
using testing::IsEmpty;
using testing::NotNull;
using testing::HasSubstr;
using testing::StrictMock;
using testing::ElementsAre;
using testing::VariantWith;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSessionService : public testing::Test
{
protected:
    using Spec        = netcfgd::common::svc::plugin::SessionSpec;
    using GatewayMock = netcfgd::common::ipc::detail::GatewayMock;
    using QueryResult = core::PluginSession::QueryResult;
    using ApplyResult = core::PluginSession::ApplyResult;

    void SetUp() override
    {
        cetl::pmr::set_default_resource(&mr_);

        EXPECT_CALL(ipc_router_mock_, registerChannelFactoryByName(Spec::svc_full_name())).WillOnce(testing::Return());
        plugin::SessionService::registerWithContext(context_);
    }

    void TearDown() override
    {
        EXPECT_THAT(registry_.sessions(), IsEmpty());
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    void openSession(GatewayMock& gateway_mock, const Spec::Up& first_msg)
    {
        ipc_router_mock_.openChannel(Spec::svc_full_name(), gateway_mock, first_msg);
    }

    Spec::Up makeRegistration(const std::string&              name,
                              const std::vector<std::string>& types,
                              const std::vector<std::string>& prefixes)
    {
        Spec::Up msg{&mr_};
        auto&    registration = msg.set_registration();
        registration.pid      = 4242;
        EXPECT_THAT(fillDsdlString(registration.name, name, 64), 0);
        for (const auto& type : types)
        {
            uavcan::primitive::String_1_0 str{&mr_};
            EXPECT_THAT(fillDsdlString(str.value, type, 64), 0);
            registration.interface_types.push_back(std::move(str));
        }
        for (const auto& prefix : prefixes)
        {
            uavcan::primitive::String_1_0 str{&mr_};
            EXPECT_THAT(fillDsdlString(str.value, prefix, 64), 0);
            registration.property_prefixes.push_back(std::move(str));
        }
        return msg;
    }

    /// Opens a session of the "memo" plugin, and returns it as it is seen by the registry.
    ///
    core::PluginSession::Ptr openMemoSession(GatewayMock& gateway_mock)
    {
        EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
        openSession(gateway_mock, makeRegistration("memo", {"memo"}, {"note"}));
        return registry_.findByName("memo");
    }

    void collectDowns(GatewayMock& gateway_mock, std::vector<Spec::Down>& downs)
    {
        gateway_mock.expectSentInto(mr_, downs);
    }

    /// Emulates arrival of a plugin reply.
    ///
    void reply(GatewayMock&                       gateway_mock,
               const std::uint64_t                request_id,
               const std::uint8_t                 status,
               const std::string&                 message,
               const std::vector<InterfaceState>& states = {})
    {
        Spec::Up msg{&mr_};
        auto&    reply_msg = msg.set_reply();
        reply_msg.request_id = request_id;
        reply_msg.status     = status;
        EXPECT_THAT(fillDsdlString(reply_msg.message, message, 255), 0);
        for (const auto& state : states)
        {
            netcfgd::common::net::Interface_0_1 iface{&mr_};
            EXPECT_THAT(toDsdl(state, iface, mr_), 0);
            reply_msg.interfaces.push_back(std::move(iface));
        }

        EXPECT_THAT(gateway_mock.emitMessage(msg), 0);
    }

    static void loseSession(GatewayMock& gateway_mock)
    {
        EXPECT_THAT(gateway_mock.emitCompleted(ErrorCode::Disconnected), 0);
    }

    // NOLINTBEGIN
    TrackingMemoryResource                                      mr_;
    VirtualTimeScheduler                                        scheduler_{};
    core::PluginRegistry                                        registry_{[](const std::string& type) {
        //
        return type == "ethernet";
    }};
    StrictMock<netcfgd::common::ipc::ServerRouterMock>          ipc_router_mock_{mr_};
    const plugin::SessionContext                                context_{mr_, scheduler_, ipc_router_mock_, registry_};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestSessionService, registration_registers_session)
{
    StrictMock<GatewayMock> gateway_mock;
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    const auto session = openMemoSession(gateway_mock);
    ASSERT_THAT(session, NotNull());
    EXPECT_THAT(session->name(), "memo");
    EXPECT_THAT(session->capabilities().interface_types, ElementsAre("memo"));
    EXPECT_THAT(session->capabilities().property_prefixes, ElementsAre("note"));
    EXPECT_THAT(registry_.findTypeOwner("memo"), session);
    EXPECT_THAT(registry_.findPropertyOwner("note.text"), session);

    // Once the plugin is gone, so is its session.
    loseSession(gateway_mock);
    EXPECT_THAT(registry_.sessions(), IsEmpty());
    EXPECT_THAT(registry_.findTypeOwner("memo"), IsNull());
}

TEST_F(TestSessionService, session_must_start_with_registration)
{
    StrictMock<GatewayMock> gateway_mock;
    EXPECT_CALL(gateway_mock, complete(EINVAL)).Times(1);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    Spec::Up msg{&mr_};
    auto&    reply_msg = msg.set_reply();
    reply_msg.request_id = 1;
    openSession(gateway_mock, msg);

    EXPECT_THAT(registry_.sessions(), IsEmpty());
}

TEST_F(TestSessionService, conflicting_registration_is_rejected)
{
    StrictMock<GatewayMock> gateway_mock;
    EXPECT_CALL(gateway_mock, complete(EEXIST)).Times(1);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    // Ethernet interfaces are owned by the state provider.
    openSession(gateway_mock, makeRegistration("greedy", {"ethernet"}, {}));

    EXPECT_THAT(registry_.sessions(), IsEmpty());
}

TEST_F(TestSessionService, query_is_answered_by_plugin)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Down> downs;
    collectDowns(gateway_mock, downs);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    auto session = openMemoSession(gateway_mock);
    ASSERT_THAT(session, NotNull());

    std::vector<QueryResult::Var> results;
    session->query(std::string{"memo0"}, 1s, [&results](QueryResult::Var&& result) {
        //
        results.push_back(std::move(result));
    });

    ASSERT_THAT(downs, SizeIs(1));
    const auto* const query_req = cetl::get_if<netcfgd::common::svc::plugin::QueryRequest_0_1>(&downs[0].union_value);
    ASSERT_THAT(query_req, NotNull());
    EXPECT_THAT(query_req->request_id, 1U);
    EXPECT_THAT(fromDsdlString(query_req->iface), "memo0");

    InterfaceState memo0;
    memo0.name       = "memo0";
    memo0.type       = "memo";
    memo0.properties = {{"note.text", std::string{"hello"}}};
    reply(gateway_mock, 1, Spec::Status::Success, "", {memo0});

    ASSERT_THAT(results, SizeIs(1));
    EXPECT_THAT(results[0],
                VariantWith<QueryResult::Success>(ElementsAre(Field(&InterfaceState::name, "memo0"))));

    // Replies nobody is waiting for are ignored.
    reply(gateway_mock, 1, Spec::Status::Success, "");
    reply(gateway_mock, 77, Spec::Status::Success, "");
    EXPECT_THAT(results, SizeIs(1));

    loseSession(gateway_mock);
    session.reset();
}

TEST_F(TestSessionService, failure_reply_of_apply)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Down> downs;
    collectDowns(gateway_mock, downs);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    auto session = openMemoSession(gateway_mock);
    ASSERT_THAT(session, NotNull());

    std::vector<ApplyResult::Var> results;
    const auto                    handler = [&results](ApplyResult::Var&& result) {
        //
        results.push_back(std::move(result));
    };
    const InterfaceTarget target{"memo0", "memo", {{"note.text", std::string{"hi"}}}};
    session->apply(OperationKind::Modify, target, 3s, handler);
    session->apply(OperationKind::Modify, target, 3s, handler);

    ASSERT_THAT(downs, SizeIs(2));
    const auto* const apply_req = cetl::get_if<netcfgd::common::svc::plugin::ApplyRequest_0_1>(&downs[1].union_value);
    ASSERT_THAT(apply_req, NotNull());
    EXPECT_THAT(apply_req->request_id, 2U);
    EXPECT_THAT(apply_req->timeout_us, 3000000U);
    EXPECT_THAT(apply_req->kind, static_cast<std::uint8_t>(OperationKind::Modify));

    reply(gateway_mock, 2, Spec::Status::Transient, "busy");
    reply(gateway_mock, 1, Spec::Status::Success, "");

    ASSERT_THAT(results, SizeIs(2));
    const auto* const failure = cetl::get_if<ApplyResult::Failure>(&results[0]);
    ASSERT_THAT(failure, NotNull());
    EXPECT_THAT(failure->kind, ErrorKind::OperationFailed);
    EXPECT_THAT(failure->message, HasSubstr("Transient"));
    EXPECT_THAT(failure->message, HasSubstr("busy"));
    EXPECT_THAT(failure->interfaces, ElementsAre("memo0"));
    EXPECT_THAT(results[1], VariantWith<ApplyResult::Success>(_));

    loseSession(gateway_mock);
    session.reset();
}

TEST_F(TestSessionService, silent_plugin_times_out)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Down> downs;
    collectDowns(gateway_mock, downs);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    auto session = openMemoSession(gateway_mock);
    ASSERT_THAT(session, NotNull());

    std::vector<QueryResult::Var> results;
    session->query(std::string{"memo0"}, 1s, [&results](QueryResult::Var&& result) {
        //
        results.push_back(std::move(result));
    });
    ASSERT_THAT(downs, SizeIs(1));

    scheduler_.spinFor(900ms);
    EXPECT_THAT(results, IsEmpty());

    scheduler_.spinFor(200ms);
    ASSERT_THAT(results, SizeIs(1));
    const auto* const failure = cetl::get_if<QueryResult::Failure>(&results[0]);
    ASSERT_THAT(failure, NotNull());
    EXPECT_THAT(failure->kind, ErrorKind::PluginTimeout);
    EXPECT_THAT(failure->interfaces, ElementsAre("memo0"));

    // Too late.
    reply(gateway_mock, 1, Spec::Status::Success, "");
    EXPECT_THAT(results, SizeIs(1));

    loseSession(gateway_mock);
    session.reset();
}

TEST_F(TestSessionService, lost_plugin_fails_its_requests)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Down> downs;
    collectDowns(gateway_mock, downs);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    auto session = openMemoSession(gateway_mock);
    ASSERT_THAT(session, NotNull());

    std::vector<QueryResult::Var> results;
    const auto                    handler = [&results](QueryResult::Var&& result) {
        //
        results.push_back(std::move(result));
    };
    session->query(cetl::nullopt, 1s, handler);
    ASSERT_THAT(downs, SizeIs(1));

    loseSession(gateway_mock);
    EXPECT_THAT(registry_.sessions(), IsEmpty());
    ASSERT_THAT(results, SizeIs(1));
    const auto* const failure = cetl::get_if<QueryResult::Failure>(&results[0]);
    ASSERT_THAT(failure, NotNull());
    EXPECT_THAT(failure->kind, ErrorKind::PluginLost);
    EXPECT_THAT(failure->interfaces, IsEmpty());

    // Nothing is sent to a lost plugin, and the failure is reported asynchronously.
    session->query(std::string{"memo1"}, 1s, handler);
    EXPECT_THAT(downs, SizeIs(1));
    EXPECT_THAT(results, SizeIs(1));

    scheduler_.spinFor(10ms);
    ASSERT_THAT(results, SizeIs(2));
    const auto* const late_failure = cetl::get_if<QueryResult::Failure>(&results[1]);
    ASSERT_THAT(late_failure, NotNull());
    EXPECT_THAT(late_failure->kind, ErrorKind::PluginLost);
    EXPECT_THAT(late_failure->interfaces, ElementsAre("memo1"));

    session.reset();
}

TEST_F(TestSessionService, send_failure_is_reported_after_session_is_gone)
{
    StrictMock<GatewayMock> gateway_mock;
    EXPECT_CALL(gateway_mock, send(_, _)).WillOnce(testing::Return(static_cast<int>(ErrorCode::Disconnected)));
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    auto session = openMemoSession(gateway_mock);
    ASSERT_THAT(session, NotNull());

    std::vector<ApplyResult::Var> results;
    session->apply(OperationKind::Create,
                   InterfaceTarget{"memo0", "memo", {}},
                   1s,
                   [&results](ApplyResult::Var&& result) {
                       //
                       results.push_back(std::move(result));
                   });
    EXPECT_THAT(results, IsEmpty());

    // The channel completes within the same spin, and the session is released right away.
    loseSession(gateway_mock);
    session.reset();
    EXPECT_THAT(results, IsEmpty());

    scheduler_.spinFor(10ms);
    ASSERT_THAT(results, SizeIs(1));
    const auto* const failure = cetl::get_if<ApplyResult::Failure>(&results[0]);
    ASSERT_THAT(failure, NotNull());
    EXPECT_THAT(failure->kind, ErrorKind::PluginLost);
    EXPECT_THAT(failure->interfaces, ElementsAre("memo0"));
}

TEST_F(TestSessionService, query_of_too_long_name_fails)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Down> downs;
    collectDowns(gateway_mock, downs);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    auto session = openMemoSession(gateway_mock);
    ASSERT_THAT(session, NotNull());

    const std::string             long_name(65, 'x');
    std::vector<QueryResult::Var> results;
    session->query(long_name, 1s, [&results](QueryResult::Var&& result) {
        //
        results.push_back(std::move(result));
    });
    EXPECT_THAT(downs, IsEmpty());
    EXPECT_THAT(results, IsEmpty());

    scheduler_.spinFor(10ms);
    ASSERT_THAT(results, SizeIs(1));
    const auto* const failure = cetl::get_if<QueryResult::Failure>(&results[0]);
    ASSERT_THAT(failure, NotNull());
    EXPECT_THAT(failure->kind, ErrorKind::OperationFailed);
    EXPECT_THAT(failure->interfaces, ElementsAre(long_name));

    // The longest name still fits.
    session->query(std::string(64, 'y'), 1s, [](QueryResult::Var&&) {});
    ASSERT_THAT(downs, SizeIs(1));

    loseSession(gateway_mock);
    session.reset();
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
