//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "svc/net/query_client.hpp"

#include "common/ipc/gateway_mock.hpp"
#include "ipc/ipc_types.hpp"
#include "model_dsdl.hpp"
#include "svc/net/net_client_fixture.hpp"
#include "svc/net/query_spec.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"

#include <netcfgd/sdk/execution.hpp>
#include <netcfgd/sdk/network_state.hpp>

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

using namespace netcfgd::sdk;    // NOLINT This our main concern here in the unit tests.
using namespace netcfgd::model;  // NOLINT This our main concern here in the unit tests.

using netcfgd::common::toDsdl;
using netcfgd::common::fromDsdlString;
using netcfgd::common::ipc::ErrorCode;

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

class TestQueryClient : public svc::net::NetClientFixture
{
protected:
    using Spec   = netcfgd::common::svc::net::QuerySpec;
    using Result = NetworkState::Query::Result;

    Spec::Response makeIface(const std::string& name, const std::string& type)
    {
        InterfaceState state;
        state.name       = name;
        state.type       = type;
        state.properties = {{"mtu", std::int64_t{1500}}};

        Spec::Response response{&mr_};
        EXPECT_THAT(toDsdl(state, response.set_iface(), mr_), 0);
        return response;
    }
};

// MARK: - Tests:

TEST_F(TestQueryClient, query_collects_snapshot)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Request> requests;
    expectChannel(gateway_mock);
    collectRequests(gateway_mock, requests);
    EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    cetl::optional<Result> result;
    {
        auto sender = network_state_->query("", 3s);
        ASSERT_THAT(sender, NotNull());
        submit(sender, [&result](Result&& res) { result = std::move(res); });

        connect(gateway_mock);
        ASSERT_THAT(requests, SizeIs(1));
        EXPECT_THAT(requests[0].timeout_us, 3000000U);
        EXPECT_THAT(fromDsdlString(requests[0].iface), "");

        respond(gateway_mock, makeIface("eth0", "ethernet"));
        respond(gateway_mock, makeIface("br0", "bridge"));
        EXPECT_FALSE(result.has_value());

        Spec::Response end{&mr_};
        auto&          query_end = end.set_end();
        query_end.partial        = true;
        query_end.warnings.emplace_back();
        EXPECT_THAT(toDsdl(Error::make(ErrorKind::PluginTimeout, "Plugin 'memo' has not answered in time."),
                           query_end.warnings.back(),
                           mr_),
                    0);
        respond(gateway_mock, end);

        // Whatever comes after the end is ignored.
        complete(gateway_mock, ErrorCode::Success);
    }

    ASSERT_TRUE(result.has_value());
    const auto* const snapshot = cetl::get_if<NetworkState::Query::Success>(&*result);
    ASSERT_THAT(snapshot, NotNull());
    EXPECT_THAT(snapshot->interfaces, SizeIs(2));
    EXPECT_THAT(snapshot->interfaces.at("br0").type, "bridge");
    EXPECT_THAT(snapshot->interfaces.at("eth0").properties.at("mtu"), VariantWith<std::int64_t>(1500));
    EXPECT_TRUE(snapshot->partial);
    EXPECT_THAT(snapshot->warnings, ElementsAre(Field(&Error::kind, ErrorKind::PluginTimeout)));
}

TEST_F(TestQueryClient, query_of_single_interface)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Request> requests;
    expectChannel(gateway_mock);
    collectRequests(gateway_mock, requests);
    EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    cetl::optional<Result> result;
    {
        auto sender = network_state_->query("eth0");
        submit(sender, [&result](Result&& res) { result = std::move(res); });

        connect(gateway_mock);
        ASSERT_THAT(requests, SizeIs(1));
        EXPECT_THAT(requests[0].timeout_us, 0U);
        EXPECT_THAT(fromDsdlString(requests[0].iface), "eth0");

        respond(gateway_mock, makeIface("eth0", "ethernet"));
        Spec::Response end{&mr_};
        end.set_end();
        respond(gateway_mock, end);
    }

    ASSERT_TRUE(result.has_value());
    const auto* const snapshot = cetl::get_if<NetworkState::Query::Success>(&*result);
    ASSERT_THAT(snapshot, NotNull());
    EXPECT_THAT(snapshot->interfaces, SizeIs(1));
    EXPECT_FALSE(snapshot->partial);
    EXPECT_THAT(snapshot->warnings, IsEmpty());
}

TEST_F(TestQueryClient, daemon_error_is_delivered)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Request> requests;
    expectChannel(gateway_mock);
    collectRequests(gateway_mock, requests);
    EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    cetl::optional<Result> result;
    {
        auto sender = network_state_->query("eth0");
        submit(sender, [&result](Result&& res) { result = std::move(res); });
        connect(gateway_mock);

        Spec::Response response{&mr_};
        const auto error = Error::make(ErrorKind::RequestTimeout, "Too busy.", {"eth0"});
        EXPECT_THAT(toDsdl(error, response.set_error(), mr_), 0);
        respond(gateway_mock, response);
    }

    ASSERT_TRUE(result.has_value());
    const auto* const failure = cetl::get_if<NetworkState::Query::Failure>(&*result);
    ASSERT_THAT(failure, NotNull());
    EXPECT_THAT(failure->kind, ErrorKind::RequestTimeout);
    EXPECT_THAT(failure->interfaces, ElementsAre("eth0"));
}

TEST_F(TestQueryClient, lost_daemon_is_backend_unavailable)
{
    StrictMock<GatewayMock> gateway_mock;
    expectChannel(gateway_mock);
    EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    cetl::optional<Result> result;
    {
        auto sender = network_state_->query("");
        submit(sender, [&result](Result&& res) { result = std::move(res); });

        complete(gateway_mock, ErrorCode::NotConnected);
    }

    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, VariantWith<NetworkState::Query::Failure>(Field(&Error::kind, ErrorKind::BackendUnavailable)));
}

TEST_F(TestQueryClient, unfinished_response_stream)
{
    StrictMock<GatewayMock> gateway_mock;
    std::vector<Spec::Request> requests;
    expectChannel(gateway_mock);
    collectRequests(gateway_mock, requests);
    EXPECT_CALL(gateway_mock, subscribe(_)).Times(1);
    EXPECT_CALL(gateway_mock, proxyDestroyed()).Times(1);

    cetl::optional<Result> result;
    {
        auto sender = network_state_->query("");
        submit(sender, [&result](Result&& res) { result = std::move(res); });

        connect(gateway_mock);
        respond(gateway_mock, makeIface("eth0", "ethernet"));
        complete(gateway_mock, ErrorCode::Success);
    }

    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(*result, VariantWith<NetworkState::Query::Failure>(Field(&Error::kind, ErrorKind::InvalidRequest)));
}

TEST_F(TestQueryClient, too_long_interface_name_is_rejected_locally)
{
    cetl::optional<Result> result;
    auto                   sender = network_state_->query(std::string(100, 'x'));
    submit(sender, [&result](Result&& res) { result = std::move(res); });

    EXPECT_THAT(result,
                Optional(VariantWith<NetworkState::Query::Failure>(Field(&Error::kind, ErrorKind::InvalidRequest))));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
