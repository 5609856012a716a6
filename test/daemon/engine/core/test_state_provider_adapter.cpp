//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "core/state_provider_adapter.hpp"

#include "core/scope.hpp"
#include "core/state_provider_mock.hpp"
#include "virtual_time_scheduler.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"
#include "netcfgd/model/property.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using namespace netcfgd::daemon::engine::core;  // NOLINT This our main concern here in the unit tests.
using namespace netcfgd::model;                 // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Field;
using testing::Invoke;
using testing::Return;
using testing::SizeIs;
using testing::IsEmpty;
using testing::Optional;
using testing::StrictMock;
using testing::VariantWith;
using testing::ElementsAre;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestStateProviderAdapter : public testing::Test
{
protected:
    using GetStateResult   = StateProviderAdapter::GetStateResult;
    using ApplyStateResult = StateProviderAdapter::ApplyStateResult;

    static InterfaceState makeState(const std::string& name, const std::string& type, Properties props = {})
    {
        InterfaceState state;
        state.name       = name;
        state.type       = type;
        state.properties = std::move(props);
        return state;
    }

    static std::vector<std::string> namesOf(const GetStateResult::Var& result)
    {
        std::vector<std::string> names;
        for (const auto& state : cetl::get<GetStateResult::Success>(result))
        {
            names.push_back(state.name);
        }
        return names;
    }

    // NOLINTBEGIN
    netcfgd::VirtualTimeScheduler  scheduler_{};
    StrictMock<StateProviderMock>  provider_mock_;
    StateProviderAdapter           adapter_{scheduler_, provider_mock_, 1s};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestStateProviderAdapter, getState_of_all)
{
    EXPECT_CALL(provider_mock_, getState(Eq(cetl::nullopt)))
        .WillOnce(Return(GetStateResult::Success{makeState("eth0", "ethernet"), makeState("lo", "loopback")}));

    const auto result = adapter_.getState(Scope::all());
    ASSERT_THAT(result, VariantWith<GetStateResult::Success>(SizeIs(2)));
    EXPECT_THAT(namesOf(result), ElementsAre("eth0", "lo"));
}

TEST_F(TestStateProviderAdapter, getState_of_single_interface)
{
    EXPECT_CALL(provider_mock_, getState(Optional(std::string{"eth0"})))
        .WillOnce(Return(GetStateResult::Success{makeState("eth0", "ethernet")}));

    const auto result = adapter_.getState(Scope::one("eth0"));
    ASSERT_THAT(result, VariantWith<GetStateResult::Success>(SizeIs(1)));
    EXPECT_THAT(namesOf(result), ElementsAre("eth0"));
}

TEST_F(TestStateProviderAdapter, getState_of_several_interfaces_is_filtered)
{
    EXPECT_CALL(provider_mock_, getState(Eq(cetl::nullopt)))
        .WillOnce(Return(GetStateResult::Success{makeState("eth0", "ethernet"),
                                                 makeState("eth1", "ethernet"),
                                                 makeState("lo", "loopback")}));

    const auto result = adapter_.getState(Scope::of({"lo", "eth0", "missing"}));
    ASSERT_THAT(result, VariantWith<GetStateResult::Success>(SizeIs(2)));
    EXPECT_THAT(namesOf(result), ElementsAre("eth0", "lo"));

    // An empty set of names matches nothing, but still asks the provider.
    EXPECT_CALL(provider_mock_, getState(Eq(cetl::nullopt)))
        .WillOnce(Return(GetStateResult::Success{makeState("eth0", "ethernet")}));
    EXPECT_THAT(adapter_.getState(Scope::of({})), VariantWith<GetStateResult::Success>(IsEmpty()));
}

TEST_F(TestStateProviderAdapter, getState_failures)
{
    EXPECT_CALL(provider_mock_, getState(_))
        .WillOnce(Return(Error::make(ErrorKind::BackendUnavailable, "netlink is down")));
    EXPECT_THAT(adapter_.getState(Scope::all()),
                VariantWith<GetStateResult::Failure>(Field(&Error::kind, ErrorKind::BackendUnavailable)));

    // Exceptions never leak out of the adapter.
    EXPECT_CALL(provider_mock_, getState(_)).WillOnce(Invoke([](const auto&) -> GetStateResult::Var {
        //
        throw std::runtime_error("boom");
    }));
    EXPECT_THAT(adapter_.getState(Scope::all()),
                VariantWith<GetStateResult::Failure>(Field(&Error::kind, ErrorKind::BackendUnavailable)));
}

TEST_F(TestStateProviderAdapter, getState_deadline)
{
    // Emulate that the provider call took longer than its 1s deadline.
    EXPECT_CALL(provider_mock_, getState(_)).WillOnce(Invoke([this](const auto&) {
        //
        scheduler_.spinFor(1s + 1ms);
        return GetStateResult::Success{makeState("eth0", "ethernet")};
    }));
    EXPECT_THAT(adapter_.getState(Scope::all()),
                VariantWith<GetStateResult::Failure>(Field(&Error::kind, ErrorKind::BackendUnavailable)));

    // Exactly at the deadline is still fine.
    EXPECT_CALL(provider_mock_, getState(_)).WillOnce(Invoke([this](const auto&) {
        //
        scheduler_.spinFor(1s);
        return GetStateResult::Success{makeState("eth0", "ethernet")};
    }));
    EXPECT_THAT(adapter_.getState(Scope::all()), VariantWith<GetStateResult::Success>(SizeIs(1)));
}

TEST_F(TestStateProviderAdapter, apply_modify_overlays_current_state)
{
    Operation op;
    op.interface        = "eth0";
    op.type             = "ethernet";
    op.kind             = OperationKind::Modify;
    op.desired["mtu"]   = std::int64_t{9000};
    op.desired["alias"] = cetl::monostate{};

    EXPECT_CALL(provider_mock_, getState(Optional(std::string{"eth0"})))
        .WillOnce(Return(GetStateResult::Success{makeState("eth0",
                                                           "ethernet",
                                                           {{"mtu", std::int64_t{1500}},
                                                            {"alias", std::string{"uplink"}},
                                                            {"state", std::string{"up"}}})}));
    EXPECT_CALL(provider_mock_, applyState(_)).WillOnce(Invoke([](const InterfaceState& desired) {
        //
        EXPECT_THAT(desired.name, "eth0");
        EXPECT_THAT(desired.type, "ethernet");
        EXPECT_THAT(desired.properties, SizeIs(2));
        EXPECT_TRUE(isSameValue(findValue(desired.properties, "mtu"), std::int64_t{9000}));
        EXPECT_TRUE(isSameValue(findValue(desired.properties, "state"), std::string{"up"}));
        return ApplyStateResult::Success{};
    }));

    EXPECT_THAT(adapter_.apply(op), VariantWith<ApplyStateResult::Success>(_));
}

TEST_F(TestStateProviderAdapter, apply_modify_of_missing_interface)
{
    Operation op;
    op.interface      = "eth7";
    op.type           = "ethernet";
    op.kind           = OperationKind::Modify;
    op.desired["mtu"] = std::int64_t{9000};

    EXPECT_CALL(provider_mock_, getState(_)).WillOnce(Return(GetStateResult::Success{}));

    const auto result = adapter_.apply(op);
    ASSERT_THAT(result, VariantWith<ApplyStateResult::Failure>(Field(&Error::kind, ErrorKind::OperationFailed)));
    EXPECT_THAT(cetl::get<ApplyStateResult::Failure>(result).interfaces, ElementsAre("eth7"));
}

TEST_F(TestStateProviderAdapter, apply_create)
{
    Operation op;
    op.interface         = "br0";
    op.type              = "bridge";
    op.kind              = OperationKind::Create;
    op.desired["state"]  = std::string{"up"};
    op.desired["stp"]    = true;
    op.desired["unused"] = cetl::monostate{};

    EXPECT_CALL(provider_mock_, applyState(_)).WillOnce(Invoke([](const InterfaceState& desired) {
        //
        EXPECT_THAT(desired.name, "br0");
        EXPECT_THAT(desired.type, "bridge");
        EXPECT_THAT(desired.properties, SizeIs(2));
        EXPECT_TRUE(isSameValue(findValue(desired.properties, "stp"), true));
        return ApplyStateResult::Success{};
    }));

    EXPECT_THAT(adapter_.apply(op), VariantWith<ApplyStateResult::Success>(_));
}

TEST_F(TestStateProviderAdapter, apply_delete)
{
    Operation op;
    op.interface        = "br0";
    op.type             = "bridge";
    op.kind             = OperationKind::Delete;
    op.previous["stp"]  = true;

    EXPECT_CALL(provider_mock_, applyState(_)).WillOnce(Invoke([](const InterfaceState& desired) {
        //
        EXPECT_THAT(desired.name, "br0");
        EXPECT_THAT(desired.properties, SizeIs(1));
        EXPECT_THAT(findString(desired.properties, property::State), Optional(std::string{property::StateAbsent}));
        return Error::make(ErrorKind::OperationFailed, "busy", {"br0"});
    }));

    EXPECT_THAT(adapter_.apply(op),
                VariantWith<ApplyStateResult::Failure>(Field(&Error::kind, ErrorKind::OperationFailed)));
}

TEST_F(TestStateProviderAdapter, supportsType)
{
    EXPECT_CALL(provider_mock_, supportsType("vlan")).WillOnce(Return(true));
    EXPECT_CALL(provider_mock_, supportsType("memo")).WillOnce(Return(false));

    EXPECT_TRUE(adapter_.supportsType("vlan"));
    EXPECT_FALSE(adapter_.supportsType("memo"));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
