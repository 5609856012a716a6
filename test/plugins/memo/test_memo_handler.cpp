//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "memo_handler.hpp"

#include <netcfgd/model/interface_state.hpp>
#include <netcfgd/model/operation.hpp>
#include <netcfgd/sdk/plugin.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace
{

using namespace netcfgd::model;  // NOLINT This our main concern here in the unit tests.

using netcfgd::plugins::memo::MemoHandler;

using testing::_;
using testing::Key;
using testing::Field;
using testing::IsEmpty;
using testing::NotNull;
using testing::ElementsAre;
using testing::VariantWith;
using testing::UnorderedElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestMemoHandler : public testing::Test
{
protected:
    using QueryResult = MemoHandler::QueryResult;
    using ApplyResult = MemoHandler::ApplyResult;

    std::vector<InterfaceState> queryAll(const std::string& iface = "")
    {
        auto        result = handler_.query(iface);
        const auto* states = cetl::get_if<QueryResult::Success>(&result);
        EXPECT_THAT(states, NotNull());
        return (states != nullptr) ? *states : std::vector<InterfaceState>{};
    }

    static std::string failureOf(const ApplyResult::Var& result)
    {
        const auto* const failure = cetl::get_if<ApplyResult::Failure>(&result);
        return (failure != nullptr) ? failure->message : std::string{};
    }

    // NOLINTBEGIN
    MemoHandler handler_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestMemoHandler, capabilities)
{
    const auto capabilities = MemoHandler::capabilities();
    EXPECT_THAT(capabilities.name, "memo");
    EXPECT_THAT(capabilities.interface_types, ElementsAre("memo"));
    EXPECT_THAT(capabilities.property_prefixes, ElementsAre("memo"));
}

TEST_F(TestMemoHandler, record_lifecycle)
{
    EXPECT_THAT(queryAll(), IsEmpty());

    EXPECT_THAT(handler_.apply(OperationKind::Create, {"note0", "memo", {{"memo.text", std::string{"hello"}}}}),
                VariantWith<ApplyResult::Success>(_));

    auto states = queryAll("note0");
    ASSERT_THAT(states, ElementsAre(Field(&InterfaceState::name, "note0")));
    EXPECT_THAT(states[0].type, "memo");
    EXPECT_THAT(states[0].properties,
                UnorderedElementsAre(Key("state"), Key("memo.text")));

    // Creating it again is a mistake.
    EXPECT_THAT(failureOf(handler_.apply(OperationKind::Create, {"note0", "memo", {}})), testing::HasSubstr("exists"));

    // Absent value means "remove the property".
    EXPECT_THAT(handler_.apply(OperationKind::Modify,
                               {"note0", "", {{"memo.text", cetl::monostate{}}, {"memo.tag", std::string{"x"}}}}),
                VariantWith<ApplyResult::Success>(_));
    states = queryAll("note0");
    ASSERT_THAT(states, testing::SizeIs(1));
    EXPECT_THAT(states[0].properties, UnorderedElementsAre(Key("state"), Key("memo.tag")));

    EXPECT_THAT(handler_.apply(OperationKind::Delete, {"note0", "", {}}), VariantWith<ApplyResult::Success>(_));
    EXPECT_THAT(queryAll(), IsEmpty());

    // Already gone.
    EXPECT_THAT(handler_.apply(OperationKind::Delete, {"note0", "", {}}), VariantWith<ApplyResult::Success>(_));
}

TEST_F(TestMemoHandler, modify_of_missing_record)
{
    EXPECT_THAT(failureOf(handler_.apply(OperationKind::Modify, {"note9", "memo", {}})),
                testing::HasSubstr("doesn't exist"));
}

TEST_F(TestMemoHandler, annotations_of_foreign_interfaces)
{
    EXPECT_THAT(handler_.apply(OperationKind::Modify, {"eth0", "ethernet", {{"memo.owner", std::string{"ops"}}}}),
                VariantWith<ApplyResult::Success>(_));
    EXPECT_THAT(handler_.apply(OperationKind::Create, {"note0", "memo", {}}), VariantWith<ApplyResult::Success>(_));

    EXPECT_THAT(queryAll(),
                UnorderedElementsAre(Field(&InterfaceState::name, "note0"), Field(&InterfaceState::name, "eth0")));

    const auto eth0 = queryAll("eth0");
    ASSERT_THAT(eth0, testing::SizeIs(1));
    EXPECT_THAT(eth0[0].type, "ethernet");
    EXPECT_THAT(eth0[0].properties.at("memo.owner"), VariantWith<std::string>("ops"));

    // Removing the last owned property forgets the interface.
    EXPECT_THAT(handler_.apply(OperationKind::Modify, {"eth0", "ethernet", {{"memo.owner", cetl::monostate{}}}}),
                VariantWith<ApplyResult::Success>(_));
    EXPECT_THAT(queryAll("eth0"), IsEmpty());
}

TEST_F(TestMemoHandler, foreign_properties_and_types_are_rejected)
{
    EXPECT_THAT(failureOf(handler_.apply(OperationKind::Modify, {"eth0", "ethernet", {{"mtu", std::int64_t{9000}}}})),
                testing::HasSubstr("not owned"));
    EXPECT_THAT(failureOf(handler_.apply(OperationKind::Modify, {"eth0", "ethernet", {{"memory", std::int64_t{1}}}})),
                testing::HasSubstr("not owned"));
    EXPECT_THAT(failureOf(handler_.apply(OperationKind::Create, {"wg0", "wireguard", {}})),
                testing::HasSubstr("not supported"));

    EXPECT_THAT(queryAll(), IsEmpty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
