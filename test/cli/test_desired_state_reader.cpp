//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "desired_state_reader.hpp"

#include <netcfgd/model/interface_state.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace
{

using namespace netcfgd::cli;    // NOLINT This our main concern here in the unit tests.
using namespace netcfgd::model;  // NOLINT This our main concern here in the unit tests.

using testing::Key;
using testing::Pair;
using testing::SizeIs;
using testing::IsEmpty;
using testing::NotNull;
using testing::HasSubstr;
using testing::VariantWith;
using testing::UnorderedElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDesiredStateReader : public testing::Test
{
protected:
    using Result = DesiredStateReader::Result;

    static Result::Var readText(const std::string& text)
    {
        std::istringstream input{text};
        return DesiredStateReader::read(toml::parse(input, "desired.toml"));
    }

    static std::string failureOf(const Result::Var& result)
    {
        const auto* const failure = cetl::get_if<Result::Failure>(&result);
        EXPECT_THAT(failure, NotNull());
        return (failure != nullptr) ? *failure : std::string{};
    }
};

// MARK: - Tests:

TEST_F(TestDesiredStateReader, interfaces_with_flattened_properties)
{
    const auto result = readText(R"(
[[interface]]
name = "br0"
type = "bridge"
state = "up"
mtu = 9000

[[interface]]
name = "eth1"
controller = "br0"
ipv4 = { dhcp = true, route = { metric = 100 } }
)");

    const auto* const desired = cetl::get_if<Result::Success>(&result);
    ASSERT_THAT(desired, NotNull());
    ASSERT_THAT(desired->interfaces, SizeIs(2));

    const auto& br0 = desired->interfaces[0];
    EXPECT_THAT(br0.name, "br0");
    EXPECT_THAT(br0.type, "bridge");
    EXPECT_THAT(br0.properties, UnorderedElementsAre(Key("state"), Key("mtu")));
    EXPECT_THAT(br0.properties.at("mtu"), VariantWith<std::int64_t>(9000));

    const auto& eth1 = desired->interfaces[1];
    EXPECT_THAT(eth1.name, "eth1");
    EXPECT_THAT(eth1.type, IsEmpty());
    EXPECT_THAT(eth1.properties,
                UnorderedElementsAre(Pair("controller", VariantWith<std::string>("br0")),
                                     Pair("ipv4.dhcp", VariantWith<bool>(true)),
                                     Pair("ipv4.route.metric", VariantWith<std::int64_t>(100))));
}

TEST_F(TestDesiredStateReader, malformed_documents)
{
    EXPECT_THAT(failureOf(readText("name = \"eth0\"\n")), HasSubstr("no [[interface]]"));
    EXPECT_THAT(failureOf(readText("interface = 1\n")), HasSubstr("array of tables"));
    EXPECT_THAT(failureOf(readText("[[interface]]\nmtu = 1500\n")), HasSubstr("'name' string is required"));
    EXPECT_THAT(failureOf(readText("[[interface]]\nname = \"\"\n")), HasSubstr("'name' string is required"));
    EXPECT_THAT(failureOf(readText("[[interface]]\nname = \"eth0\"\ntype = 1\n")),
                HasSubstr("'type' must be a string"));
    EXPECT_THAT(failureOf(readText("[[interface]]\nname = \"eth0\"\nweight = 0.5\n")),
                HasSubstr("unsupported value of 'weight'"));
    EXPECT_THAT(failureOf(readText("[[interface]]\nname = \"eth0\"\n[[interface]]\nname = \"eth1\"\naddrs = [1, 2]\n")),
                HasSubstr("interface #1 ('eth1')"));
}

TEST_F(TestDesiredStateReader, readFile)
{
    const std::string file_path{testing::TempDir() + "netcfgd_test_desired.toml"};
    {
        std::ofstream file{file_path};
        file << "[[interface]]\nname = \"dummy0\"\ntype = \"dummy\"\n";
    }
    const auto result = DesiredStateReader::readFile(file_path);
    (void) std::remove(file_path.c_str());

    const auto* const desired = cetl::get_if<Result::Success>(&result);
    ASSERT_THAT(desired, NotNull());
    ASSERT_THAT(desired->interfaces, SizeIs(1));
    EXPECT_THAT(desired->interfaces[0].name, "dummy0");
    EXPECT_THAT(desired->interfaces[0].properties, IsEmpty());

    // Neither missing nor broken files throw.
    EXPECT_THAT(failureOf(DesiredStateReader::readFile(testing::TempDir() + "no_such_desired.toml")),
                testing::Not(IsEmpty()));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
