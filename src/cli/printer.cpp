//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "printer.hpp"

#include <netcfgd/model/error.hpp>
#include <netcfgd/model/execution_result.hpp>
#include <netcfgd/model/interface_state.hpp>
#include <netcfgd/model/operation.hpp>
#include <netcfgd/model/property.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <ostream>
#include <string>
#include <vector>

namespace netcfgd
{
namespace cli
{
namespace
{

std::string quoted(const std::string& str)
{
    std::string result{"\""};
    for (const char ch : str)
    {
        if ((ch == '"') || (ch == '\\'))
        {
            result += '\\';
        }
        result += ch;
    }
    return result + "\"";
}

std::string toTomlValue(const model::PropertyValue& value)
{
    if (const auto* const str_value = cetl::get_if<std::string>(&value))
    {
        return quoted(*str_value);
    }
    return model::toString(value);
}

void printProperties(std::ostream& out, const model::Properties& properties)
{
    for (const auto& key_value : properties)
    {
        // Dotted keys are valid TOML as is.
        out << key_value.first << " = " << toTomlValue(key_value.second) << '\n';
    }
}

}  // namespace

void printSnapshot(std::ostream& out, const model::UnifiedSnapshot& snapshot)
{
    for (const auto& name_state : snapshot.interfaces)
    {
        const auto& state = name_state.second;

        out << "[[interface]]\n";
        out << "name = " << quoted(state.name) << '\n';
        out << "type = " << quoted(state.type) << '\n';
        out << fmt::format("# source={}", model::toString(state.source));
        if (state.kernel_index)
        {
            out << fmt::format(", ifindex={}", *state.kernel_index);
        }
        if (!state.owner.empty())
        {
            out << fmt::format(", owner={}", state.owner);
        }
        out << '\n';
        printProperties(out, state.properties);
        out << '\n';
    }

    if (snapshot.partial)
    {
        out << "# PARTIAL snapshot - some plugins have not answered:\n";
        for (const auto& warning : snapshot.warnings)
        {
            out << "#   ";
            printError(out, warning);
        }
    }
}

void printOperations(std::ostream& out, const std::vector<model::Operation>& operations)
{
    for (const auto& op : operations)
    {
        out << fmt::format("#{:<3} {:<6} {} ({}) on {}",
                           op.id,
                           model::toString(op.kind),
                           op.interface,
                           op.type,
                           op.targetsStateProvider() ? "<state provider>" : "plugin '" + op.plugin + "'");
        if (!op.predecessors.empty())
        {
            out << fmt::format(" after {}", op.predecessors);
        }
        out << '\n';
        for (const auto& key_value : op.desired)
        {
            out << fmt::format("       {} = {}\n", key_value.first, toTomlValue(key_value.second));
        }
    }
}

void printResult(std::ostream& out, const model::ExecutionResult& result)
{
    out << fmt::format("state: {}\n", model::toString(result.state));
    if (result.checkpoint_id != 0)
    {
        out << fmt::format("checkpoint: {}\n", result.checkpoint_id);
    }
    if (!result.reverted.empty())
    {
        out << fmt::format("reverted: {}\n", result.reverted);
    }
    if (!result.indeterminate.empty())
    {
        out << fmt::format("indeterminate: {}\n", result.indeterminate);
    }
    if (result.error)
    {
        out << "error: ";
        printError(out, *result.error);
    }
}

void printError(std::ostream& out, const model::Error& error)
{
    out << fmt::format("{}: {}", model::toString(error.kind), error.message);
    if (!error.interfaces.empty())
    {
        out << fmt::format(" (interfaces: {})", error.interfaces);
    }
    out << '\n';
}

bool isSuccess(const model::ExecutionResult& result)
{
    if (result.error)
    {
        return false;
    }
    switch (result.state)
    {
    case model::ExecutionState::Applied:
    case model::ExecutionState::Committed:
    case model::ExecutionState::RolledBack:
        return true;
    default:
        return false;
    }
}

}  // namespace cli
}  // namespace netcfgd
