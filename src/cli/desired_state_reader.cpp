//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "desired_state_reader.hpp"

#include <netcfgd/model/interface_state.hpp>
#include <netcfgd/model/property.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace netcfgd
{
namespace cli
{
namespace
{

constexpr const char* InterfacesKey = "interface";
constexpr const char* NameKey       = "name";
constexpr const char* TypeKey       = "type";

/// Appends flattened properties of a table; returns an error message on unsupported values.
///
/// The interface identity keys (`name` and `type`) of the top level table are skipped.
///
cetl::optional<std::string> flattenInto(const toml::value& table, const std::string& prefix, model::Properties& out)
{
    for (const auto& key_value : table.as_table())
    {
        if (prefix.empty() && ((key_value.first == NameKey) || (key_value.first == TypeKey)))
        {
            continue;
        }

        const auto  key   = prefix.empty() ? key_value.first : (prefix + "." + key_value.first);
        const auto& value = key_value.second;

        if (value.is_table())
        {
            if (auto err = flattenInto(value, key, out))
            {
                return err;
            }
        }
        else if (value.is_boolean())
        {
            out[key] = value.as_boolean();
        }
        else if (value.is_integer())
        {
            out[key] = static_cast<std::int64_t>(value.as_integer());
        }
        else if (value.is_string())
        {
            out[key] = std::string{value.as_string()};
        }
        else
        {
            return "unsupported value of '" + key + "' (only booleans, integers and strings are allowed)";
        }
    }
    return cetl::nullopt;
}

}  // namespace

DesiredStateReader::Result::Var DesiredStateReader::readFile(const std::string& file_path)
{
    try
    {
        return read(toml::parse(file_path));

    } catch (const std::exception& ex)
    {
        return std::string{ex.what()};
    }
}

DesiredStateReader::Result::Var DesiredStateReader::read(const toml::value& root)
{
    if (!root.is_table() || !root.contains(InterfacesKey))
    {
        return std::string{"no [[interface]] tables found"};
    }
    const auto& interfaces = root.at(InterfacesKey);
    if (!interfaces.is_array())
    {
        return std::string{"'interface' must be an array of tables ([[interface]])"};
    }

    model::DesiredState desired;
    std::size_t         index = 0;
    for (const auto& iface : interfaces.as_array())
    {
        const auto where = "interface #" + std::to_string(index++);
        if (!iface.is_table())
        {
            return where + ": not a table";
        }

        model::InterfaceTarget target;
        if (!iface.contains(NameKey) || !iface.at(NameKey).is_string() || iface.at(NameKey).as_string().empty())
        {
            return where + ": 'name' string is required";
        }
        target.name = iface.at(NameKey).as_string();

        if (iface.contains(TypeKey))
        {
            if (!iface.at(TypeKey).is_string())
            {
                return where + " ('" + target.name + "'): 'type' must be a string";
            }
            target.type = iface.at(TypeKey).as_string();
        }

        if (auto err = flattenInto(iface, "", target.properties))
        {
            return where + " ('" + target.name + "'): " + *err;
        }

        desired.interfaces.push_back(std::move(target));
    }
    return desired;
}

}  // namespace cli
}  // namespace netcfgd
