//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_MODEL_PROPERTY_HPP_INCLUDED
#define NETCFGD_MODEL_PROPERTY_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace netcfgd
{
namespace model
{

/// Value of an interface property.
///
/// `monostate` stands for "no value" - in a desired state it requests removal of the property.
///
using PropertyValue = cetl::variant<cetl::monostate, bool, std::int64_t, std::string>;

/// Interface properties, ordered by key.
///
using Properties = std::map<std::string, PropertyValue>;

/// Keys with reserved meaning for the core itself.
///
namespace property
{

constexpr const char* State      = "state";
constexpr const char* Controller = "controller";
constexpr const char* Parent     = "parent";

constexpr const char* StateUp     = "up";
constexpr const char* StateDown   = "down";
constexpr const char* StateAbsent = "absent";

inline bool isReserved(const std::string& key)
{
    return (key == State) || (key == Controller) || (key == Parent);
}

}  // namespace property

inline bool isSameValue(const PropertyValue& lhs, const PropertyValue& rhs)
{
    if (lhs.index() != rhs.index())
    {
        return false;
    }
    if (const auto* const lhs_bool = cetl::get_if<bool>(&lhs))
    {
        return *lhs_bool == cetl::get<bool>(rhs);
    }
    if (const auto* const lhs_int = cetl::get_if<std::int64_t>(&lhs))
    {
        return *lhs_int == cetl::get<std::int64_t>(rhs);
    }
    if (const auto* const lhs_str = cetl::get_if<std::string>(&lhs))
    {
        return *lhs_str == cetl::get<std::string>(rhs);
    }
    return true;
}

/// Gets value of a property, or `monostate` if there is no such property.
///
inline PropertyValue findValue(const Properties& properties, const std::string& key)
{
    const auto it = properties.find(key);
    return (it != properties.end()) ? it->second : PropertyValue{};
}

/// Gets a string property, but only if it's present, is a string and is not empty.
///
inline cetl::optional<std::string> findString(const Properties& properties, const std::string& key)
{
    const auto it = properties.find(key);
    if (it != properties.end())
    {
        if (const auto* const str = cetl::get_if<std::string>(&it->second))
        {
            if (!str->empty())
            {
                return *str;
            }
        }
    }
    return cetl::nullopt;
}

/// Human readable form of a value, f.e. for logging and CLI output.
///
inline std::string toString(const PropertyValue& value)
{
    if (const auto* const bool_value = cetl::get_if<bool>(&value))
    {
        return *bool_value ? "true" : "false";
    }
    if (const auto* const int_value = cetl::get_if<std::int64_t>(&value))
    {
        return std::to_string(*int_value);
    }
    if (const auto* const str_value = cetl::get_if<std::string>(&value))
    {
        return *str_value;
    }
    return "<none>";
}

}  // namespace model
}  // namespace netcfgd

#endif  // NETCFGD_MODEL_PROPERTY_HPP_INCLUDED
