//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_MODEL_ERROR_HPP_INCLUDED
#define NETCFGD_MODEL_ERROR_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace model
{

/// Kinds of errors reported to clients. Numeric values are part of the wire protocol.
///
enum class ErrorKind : std::uint8_t
{
    BackendUnavailable    = 1,
    PluginTimeout         = 2,
    PluginLost            = 3,
    DependencyCycle       = 4,
    UnknownInterfaceType  = 5,
    CheckpointExpired     = 6,
    RequestTimeout        = 7,
    ConfigurationConflict = 8,
    OperationFailed       = 9,
    InvalidRequest        = 10,

};  // ErrorKind

inline const char* toString(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::BackendUnavailable:
        return "BackendUnavailable";
    case ErrorKind::PluginTimeout:
        return "PluginTimeout";
    case ErrorKind::PluginLost:
        return "PluginLost";
    case ErrorKind::DependencyCycle:
        return "DependencyCycle";
    case ErrorKind::UnknownInterfaceType:
        return "UnknownInterfaceType";
    case ErrorKind::CheckpointExpired:
        return "CheckpointExpired";
    case ErrorKind::RequestTimeout:
        return "RequestTimeout";
    case ErrorKind::ConfigurationConflict:
        return "ConfigurationConflict";
    case ErrorKind::OperationFailed:
        return "OperationFailed";
    case ErrorKind::InvalidRequest:
        return "InvalidRequest";
    }
    return "Unknown";
}

/// Error with the affected interfaces (if any).
///
struct Error
{
    ErrorKind                kind;
    std::string              message;
    std::vector<std::string> interfaces;

    static Error make(const ErrorKind kind, std::string message, std::vector<std::string> interfaces = {})
    {
        return Error{kind, std::move(message), std::move(interfaces)};
    }

};  // Error

}  // namespace model
}  // namespace netcfgd

#endif  // NETCFGD_MODEL_ERROR_HPP_INCLUDED
