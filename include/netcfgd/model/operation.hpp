//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_MODEL_OPERATION_HPP_INCLUDED
#define NETCFGD_MODEL_OPERATION_HPP_INCLUDED

#include "property.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace netcfgd
{
namespace model
{

enum class OperationKind : std::uint8_t
{
    Create = 0,
    Modify = 1,
    Delete = 2,

};  // OperationKind

inline const char* toString(const OperationKind kind)
{
    switch (kind)
    {
    case OperationKind::Create:
        return "create";
    case OperationKind::Modify:
        return "modify";
    case OperationKind::Delete:
        return "delete";
    }
    return "unknown";
}

/// Single atomic change of one interface, targeting exactly one backend.
///
struct Operation
{
    using Id = std::uint32_t;

    Id            id{0};
    std::string   interface;
    std::string   type;
    OperationKind kind{OperationKind::Modify};

    /// Name of the target plugin; empty when the target is the state provider.
    std::string plugin;

    /// Properties to set (`monostate` to remove).
    Properties desired;

    /// Values of the `desired` keys before the change (`monostate` where absent).
    /// For deletions these are all properties owned by the target, so the interface can be re-created.
    Properties previous;

    /// Operations which must succeed before this one starts.
    std::vector<Id> predecessors;

    bool targetsStateProvider() const
    {
        return plugin.empty();
    }

};  // Operation

/// Lifecycle of a plan execution.
///
enum class ExecutionState : std::uint8_t
{
    Planned    = 0,
    Running    = 1,
    Applied    = 2,
    Committed  = 3,
    RolledBack = 4,
    Failed     = 5,

};  // ExecutionState

inline const char* toString(const ExecutionState state)
{
    switch (state)
    {
    case ExecutionState::Planned:
        return "Planned";
    case ExecutionState::Running:
        return "Running";
    case ExecutionState::Applied:
        return "Applied";
    case ExecutionState::Committed:
        return "Committed";
    case ExecutionState::RolledBack:
        return "RolledBack";
    case ExecutionState::Failed:
        return "Failed";
    }
    return "Unknown";
}

}  // namespace model
}  // namespace netcfgd

#endif  // NETCFGD_MODEL_OPERATION_HPP_INCLUDED
