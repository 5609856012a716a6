//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_PLAN_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_PLAN_HPP_INCLUDED

#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Execution plan of a single desired state request.
///
/// Operations are in topological order (each one comes after all its predecessors),
/// and their ids are the 1-based positions in the plan.
///
struct Plan final
{
    std::vector<model::Operation> operations;

    /// Snapshot of the interfaces referenced by the request, taken during planning.
    model::UnifiedSnapshot snapshot;

    /// Sorted unique names of interfaces the plan operates on.
    std::vector<std::string> touchedInterfaces() const;

};  // Plan

struct SortResult final
{
    using Success = std::vector<model::Operation>;

    /// Sorted unique names of interfaces whose operations are involved in a dependency cycle.
    using Failure = std::vector<std::string>;

    using Var = cetl::variant<Success, Failure>;
};

/// Sorts operations topologically (Kahn's algorithm).
///
/// Among operations without remaining constraints the one with the lowest (interface, target, kind) goes first,
/// so the same input always produces the same order. On success operations are renumbered to their plan positions.
///
CETL_NODISCARD SortResult::Var sortTopologically(std::vector<model::Operation> operations);

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_PLAN_HPP_INCLUDED
