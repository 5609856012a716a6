//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_PLANNER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_PLANNER_HPP_INCLUDED

#include "dependency_graph_builder.hpp"
#include "logging.hpp"
#include "plan.hpp"
#include "unified_state_merger.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <functional>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Plans a desired state request: snapshots referenced interfaces, then builds and sorts operations.
///
class Planner final
{
public:
    struct PlanResult final
    {
        using Success = Plan;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    Planner(UnifiedStateMerger& merger, const DependencyGraphBuilder& builder);

    Planner(const Planner&)                = delete;
    Planner(Planner&&) noexcept            = delete;
    Planner& operator=(const Planner&)     = delete;
    Planner& operator=(Planner&&) noexcept = delete;

    ~Planner() = default;

    /// The handler is called exactly once, never from within this call.
    ///
    /// A partial snapshot fails planning (with the kind of its first warning) -
    /// a plan can't be built on top of an unknown state.
    ///
    void plan(model::DesiredState desired, PlanResult::Handler handler);

private:
    UnifiedStateMerger&           merger_;
    const DependencyGraphBuilder& builder_;
    common::LoggerPtr             logger_{common::getLogger(common::logger_names::Core)};

};  // Planner

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_PLANNER_HPP_INCLUDED
