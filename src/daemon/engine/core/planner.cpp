//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "planner.hpp"

#include "dependency_graph_builder.hpp"
#include "plan.hpp"
#include "scope.hpp"
#include "unified_state_merger.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

Planner::Planner(UnifiedStateMerger& merger, const DependencyGraphBuilder& builder)
    : merger_{merger}
    , builder_{builder}
{
}

void Planner::plan(model::DesiredState desired, PlanResult::Handler handler)
{
    auto scope = DependencyGraphBuilder::scopeOf(desired);

    auto shared_desired = std::make_shared<model::DesiredState>(std::move(desired));
    merger_.query(scope, [this, shared_desired, handler = std::move(handler)](auto&& result) {
        //
        if (auto* const failure = cetl::get_if<UnifiedStateMerger::QueryResult::Failure>(&result))
        {
            logger_->warn("Planning has failed to snapshot state: {}", failure->message);
            handler(std::move(*failure));
            return;
        }
        auto& snapshot = cetl::get<UnifiedStateMerger::QueryResult::Success>(result);

        if (snapshot.partial)
        {
            auto error = snapshot.warnings.empty()
                             ? model::Error::make(model::ErrorKind::PluginTimeout, "Snapshot is partial.")
                             : snapshot.warnings.front();
            logger_->warn("Planning on partial snapshot is not possible: {}", error.message);
            handler(std::move(error));
            return;
        }

        auto built = builder_.build(*shared_desired, snapshot);
        if (auto* const failure = cetl::get_if<DependencyGraphBuilder::BuildResult::Failure>(&built))
        {
            handler(std::move(*failure));
            return;
        }

        Plan plan{cetl::get<DependencyGraphBuilder::BuildResult::Success>(std::move(built)), std::move(snapshot)};
        logger_->debug("Plan is ready (ops={}).", plan.operations.size());
        handler(std::move(plan));
    });
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
