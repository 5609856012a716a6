//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_PIPELINE_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_PIPELINE_HPP_INCLUDED

#include "checkpoint_manager.hpp"
#include "dependency_graph_builder.hpp"
#include "operation_dispatcher.hpp"
#include "plan_executor.hpp"
#include "planner.hpp"
#include "plugin_registry.hpp"
#include "request_gate.hpp"
#include "request_serializer.hpp"
#include "state_provider.hpp"
#include "state_provider_adapter.hpp"
#include "unified_state_merger.hpp"

#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Owns and wires together all components of the request pipeline.
///
class Pipeline final
{
public:
    struct Settings final
    {
        libcyphal::Duration provider_timeout{std::chrono::seconds{5}};
        libcyphal::Duration plugin_query_timeout{std::chrono::seconds{2}};
        libcyphal::Duration plugin_apply_timeout{std::chrono::seconds{10}};
        libcyphal::Duration checkpoint_retention{std::chrono::seconds{60}};
        libcyphal::Duration default_request_timeout{std::chrono::seconds{30}};
        std::size_t         max_concurrent_requests{8};
        std::size_t         max_queued_requests{64};
    };

    Pipeline(libcyphal::IExecutor& executor, StateProvider& provider, const Settings& settings);

    Pipeline(const Pipeline&)                = delete;
    Pipeline(Pipeline&&) noexcept            = delete;
    Pipeline& operator=(const Pipeline&)     = delete;
    Pipeline& operator=(Pipeline&&) noexcept = delete;

    ~Pipeline() = default;

    /// Deadline of a request with the given timeout (zero means the default one).
    ///
    libcyphal::TimePoint deadlineFor(const std::uint64_t timeout_us) const;

    libcyphal::IExecutor& executor() const
    {
        return executor_;
    }

    PluginRegistry& registry()
    {
        return registry_;
    }

    UnifiedStateMerger& merger()
    {
        return merger_;
    }

    Planner& planner()
    {
        return planner_;
    }

    PlanExecutor& planExecutor()
    {
        return plan_executor_;
    }

    CheckpointManager& checkpoints()
    {
        return checkpoints_;
    }

    RequestSerializer& serializer()
    {
        return serializer_;
    }

    RequestGate& gate()
    {
        return gate_;
    }

private:
    libcyphal::IExecutor&  executor_;
    const Settings         settings_;
    StateProviderAdapter   provider_;
    PluginRegistry         registry_;
    UnifiedStateMerger     merger_;
    DependencyGraphBuilder builder_;
    Planner                planner_;
    OperationDispatcher    dispatcher_;
    CheckpointManager      checkpoints_;
    PlanExecutor           plan_executor_;
    RequestSerializer      serializer_;
    RequestGate            gate_;

};  // Pipeline

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_PIPELINE_HPP_INCLUDED
