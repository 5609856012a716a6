//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_UNIFIED_STATE_MERGER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_UNIFIED_STATE_MERGER_HPP_INCLUDED

#include "executor_helpers.hpp"
#include "logging.hpp"
#include "plugin_registry.hpp"
#include "scope.hpp"
#include "state_provider_adapter.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <functional>
#include <memory>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Assembles a fresh unified snapshot from the state provider and all live plugins.
///
/// Nothing is cached - every query re-fetches everything.
///
class UnifiedStateMerger final
{
public:
    struct QueryResult final
    {
        using Success = model::UnifiedSnapshot;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    UnifiedStateMerger(libcyphal::IExecutor&     executor,
                       StateProviderAdapter&     provider,
                       PluginRegistry&           registry,
                       const libcyphal::Duration plugin_timeout);

    UnifiedStateMerger(const UnifiedStateMerger&)                = delete;
    UnifiedStateMerger(UnifiedStateMerger&&) noexcept            = delete;
    UnifiedStateMerger& operator=(const UnifiedStateMerger&)     = delete;
    UnifiedStateMerger& operator=(UnifiedStateMerger&&) noexcept = delete;

    ~UnifiedStateMerger() = default;

    /// Queries state of the given scope.
    ///
    /// The handler is called exactly once (never from within this call) with either:
    /// - a snapshot, marked as `partial` (with `warnings`) if some plugin hasn't answered in time or was lost;
    /// - `BackendUnavailable` if the state provider has failed;
    /// - `ConfigurationConflict` if two authorities disagree about the same property.
    ///
    void query(const Scope& scope, QueryResult::Handler handler);

private:
    class Gathering;

    StateProviderAdapter&     provider_;
    PluginRegistry&           registry_;
    const libcyphal::Duration plugin_timeout_;
    Deferred                  deferred_;
    common::LoggerPtr         logger_{common::getLogger(common::logger_names::Core)};

};  // UnifiedStateMerger

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_UNIFIED_STATE_MERGER_HPP_INCLUDED
