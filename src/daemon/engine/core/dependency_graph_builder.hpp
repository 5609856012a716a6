//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_DEPENDENCY_GRAPH_BUILDER_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_DEPENDENCY_GRAPH_BUILDER_HPP_INCLUDED

#include "logging.hpp"
#include "plugin_registry.hpp"
#include "scope.hpp"
#include "state_provider_adapter.hpp"

#include "netcfgd/model/error.hpp"
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

/// Turns a desired state into a graph of operations (with dependency edges between them).
///
/// Each interface gets at most one operation per backend: its type owner (the state provider or a plugin)
/// gets Create/Modify/Delete of the interface itself, and every other plugin gets Modify of its own properties.
///
/// Edges:
/// - plugin operations of an interface go after the type owner's one (before it, when deleting);
/// - an interface which is attached to a `controller`/`parent` goes after that one is created or modified;
/// - a `controller`/`parent` which is deleted goes after its children are detached or deleted.
///
/// Unlisted current children of a deleted interface are not left dangling: ports are detached
/// from a deleted controller, and children of a deleted parent are deleted as well.
///
class DependencyGraphBuilder final
{
public:
    struct BuildResult final
    {
        using Success = std::vector<model::Operation>;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
    };

    DependencyGraphBuilder(const StateProviderAdapter& provider, const PluginRegistry& registry);

    DependencyGraphBuilder(const DependencyGraphBuilder&)                = delete;
    DependencyGraphBuilder(DependencyGraphBuilder&&) noexcept            = delete;
    DependencyGraphBuilder& operator=(const DependencyGraphBuilder&)     = delete;
    DependencyGraphBuilder& operator=(DependencyGraphBuilder&&) noexcept = delete;

    ~DependencyGraphBuilder() = default;

    /// Builds operations needed to get from the `current` state to the `desired` one.
    ///
    /// Fails (without any side effect) with:
    /// - `InvalidRequest` on malformed desired state (duplicates, type changes, dangling references, etc.);
    /// - `UnknownInterfaceType` if neither the state provider nor any plugin owns a type;
    /// - `DependencyCycle` listing the interfaces involved.
    ///
    CETL_NODISCARD BuildResult::Var build(const model::DesiredState&    desired,
                                          const model::UnifiedSnapshot& current) const;

    /// Interfaces which have to be locked and snapshotted to plan the desired state.
    ///
    /// Normally these are just the listed interfaces. A deletion or a (re)attachment may touch unlisted ones
    /// as well (ports of a deleted controller, a controller being left), which are known only from the current
    /// state - so then the scope is all interfaces.
    ///
    static Scope scopeOf(const model::DesiredState& desired);

private:
    const StateProviderAdapter& provider_;
    const PluginRegistry&       registry_;
    common::LoggerPtr           logger_{common::getLogger(common::logger_names::Core)};

};  // DependencyGraphBuilder

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_DEPENDENCY_GRAPH_BUILDER_HPP_INCLUDED
