//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_PLUGIN_HPP_INCLUDED
#define NETCFGD_SDK_PLUGIN_HPP_INCLUDED

#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <memory>
#include <string>
#include <vector>

namespace netcfgd
{
namespace sdk
{

/// Plugin side of the daemon plugin protocol.
///
/// A plugin process owns some interface types and/or properties, declared by its `Capabilities`.
/// The daemon forwards queries and changes of those to the plugin's `Handler`.
///
class Plugin
{
public:
    using Ptr = std::shared_ptr<Plugin>;

    struct Capabilities final
    {
        std::string name;

        /// Interface types owned by the plugin.
        std::vector<std::string> interface_types;

        /// Properties owned by the plugin - a prefix `dhcp` owns both `dhcp` and `dhcp.*` keys.
        std::vector<std::string> property_prefixes;
    };

    /// Failure reported back to the daemon.
    ///
    /// A transient failure means that a retry might succeed.
    ///
    struct Failure final
    {
        bool        transient;
        std::string message;
    };

    /// Implemented by the plugin author. Calls are made on the executor thread.
    ///
    class Handler
    {
    public:
        struct QueryResult final
        {
            using Success = std::vector<model::InterfaceState>;
            using Failure = Plugin::Failure;
            using Var     = cetl::variant<Success, Failure>;
        };

        struct ApplyResult final
        {
            using Success = cetl::monostate;
            using Failure = Plugin::Failure;
            using Var     = cetl::variant<Success, Failure>;
        };

        Handler(Handler&&)                 = delete;
        Handler(const Handler&)            = delete;
        Handler& operator=(Handler&&)      = delete;
        Handler& operator=(const Handler&) = delete;

        virtual ~Handler() = default;

        /// Reports current state of a single interface, or of all known interfaces (if `iface` is empty).
        ///
        /// For interfaces of foreign types only the owned properties should be reported.
        ///
        virtual QueryResult::Var query(const std::string& iface) = 0;

        /// Applies a single operation.
        ///
        /// For `Delete` the target `properties` are empty.
        ///
        virtual ApplyResult::Var apply(const model::OperationKind kind, const model::InterfaceTarget& target) = 0;

    protected:
        Handler() = default;

    };  // Handler

    /// Creates the plugin, and starts its registration at the daemon.
    ///
    /// The connection is retried a few times (the daemon might still be starting its plugin socket).
    ///
    /// @param memory The memory resource to use for IPC (de)serialization. Must outlive the plugin.
    /// @param executor The executor to use. Must outlive the plugin.
    /// @param connection The plugin socket connection string (passed by the daemon as the first argument).
    /// @param capabilities The declared capabilities of the plugin.
    /// @param handler The plugin implementation. Must outlive the plugin.
    /// @return Shared pointer to the plugin. `nullptr` on failure (see logs for the reason of failure).
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory,
                                   libcyphal::IExecutor&       executor,
                                   const std::string&          connection,
                                   Capabilities                capabilities,
                                   Handler&                    handler);

    Plugin(Plugin&&)                 = delete;
    Plugin(const Plugin&)            = delete;
    Plugin& operator=(Plugin&&)      = delete;
    Plugin& operator=(const Plugin&) = delete;

    virtual ~Plugin() = default;

    /// `false` once the session has ended (or could not be established at all).
    /// A rejected registration (f.e. duplicate name) ends the session as well.
    ///
    /// The plugin process is expected to exit then - the daemon supervisor will restart it.
    ///
    CETL_NODISCARD virtual bool isRunning() const = 0;

protected:
    Plugin() = default;

};  // Plugin

}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_PLUGIN_HPP_INCLUDED
