//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_SESSION_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_SESSION_HPP_INCLUDED

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
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

/// Whether a property `key` is covered by the capability `prefix` - either exactly, or as a dotted sub-key.
///
inline bool matchesPropertyPrefix(const std::string& prefix, const std::string& key)
{
    if (key.size() < prefix.size())
    {
        return false;
    }
    if (0 != key.compare(0, prefix.size(), prefix))
    {
        return false;
    }
    return (key.size() == prefix.size()) || (key[prefix.size()] == '.');
}

/// Live session of a registered plugin process, as seen by the core.
///
/// Both `query` and `apply` call their handler exactly once, and never from within the call itself.
/// A session which got lost fails all its pending requests with `PluginLost`.
///
class PluginSession
{
public:
    using Ptr = std::shared_ptr<PluginSession>;
    using Id  = std::uint64_t;

    struct Capabilities final
    {
        std::vector<std::string> interface_types;
        std::vector<std::string> property_prefixes;
    };

    struct QueryResult final
    {
        using Success = std::vector<model::InterfaceState>;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    struct ApplyResult final
    {
        using Success = cetl::monostate;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
        using Handler = std::function<void(Var&&)>;
    };

    PluginSession(const PluginSession&)                = delete;
    PluginSession(PluginSession&&) noexcept            = delete;
    PluginSession& operator=(const PluginSession&)     = delete;
    PluginSession& operator=(PluginSession&&) noexcept = delete;

    virtual ~PluginSession() = default;

    CETL_NODISCARD virtual Id                  id() const           = 0;
    CETL_NODISCARD virtual const std::string&  name() const         = 0;
    CETL_NODISCARD virtual const Capabilities& capabilities() const = 0;

    /// Queries plugin-owned state of the given interface, or of all interfaces the plugin knows about.
    ///
    virtual void query(const cetl::optional<std::string>& iface,
                       const libcyphal::Duration          timeout,
                       QueryResult::Handler               handler) = 0;

    /// Requests the plugin to change (or create/delete) an interface.
    ///
    virtual void apply(const model::OperationKind    kind,
                       const model::InterfaceTarget& target,
                       const libcyphal::Duration     timeout,
                       ApplyResult::Handler          handler) = 0;

    bool ownsType(const std::string& type) const
    {
        const auto& types = capabilities().interface_types;
        return std::find(types.cbegin(), types.cend(), type) != types.cend();
    }

    bool ownsProperty(const std::string& key) const
    {
        const auto& prefixes = capabilities().property_prefixes;
        return std::any_of(prefixes.cbegin(), prefixes.cend(), [&key](const auto& prefix) {
            //
            return matchesPropertyPrefix(prefix, key);
        });
    }

protected:
    PluginSession() = default;

};  // PluginSession

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_SESSION_HPP_INCLUDED
