//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_REGISTRY_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_REGISTRY_HPP_INCLUDED

#include "logging.hpp"
#include "plugin_session.hpp"

#include "netcfgd/model/error.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <map>
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

/// Registry of live plugin sessions and of their (non-overlapping) capabilities.
///
/// There is no global instance - the registry is owned by the engine and passed by reference to its users.
///
class PluginRegistry final
{
public:
    /// Tells whether an interface type is natively supported by the state provider.
    using TypePredicate = std::function<bool(const std::string& type)>;

    struct AddResult final
    {
        using Success = cetl::monostate;
        using Failure = model::Error;
        using Var     = cetl::variant<Success, Failure>;
    };

    explicit PluginRegistry(TypePredicate is_provider_type);

    PluginRegistry(const PluginRegistry&)                = delete;
    PluginRegistry(PluginRegistry&&) noexcept            = delete;
    PluginRegistry& operator=(const PluginRegistry&)     = delete;
    PluginRegistry& operator=(PluginRegistry&&) noexcept = delete;

    ~PluginRegistry() = default;

    /// Registers a new session.
    ///
    /// Fails with `ConfigurationConflict` if the name is taken, or if any declared type or property prefix
    /// is already owned (by another session, by the state provider, or by the core itself).
    ///
    CETL_NODISCARD AddResult::Var add(PluginSession::Ptr session);

    /// Unregisters the session, but only if it is still the registered one for its name.
    ///
    void remove(const PluginSession& session);

    CETL_NODISCARD PluginSession::Ptr findByName(const std::string& name) const;
    CETL_NODISCARD PluginSession::Ptr findTypeOwner(const std::string& type) const;
    CETL_NODISCARD PluginSession::Ptr findPropertyOwner(const std::string& key) const;

    /// Gets all live sessions ordered by name.
    CETL_NODISCARD std::vector<PluginSession::Ptr> sessions() const;

private:
    CETL_NODISCARD cetl::optional<std::string> findConflict(const PluginSession& candidate) const;

    TypePredicate                             is_provider_type_;
    std::map<std::string, PluginSession::Ptr> name_to_session_;
    common::LoggerPtr                         logger_{common::getLogger(common::logger_names::Core)};

};  // PluginRegistry

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_REGISTRY_HPP_INCLUDED
