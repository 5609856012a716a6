//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_SESSION_MOCK_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_SESSION_MOCK_HPP_INCLUDED

#include "core/plugin_session.hpp"

#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <gmock/gmock.h>

#include <string>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Plugin session with fixed identity and capabilities; `query` and `apply` are mocked.
///
/// Tests capture the handlers, and deliver plugin answers later (from the scheduler),
/// so that the "never from within the call" contract of sessions is respected.
///
class PluginSessionMock : public PluginSession
{
public:
    PluginSessionMock(const Id id, std::string name, Capabilities capabilities)
        : id_{id}
        , name_{std::move(name)}
        , capabilities_{std::move(capabilities)}
    {
    }

    // PluginSession

    Id id() const override
    {
        return id_;
    }

    const std::string& name() const override
    {
        return name_;
    }

    const Capabilities& capabilities() const override
    {
        return capabilities_;
    }

    MOCK_METHOD(void,
                query,
                (const cetl::optional<std::string>& iface,
                 const libcyphal::Duration          timeout,
                 QueryResult::Handler               handler),
                (override));

    MOCK_METHOD(void,
                apply,
                (const model::OperationKind    kind,
                 const model::InterfaceTarget& target,
                 const libcyphal::Duration     timeout,
                 ApplyResult::Handler          handler),
                (override));

private:
    const Id           id_;
    const std::string  name_;
    const Capabilities capabilities_;

};  // PluginSessionMock

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_PLUGIN_SESSION_MOCK_HPP_INCLUDED
