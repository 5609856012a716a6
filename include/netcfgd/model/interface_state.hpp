//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_MODEL_INTERFACE_STATE_HPP_INCLUDED
#define NETCFGD_MODEL_INTERFACE_STATE_HPP_INCLUDED

#include "error.hpp"
#include "property.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace netcfgd
{
namespace model
{

/// Which backends have contributed to an interface state.
///
enum class StateSource : std::uint8_t
{
    KernelOnly = 0,
    PluginOnly = 1,
    Merged     = 2,

};  // StateSource

inline const char* toString(const StateSource source)
{
    switch (source)
    {
    case StateSource::KernelOnly:
        return "kernel";
    case StateSource::PluginOnly:
        return "plugin";
    case StateSource::Merged:
        return "merged";
    }
    return "unknown";
}

/// Current state of a single interface.
///
struct InterfaceState
{
    std::string                  name;
    std::string                  type;
    cetl::optional<std::int32_t> kernel_index;
    StateSource                  source{StateSource::KernelOnly};

    /// Name of the plugin which owns the interface type; empty if the type is owned by the state provider.
    std::string owner;

    Properties properties;

};  // InterfaceState

/// Desired state of a single interface.
///
/// Only listed properties are changed; an empty `type` means "keep the current one".
/// The `state` property set to `absent` requests deletion.
///
struct InterfaceTarget
{
    std::string name;
    std::string type;
    Properties  properties;

    bool isAbsent() const
    {
        const auto state = findString(properties, property::State);
        return state && (*state == property::StateAbsent);
    }

};  // InterfaceTarget

struct DesiredState
{
    std::vector<InterfaceTarget> interfaces;

};  // DesiredState

/// Point-in-time view of interfaces of interest, merged from the state provider and plugins.
///
struct UnifiedSnapshot
{
    std::map<std::string, InterfaceState> interfaces;

    /// Set when some plugin has not answered in time (or was lost) - see `warnings` for details.
    bool               partial{false};
    std::vector<Error> warnings;

};  // UnifiedSnapshot

}  // namespace model
}  // namespace netcfgd

#endif  // NETCFGD_MODEL_INTERFACE_STATE_HPP_INCLUDED
