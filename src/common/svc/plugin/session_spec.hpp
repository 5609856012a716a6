//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_SVC_PLUGIN_SESSION_SPEC_HPP_INCLUDED
#define NETCFGD_COMMON_SVC_PLUGIN_SESSION_SPEC_HPP_INCLUDED

#include "netcfgd/common/svc/plugin/SessionDown_0_1.hpp"
#include "netcfgd/common/svc/plugin/SessionUp_0_1.hpp"

#include <cstdint>

namespace netcfgd
{
namespace common
{
namespace svc
{
namespace plugin
{

/// Long living channel between the daemon and a plugin process.
///
/// The plugin opens the channel with its `registration`, and then answers daemon requests with `reply` messages.
/// The channel lives as long as the plugin is registered.
///
struct SessionSpec
{
    using Up   = SessionUp_0_1;
    using Down = SessionDown_0_1;

    using ClientMsg = Up;
    using ServerMsg = Down;

    constexpr auto static svc_full_name()
    {
        return "netcfgd.plugin.session";
    }

    /// Status of a plugin reply.
    struct Status
    {
        static constexpr std::uint8_t Success   = 0;
        static constexpr std::uint8_t Transient = 1;
        static constexpr std::uint8_t Permanent = 2;
    };

    SessionSpec() = delete;
};

}  // namespace plugin
}  // namespace svc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_SVC_PLUGIN_SESSION_SPEC_HPP_INCLUDED
