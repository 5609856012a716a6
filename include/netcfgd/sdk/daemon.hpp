//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_DAEMON_HPP_INCLUDED
#define NETCFGD_SDK_DAEMON_HPP_INCLUDED

#include "network_state.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <memory>
#include <string>

namespace netcfgd
{
namespace sdk
{

/// Client side connection to the netcfgd daemon - the entry point of the SDK for management tools.
///
/// Requests may be issued right after `make`; they are sent as soon as the connection is established.
/// If the daemon is not reachable, every request fails with `BackendUnavailable` error.
///
class Daemon
{
public:
    using Ptr = std::shared_ptr<Daemon>;

    /// Starts connecting to the daemon.
    ///
    /// @param memory Used for IPC (de)serialization only; must outlive the daemon object.
    /// @param executor Should support `IPosixExecutorExtension` interface (via `cetl::rtti`);
    ///                 must outlive the daemon object.
    /// @param connection F.e. `unix:/run/netcfgd/netcfgd.sock` or `unix-abstract:netcfgd`.
    /// @return `nullptr` if the connection string is malformed, or the connection can't be initiated
    ///         (see the "sdk" logger for the reason).
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory,
                                   libcyphal::IExecutor&       executor,
                                   const std::string&          connection);

    Daemon(Daemon&&)                 = delete;
    Daemon(const Daemon&)            = delete;
    Daemon& operator=(Daemon&&)      = delete;
    Daemon& operator=(const Daemon&) = delete;

    virtual ~Daemon() = default;

    /// Never `nullptr`. The network state keeps the connection alive, even if the daemon object is gone.
    ///
    virtual NetworkState::Ptr getNetworkState() const = 0;

protected:
    Daemon() = default;

};  // Daemon

}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_DAEMON_HPP_INCLUDED
