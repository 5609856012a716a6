//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_FACTORY_HPP_INCLUDED
#define NETCFGD_SDK_FACTORY_HPP_INCLUDED

#include <netcfgd/sdk/network_state.hpp>

#include "io/socket_address.hpp"
#include "ipc/client_router.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace netcfgd
{
namespace sdk
{

/// Internal building blocks shared by the public SDK entry points (`Daemon` and `Plugin`).
///
struct Factory
{
    /// Parses a daemon connection string (f.e. `unix:/run/netcfgd/netcfgd.sock`).
    ///
    /// @return `nullopt` if the string is malformed (the reason is logged).
    ///
    CETL_NODISCARD static cetl::optional<common::io::SocketAddress> parseConnection(const std::string& connection,
                                                                                    common::Logger&    logger);

    CETL_NODISCARD static NetworkState::Ptr makeNetworkState(cetl::pmr::memory_resource&    memory,
                                                             common::ipc::ClientRouter::Ptr ipc_router);

};  // Factory

}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_FACTORY_HPP_INCLUDED
