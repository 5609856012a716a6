//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_CLIENT_ROUTER_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_CLIENT_ROUTER_HPP_INCLUDED

#include "channel.hpp"
#include "gateway.hpp"
#include "pipe/client_pipe.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>

namespace netcfgd
{
namespace common
{
namespace ipc
{

/// Client side router - every service request gets its own channel, and all of them share the client pipe.
///
/// Channels could be made before the router is started (or connected); they get `Connected` event as soon as
/// the route to the daemon is negotiated, and are completed with an error if the pipe is lost (or never connects).
///
class ClientRouter
{
public:
    using Ptr = std::shared_ptr<ClientRouter>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory, pipe::ClientPipe::Ptr client_pipe);

    ClientRouter(const ClientRouter&)                = delete;
    ClientRouter(ClientRouter&&) noexcept            = delete;
    ClientRouter& operator=(const ClientRouter&)     = delete;
    ClientRouter& operator=(ClientRouter&&) noexcept = delete;

    virtual ~ClientRouter() = default;

    CETL_NODISCARD virtual int                         start()  = 0;
    CETL_NODISCARD virtual cetl::pmr::memory_resource& memory() = 0;

    /// Makes a new (not yet used) channel to the service.
    ///
    template <typename Spec>
    CETL_NODISCARD ClientChannelOf<Spec> makeChannel()
    {
        const auto svc_desc = AnyChannel::getServiceDesc<typename Spec::ClientMsg>(Spec::svc_full_name());
        return ClientChannelOf<Spec>{memory(), makeGateway(), svc_desc.id};
    }

protected:
    ClientRouter() = default;

    CETL_NODISCARD virtual detail::Gateway::Ptr makeGateway() = 0;

};  // ClientRouter

}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_CLIENT_ROUTER_HPP_INCLUDED
