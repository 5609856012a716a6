//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_SERVER_ROUTER_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_SERVER_ROUTER_HPP_INCLUDED

#include "channel.hpp"
#include "dsdl_helpers.hpp"
#include "gateway.hpp"
#include "ipc_types.hpp"
#include "pipe/server_pipe.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <functional>
#include <memory>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace ipc
{

/// Daemon side router of service channels.
///
/// Channels are opened by clients only: the very first message of a new client channel (aka the request)
/// makes the router create the server side channel of the registered service, and pass it to the service.
///
class ServerRouter
{
public:
    using Ptr = std::unique_ptr<ServerRouter>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory, pipe::ServerPipe::Ptr server_pipe);

    ServerRouter(const ServerRouter&)                = delete;
    ServerRouter(ServerRouter&&) noexcept            = delete;
    ServerRouter& operator=(const ServerRouter&)     = delete;
    ServerRouter& operator=(ServerRouter&&) noexcept = delete;

    virtual ~ServerRouter() = default;

    CETL_NODISCARD virtual int                         start()  = 0;
    CETL_NODISCARD virtual cetl::pmr::memory_resource& memory() = 0;

    /// Called with every new channel of a service, together with the decoded first message.
    ///
    template <typename Spec>
    using NewChannelHandler = std::function<void(ServerChannelOf<Spec>&& channel, const typename Spec::ClientMsg&)>;

    /// Registers a service - its channels will be passed to the `handler`.
    ///
    /// A first message which can't be decoded ends the client channel with `EINVAL`.
    ///
    template <typename Spec>
    void registerService(NewChannelHandler<Spec> handler)
    {
        using Channel = ServerChannelOf<Spec>;
        CETL_DEBUG_ASSERT(handler, "");

        const auto svc_desc = AnyChannel::getServiceDesc<typename Spec::ClientMsg>(Spec::svc_full_name());
        registerChannelFactory(  //
            svc_desc,
            [this, svc_id = svc_desc.id, on_new_channel = std::move(handler)](detail::Gateway::Ptr gateway,
                                                                              const Payload        payload) {
                //
                typename Spec::ClientMsg first_msg{&memory()};
                if (!tryDeserializePayload(payload, first_msg))
                {
                    gateway->complete(EINVAL);
                    return;
                }
                on_new_channel(Channel{memory(), std::move(gateway), svc_id}, first_msg);
            });
    }

protected:
    using TypeErasedChannelFactory = std::function<void(detail::Gateway::Ptr gateway, const Payload payload)>;

    ServerRouter() = default;

    virtual void registerChannelFactory(const detail::ServiceDesc service_desc,
                                        TypeErasedChannelFactory  channel_factory) = 0;

};  // ServerRouter

}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_SERVER_ROUTER_HPP_INCLUDED
