//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "server_router.hpp"

#include "gateway.hpp"
#include "ipc_types.hpp"
#include "logging.hpp"
#include "pipe/server_pipe.hpp"
#include "routing.hpp"

#include "netcfgd/common/ipc/RouteChannelEnd_0_1.hpp"
#include "netcfgd/common/ipc/RouteChannelMsg_0_1.hpp"
#include "netcfgd/common/ipc/RouteConnect_0_1.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace
{

class ServerRouterImpl final : public ServerRouter
{
    using ClientId = pipe::ServerPipe::ClientId;

    struct Endpoint final
    {
        ClientId           client_id;
        detail::ChannelTag tag;
    };
    using Gateway = detail::RouterGateway<ServerRouterImpl, Endpoint>;

    /// Per client receiver of decoded routes.
    struct ClientLink final
    {
        ServerRouterImpl& router;
        const ClientId    client_id;

        CETL_NODISCARD int onRouteConnect(const RouteConnect_0_1& connect) const
        {
            return router.acceptClient(client_id, connect);
        }
        CETL_NODISCARD int onRouteChannelMsg(const RouteChannelMsg_0_1& msg, const Payload payload) const
        {
            return router.routeToChannel(client_id, msg, payload);
        }
        CETL_NODISCARD int onRouteChannelEnd(const RouteChannelEnd_0_1& end) const
        {
            return router.endChannel(client_id, end);
        }
    };

    struct Sender final
    {
        pipe::ServerPipe& pipe;
        const ClientId    client_id;

        CETL_NODISCARD int operator()(const Payloads payloads) const
        {
            return pipe.send(client_id, payloads);
        }
    };

public:
    ServerRouterImpl(cetl::pmr::memory_resource& memory, pipe::ServerPipe::Ptr server_pipe)
        : memory_{memory}
        , server_pipe_{std::move(server_pipe)}
        , logger_{getLogger(common::logger_names::Ipc)}
    {
        CETL_DEBUG_ASSERT(server_pipe_, "");
    }

    // ServerRouter

    CETL_NODISCARD cetl::pmr::memory_resource& memory() override
    {
        return memory_;
    }

    CETL_NODISCARD int start() override
    {
        return server_pipe_->start([this](const pipe::ServerPipe::Event::Var& event_var) {
            //
            return cetl::visit([this](const auto& event) { return onPipeEvent(event); }, event_var);
        });
    }

    void registerChannelFactory(const detail::ServiceDesc service_desc,
                                TypeErasedChannelFactory  channel_factory) override
    {
        logger_->trace("Service '{}' is registered (id=0x{:X}).", service_desc.name, service_desc.id);
        factories_[service_desc.id] = std::move(channel_factory);
    }

    // Gateway callbacks

    CETL_NODISCARD int gatewaySend(const Endpoint&               endpoint,
                                   const std::uint64_t           sequence,
                                   const detail::ServiceDesc::Id service_id,
                                   const Payload                 payload)
    {
        const auto* const gateways = findClient(endpoint.client_id);
        if (gateways == nullptr)
        {
            return static_cast<int>(ErrorCode::NotConnected);
        }
        if (!gateways->contains(endpoint.tag))
        {
            return static_cast<int>(ErrorCode::Shutdown);
        }
        return detail::writeRouteChannelMsg(memory_,
                                            endpoint.tag,
                                            sequence,
                                            service_id,
                                            payload,
                                            Sender{*server_pipe_, endpoint.client_id});
    }

    void gatewaySubscribed(const Endpoint& endpoint)
    {
        if (const auto* const gateways = findClient(endpoint.client_id))
        {
            if (const auto gateway = gateways->find(endpoint.tag))
            {
                (void) gateway->event(detail::Gateway::Event::Connected{});
            }
        }
    }

    /// Server side channels always exist on behalf of a client channel, so the client is told about
    /// the disposal regardless of whether anything was sent back.
    void gatewayDisposed(const Endpoint& endpoint, const bool, const int completion_error)
    {
        logger_->trace("Server channel is gone (cl={}, tag={}, err={}).",
                       endpoint.client_id,
                       endpoint.tag,
                       completion_error);

        auto* const gateways = findClient(endpoint.client_id);
        if ((gateways != nullptr) && gateways->remove(endpoint.tag))
        {
            const int err = detail::writeRouteChannelEnd(memory_,
                                                         endpoint.tag,
                                                         completion_error,
                                                         Sender{*server_pipe_, endpoint.client_id});
            if (err != 0)
            {
                logger_->debug("Failed to send channel end (cl={}, tag={}, err={}).",
                               endpoint.client_id,
                               endpoint.tag,
                               err);
            }
        }
    }

    // Route handling

    CETL_NODISCARD int acceptClient(const ClientId client_id, const RouteConnect_0_1& connect)
    {
        const int ver_major = connect.version.major;
        const int ver_minor = connect.version.minor;
        logger_->debug("Route connect request (cl={}, ver='{}.{}').", client_id, ver_major, ver_minor);

        // Minor versions are backward compatible.
        const bool is_compatible = (ver_major == VERSION_MAJOR);
        if (!is_compatible)
        {
            logger_->warn("Client with incompatible route version is refused (cl={}, ver='{}.{}').",
                          client_id,
                          ver_major,
                          ver_minor);
        }

        const int err = detail::writeRouteConnect(memory_,
                                                  is_compatible ? 0 : EPROTONOSUPPORT,
                                                  Sender{*server_pipe_, client_id});
        if ((0 == err) && is_compatible)
        {
            // Repeated negotiation keeps already opened channels.
            (void) clients_[client_id];
        }
        return err;
    }

    CETL_NODISCARD int routeToChannel(const ClientId client_id, const RouteChannelMsg_0_1& msg, const Payload payload)
    {
        auto* const gateways = findClient(client_id);
        if (gateways == nullptr)
        {
            logger_->debug("Channel msg from not negotiated client is dropped (cl={}, tag={}).", client_id, msg.tag);
            return 0;
        }

        if (const auto gateway = gateways->find(msg.tag))
        {
            logger_->trace("Route channel msg (cl={}, tag={}, seq={}).", client_id, msg.tag, msg.sequence);
            return gateway->event(detail::Gateway::Event::Message{msg.sequence, payload});
        }

        // Only the very first message of a client channel may open a new server channel.
        const auto factory = factories_.find(msg.service_id);
        if ((msg.sequence != 0) || (factory == factories_.end()))
        {
            logger_->debug("Unsolicited route channel msg is dropped (cl={}, tag={}, seq={}, srv=0x{:X}).",
                           client_id,
                           msg.tag,
                           msg.sequence,
                           msg.service_id);
            return 0;
        }

        logger_->debug("New server channel (cl={}, tag={}, srv=0x{:X}).", client_id, msg.tag, msg.service_id);
        auto gateway = Gateway::make(*this, Endpoint{client_id, msg.tag});
        gateways->add(msg.tag, gateway);
        factory->second(std::move(gateway), payload);
        return 0;
    }

    CETL_NODISCARD int endChannel(const ClientId client_id, const RouteChannelEnd_0_1& end)
    {
        logger_->debug("Route channel end (cl={}, tag={}, err={}).", client_id, end.tag, end.error_code);

        auto* const gateways = findClient(client_id);
        if (gateways == nullptr)
        {
            return 0;
        }
        if (const auto gateway = gateways->take(end.tag))
        {
            return gateway->event(detail::Gateway::Event::Completed{static_cast<ErrorCode>(end.error_code)});
        }
        return 0;
    }

private:
    CETL_NODISCARD detail::GatewayTable* findClient(const ClientId client_id)
    {
        const auto it = clients_.find(client_id);
        return (it != clients_.end()) ? &it->second : nullptr;
    }

    CETL_NODISCARD int onPipeEvent(const pipe::ServerPipe::Event::Connected& connected)
    {
        // The client becomes routable only after version negotiation (see `acceptClient`).
        logger_->debug("Server pipe client is connected (cl={}).", connected.client_id);
        return 0;
    }

    CETL_NODISCARD int onPipeEvent(const pipe::ServerPipe::Event::Message& msg)
    {
        ClientLink link{*this, msg.client_id};
        return detail::readRoute(memory_, msg.payload, link);
    }

    CETL_NODISCARD int onPipeEvent(const pipe::ServerPipe::Event::Disconnected& disconnected)
    {
        logger_->debug("Server pipe client is disconnected (cl={}).", disconnected.client_id);

        const auto it = clients_.find(disconnected.client_id);
        if (it != clients_.end())
        {
            auto gateways = it->second.takeAll();
            clients_.erase(it);
            detail::broadcast(gateways, detail::Gateway::Event::Completed{ErrorCode::Disconnected});
        }
        return 0;
    }

    cetl::pmr::memory_resource&                                           memory_;
    pipe::ServerPipe::Ptr                                                 server_pipe_;
    LoggerPtr                                                             logger_;
    std::unordered_map<ClientId, detail::GatewayTable>                    clients_;
    std::unordered_map<detail::ServiceDesc::Id, TypeErasedChannelFactory> factories_;

};  // ServerRouterImpl

}  // namespace

ServerRouter::Ptr ServerRouter::make(cetl::pmr::memory_resource& memory, pipe::ServerPipe::Ptr server_pipe)
{
    return std::make_unique<ServerRouterImpl>(memory, std::move(server_pipe));
}

}  // namespace ipc
}  // namespace common
}  // namespace netcfgd
