//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "client_router.hpp"

#include "gateway.hpp"
#include "ipc_types.hpp"
#include "logging.hpp"
#include "pipe/client_pipe.hpp"
#include "routing.hpp"

#include "netcfgd/common/ipc/RouteChannelEnd_0_1.hpp"
#include "netcfgd/common/ipc/RouteChannelMsg_0_1.hpp"
#include "netcfgd/common/ipc/RouteConnect_0_1.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace
{

class ClientRouterImpl final : public ClientRouter
{
    struct Endpoint final
    {
        detail::ChannelTag tag;
    };
    using Gateway = detail::RouterGateway<ClientRouterImpl, Endpoint>;

    /// The pipe being connected is not enough - the daemon has to accept our protocol version first.
    enum class LinkState : std::uint8_t
    {
        Down,
        Negotiating,
        Up,
    };

public:
    ClientRouterImpl(cetl::pmr::memory_resource& memory, pipe::ClientPipe::Ptr client_pipe)
        : memory_{memory}
        , client_pipe_{std::move(client_pipe)}
        , logger_{getLogger(common::logger_names::Ipc)}
    {
        CETL_DEBUG_ASSERT(client_pipe_, "");
    }

    // ClientRouter

    CETL_NODISCARD cetl::pmr::memory_resource& memory() override
    {
        return memory_;
    }

    CETL_NODISCARD int start() override
    {
        return client_pipe_->start([this](const pipe::ClientPipe::Event::Var& event_var) {
            //
            return cetl::visit([this](const auto& event) { return onPipeEvent(event); }, event_var);
        });
    }

    CETL_NODISCARD detail::Gateway::Ptr makeGateway() override
    {
        const Endpoint endpoint{next_tag_++};
        logger_->trace("New client channel (tag={}).", endpoint.tag);

        auto gateway = Gateway::make(*this, endpoint);
        gateways_.add(endpoint.tag, gateway);
        return gateway;
    }

    // Gateway callbacks

    CETL_NODISCARD int gatewaySend(const Endpoint&               endpoint,
                                   const std::uint64_t           sequence,
                                   const detail::ServiceDesc::Id service_id,
                                   const Payload                 payload)
    {
        if (link_state_ != LinkState::Up)
        {
            return static_cast<int>(ErrorCode::NotConnected);
        }
        if (!gateways_.contains(endpoint.tag))
        {
            // The channel has been already completed (by the daemon or by disconnection).
            return static_cast<int>(ErrorCode::Shutdown);
        }
        return detail::writeRouteChannelMsg(memory_, endpoint.tag, sequence, service_id, payload, sender());
    }

    void gatewaySubscribed(const Endpoint& endpoint)
    {
        if (link_state_ == LinkState::Up)
        {
            if (const auto gateway = gateways_.find(endpoint.tag))
            {
                (void) gateway->event(detail::Gateway::Event::Connected{});
            }
        }
    }

    void gatewayDisposed(const Endpoint& endpoint, const bool was_used, const int completion_error)
    {
        logger_->trace("Client channel is gone (tag={}, err={}).", endpoint.tag, completion_error);

        // The daemon never heard of a channel which has sent nothing, so there is nobody to notify.
        if (gateways_.remove(endpoint.tag) && was_used && (link_state_ == LinkState::Up))
        {
            const int err = detail::writeRouteChannelEnd(memory_, endpoint.tag, completion_error, sender());
            if (err != 0)
            {
                logger_->debug("Failed to send channel end (tag={}, err={}).", endpoint.tag, err);
            }
        }
    }

    // Route receiver

    CETL_NODISCARD int onRouteConnect(const RouteConnect_0_1& connect)
    {
        logger_->debug("Route connect reply (ver='{}.{}', err={}).",
                       static_cast<int>(connect.version.major),
                       static_cast<int>(connect.version.minor),
                       static_cast<int>(connect.error_code));

        if (connect.error_code != 0)
        {
            logger_->error("Daemon has refused the connection (ver='{}.{}', err={}).",
                           static_cast<int>(connect.version.major),
                           static_cast<int>(connect.version.minor),
                           static_cast<int>(connect.error_code));
            linkDown(static_cast<ErrorCode>(connect.error_code));
            return 0;
        }

        if (link_state_ != LinkState::Up)
        {
            link_state_ = LinkState::Up;
            detail::broadcast(gateways_.alive(), detail::Gateway::Event::Connected{});
        }
        return 0;
    }

    CETL_NODISCARD int onRouteChannelMsg(const RouteChannelMsg_0_1& msg, const Payload payload)
    {
        if (const auto gateway = gateways_.find(msg.tag))
        {
            logger_->trace("Route channel msg (tag={}, seq={}).", msg.tag, msg.sequence);
            return gateway->event(detail::Gateway::Event::Message{msg.sequence, payload});
        }

        logger_->debug("Unsolicited route channel msg is dropped (tag={}, seq={}, srv=0x{:X}).",
                       msg.tag,
                       msg.sequence,
                       msg.service_id);
        return 0;
    }

    CETL_NODISCARD int onRouteChannelEnd(const RouteChannelEnd_0_1& end)
    {
        logger_->debug("Route channel end (tag={}, err={}).", end.tag, end.error_code);

        if (const auto gateway = gateways_.take(end.tag))
        {
            return gateway->event(detail::Gateway::Event::Completed{static_cast<ErrorCode>(end.error_code)});
        }
        return 0;
    }

private:
    struct Sender final
    {
        pipe::ClientPipe& pipe;

        CETL_NODISCARD int operator()(const Payloads payloads) const
        {
            return pipe.send(payloads);
        }
    };

    CETL_NODISCARD Sender sender() const
    {
        return Sender{*client_pipe_};
    }

    CETL_NODISCARD int onPipeEvent(const pipe::ClientPipe::Event::Connected&)
    {
        logger_->debug("Client pipe is connected - negotiating route version.");

        link_state_ = LinkState::Negotiating;
        return detail::writeRouteConnect(memory_, 0, sender());
    }

    CETL_NODISCARD int onPipeEvent(const pipe::ClientPipe::Event::Message& msg)
    {
        return detail::readRoute(memory_, msg.payload, *this);
    }

    CETL_NODISCARD int onPipeEvent(const pipe::ClientPipe::Event::Disconnected&)
    {
        logger_->debug("Client pipe is disconnected.");

        linkDown((link_state_ == LinkState::Up) ? ErrorCode::Disconnected : ErrorCode::NotConnected);
        return 0;
    }

    /// Completes all channels - the daemon won't talk to them anymore.
    void linkDown(const ErrorCode error_code)
    {
        link_state_ = LinkState::Down;
        detail::broadcast(gateways_.takeAll(), detail::Gateway::Event::Completed{error_code});
    }

    cetl::pmr::memory_resource& memory_;
    pipe::ClientPipe::Ptr       client_pipe_;
    LoggerPtr                   logger_;
    detail::ChannelTag          next_tag_{0};
    LinkState                   link_state_{LinkState::Down};
    detail::GatewayTable        gateways_;

};  // ClientRouterImpl

}  // namespace

CETL_NODISCARD ClientRouter::Ptr ClientRouter::make(cetl::pmr::memory_resource& memory,
                                                    pipe::ClientPipe::Ptr       client_pipe)
{
    return std::make_shared<ClientRouterImpl>(memory, std::move(client_pipe));
}

}  // namespace ipc
}  // namespace common
}  // namespace netcfgd
