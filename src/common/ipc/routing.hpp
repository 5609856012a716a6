//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_ROUTING_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_ROUTING_HPP_INCLUDED

#include "dsdl_helpers.hpp"
#include "gateway.hpp"
#include "ipc_types.hpp"
#include "logging.hpp"

#include "netcfgd/common/ipc/RouteChannelEnd_0_1.hpp"
#include "netcfgd/common/ipc/RouteChannelMsg_0_1.hpp"
#include "netcfgd/common/ipc/RouteConnect_0_1.hpp"
#include "netcfgd/common/ipc/Route_0_1.hpp"

#include <uavcan/primitive/Empty_1_0.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace detail
{

/// Channel tag - unique per channel within a single pipe connection; allocated by the client side.
using ChannelTag = std::uint64_t;

/// Weak index of the live gateways of a single pipe connection.
///
/// Gateways are owned by their channels; the table only resolves tags to still alive ones.
///
class GatewayTable final
{
public:
    void add(const ChannelTag tag, const Gateway::Ptr& gateway)
    {
        gateways_[tag] = gateway;
    }

    CETL_NODISCARD bool contains(const ChannelTag tag) const
    {
        return gateways_.find(tag) != gateways_.end();
    }

    CETL_NODISCARD bool remove(const ChannelTag tag)
    {
        return gateways_.erase(tag) > 0;
    }

    CETL_NODISCARD Gateway::Ptr find(const ChannelTag tag) const
    {
        const auto it = gateways_.find(tag);
        return (it != gateways_.end()) ? it->second.lock() : nullptr;
    }

    /// Same as `find`, but also unregisters the tag.
    CETL_NODISCARD Gateway::Ptr take(const ChannelTag tag)
    {
        const auto it = gateways_.find(tag);
        if (it == gateways_.end())
        {
            return nullptr;
        }
        auto gateway = it->second.lock();
        gateways_.erase(it);
        return gateway;
    }

    /// Collects strong references first - notifying a gateway might modify the table.
    CETL_NODISCARD std::vector<Gateway::Ptr> alive() const
    {
        std::vector<Gateway::Ptr> result;
        result.reserve(gateways_.size());
        for (const auto& tag_to_gw : gateways_)
        {
            if (auto gateway = tag_to_gw.second.lock())
            {
                result.push_back(std::move(gateway));
            }
        }
        return result;
    }

    /// Unregisters everything, returning the gateways still alive.
    CETL_NODISCARD std::vector<Gateway::Ptr> takeAll()
    {
        auto result = alive();
        gateways_.clear();
        return result;
    }

private:
    std::unordered_map<ChannelTag, Gateway::WeakPtr> gateways_;

};  // GatewayTable

/// Delivers the event to each of the gateways, ignoring their individual failures.
///
inline void broadcast(const std::vector<Gateway::Ptr>& gateways, const Gateway::Event::Var& event)
{
    for (const auto& gateway : gateways)
    {
        (void) gateway->event(event);
    }
}

// MARK: - Route encoding

/// Serializes `RouteConnect` and passes it to the `write(Payloads)` sink.
///
template <typename Write>
CETL_NODISCARD int writeRouteConnect(cetl::pmr::memory_resource& memory, const int error_code, Write&& write)
{
    Route_0_1 route{&memory};
    auto&     connect     = route.set_connect();
    connect.version.major = VERSION_MAJOR;
    connect.version.minor = VERSION_MINOR;
    connect.error_code    = error_code;

    return tryPerformOnSerialized(route, [&write](const auto payload) {
        //
        const Payload fragments[] = {payload};
        return write(Payloads{fragments});
    });
}

/// Serializes `RouteChannelMsg` header, and passes it together with the channel payload to the sink.
///
template <typename Write>
CETL_NODISCARD int writeRouteChannelMsg(cetl::pmr::memory_resource& memory,
                                        const ChannelTag            tag,
                                        const std::uint64_t         sequence,
                                        const ServiceDesc::Id       service_id,
                                        const Payload               payload,
                                        Write&&                     write)
{
    Route_0_1 route{&memory};
    auto&     msg    = route.set_channel_msg();
    msg.tag          = tag;
    msg.sequence     = sequence;
    msg.service_id   = service_id;
    msg.payload_size = payload.size();

    return tryPerformOnSerialized(route, [&write, payload](const auto header) {
        //
        const Payload fragments[] = {header, payload};
        return write(Payloads{fragments});
    });
}

template <typename Write>
CETL_NODISCARD int writeRouteChannelEnd(cetl::pmr::memory_resource& memory,
                                        const ChannelTag            tag,
                                        const int                   error_code,
                                        Write&&                     write)
{
    Route_0_1 route{&memory};
    auto&     end  = route.set_channel_end();
    end.tag        = tag;
    end.error_code = error_code;

    return tryPerformOnSerialized(route, [&write](const auto payload) {
        //
        const Payload fragments[] = {payload};
        return write(Payloads{fragments});
    });
}

// MARK: - Route decoding

/// Decodes a route from a raw pipe message, and dispatches it to one of the `receiver` methods:
/// - `onRouteConnect(const RouteConnect_0_1&)`
/// - `onRouteChannelMsg(const RouteChannelMsg_0_1&, Payload channel_payload)`
/// - `onRouteChannelEnd(const RouteChannelEnd_0_1&)`
///
/// Returns `EINVAL` for malformed or empty routes.
///
template <typename Receiver>
CETL_NODISCARD int readRoute(cetl::pmr::memory_resource& memory, const Payload raw, Receiver& receiver)
{
    Route_0_1 route{&memory};
    if (!tryDeserializePayload(raw, route))
    {
        return EINVAL;
    }

    return cetl::visit(  //
        cetl::make_overloaded(
            [](const uavcan::primitive::Empty_1_0&) {
                //
                // Nunavut generated code needs a default case.
                return EINVAL;
            },
            [&receiver](const RouteConnect_0_1& connect) {
                //
                return receiver.onRouteConnect(connect);
            },
            [&receiver, raw](const RouteChannelMsg_0_1& msg) {
                //
                if (msg.payload_size > raw.size())
                {
                    return EINVAL;
                }
                // The channel payload trails the route header.
                return receiver.onRouteChannelMsg(msg, raw.subspan(raw.size() - msg.payload_size));
            },
            [&receiver](const RouteChannelEnd_0_1& end) {
                //
                return receiver.onRouteChannelEnd(end);
            }),
        route.union_value);
}

// MARK: - Gateway

/// Gateway implementation shared by client and server routers.
///
/// The `Router` is expected to provide (for its own `Endpoint` type):
/// - `int gatewaySend(const Endpoint&, std::uint64_t sequence, ServiceDesc::Id, Payload)`
/// - `void gatewaySubscribed(const Endpoint&)`
/// - `void gatewayDisposed(const Endpoint&, bool was_used, int completion_error)`
///
template <typename Router, typename Endpoint>
class RouterGateway final : public Gateway
{
    struct Private
    {
        explicit Private() = default;
    };

public:
    CETL_NODISCARD static std::shared_ptr<RouterGateway> make(Router& router, const Endpoint& endpoint)
    {
        return std::make_shared<RouterGateway>(Private(), router, endpoint);
    }

    RouterGateway(Private, Router& router, const Endpoint& endpoint)
        : router_{router}
        , endpoint_{endpoint}
    {
    }

    RouterGateway(const RouterGateway&)                = delete;
    RouterGateway(RouterGateway&&) noexcept            = delete;
    RouterGateway& operator=(const RouterGateway&)     = delete;
    RouterGateway& operator=(RouterGateway&&) noexcept = delete;

    ~RouterGateway()
    {
        performWithoutThrowing([this] {
            //
            router_.gatewayDisposed(endpoint_, next_sequence_ > 0, completion_error_);
        });
    }

    // Gateway

    CETL_NODISCARD int send(const ServiceDesc::Id service_id, const Payload payload) override
    {
        const int err = router_.gatewaySend(endpoint_, next_sequence_, service_id, payload);
        if (0 == err)
        {
            ++next_sequence_;
        }
        return err;
    }

    void complete(const int error_code) override
    {
        completion_error_ = error_code;
    }

    CETL_NODISCARD int event(const Event::Var& event) override
    {
        // Unsubscribed gateways silently drop their events.
        return event_handler_ ? event_handler_(event) : 0;
    }

    void subscribe(EventHandler event_handler) override
    {
        event_handler_ = std::move(event_handler);
        router_.gatewaySubscribed(endpoint_);
    }

private:
    Router&        router_;
    const Endpoint endpoint_;
    std::uint64_t  next_sequence_{0};
    int            completion_error_{0};
    EventHandler   event_handler_;

};  // RouterGateway

}  // namespace detail
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_ROUTING_HPP_INCLUDED
