//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_CHANNEL_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_CHANNEL_HPP_INCLUDED

#include "dsdl_helpers.hpp"
#include "gateway.hpp"
#include "ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/common/crc.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <functional>
#include <string>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace ipc
{

/// Base of all typed channels - holds what doesn't depend on the message types.
///
class AnyChannel
{
public:
    /// The remote side has acknowledged the channel (client side only).
    struct Connected final
    {};

    /// The channel is done - either completed by the remote side, or lost with its connection.
    struct Completed final
    {
        ErrorCode error_code;
    };

    /// Services are identified by CRC64 of their name; if the name is empty, the first message type name is used.
    ///
    template <typename Message>
    CETL_NODISCARD static detail::ServiceDesc getServiceDesc(cetl::string_view service_name) noexcept
    {
        if (service_name.empty())
        {
            service_name = Message::_traits_::FullNameAndVersion();
        }
        const libcyphal::common::CRC64WE crc64{service_name.cbegin(), service_name.cend()};
        return {crc64.get(), service_name};
    }

protected:
    AnyChannel() = default;

};  // AnyChannel

/// Typed bidirectional stream of messages over a router gateway.
///
/// Moving is allowed (f.e. into a service state machine); the gateway goes away with the last channel instance.
///
template <typename Input_, typename Output_>
class Channel final : public AnyChannel
{
public:
    using Input  = Input_;
    using Output = Output_;

    using EventVar     = cetl::variant<Connected, Input, Completed>;
    using EventHandler = std::function<void(const EventVar&)>;

    ~Channel()                                   = default;
    Channel(Channel&& other) noexcept            = default;
    Channel& operator=(Channel&& other) noexcept = default;

    Channel(const Channel&)            = delete;
    Channel& operator=(const Channel&) = delete;

    /// @return Zero on success, `EINVAL` for a message which can't be serialized, or an IPC error.
    ///
    CETL_NODISCARD int send(const Output& output)
    {
        return tryPerformOnSerialized(output, [this](const auto payload) {
            //
            return gateway_->send(service_id_, payload);
        });
    }

    /// Sends the last message, and then completes the channel - with the send error (if any).
    ///
    /// @return Result of the send.
    ///
    int sendAndComplete(const Output& output)
    {
        const int err = send(output);
        complete(err);
        return err;
    }

    /// Completes the channel - the other side receives `Completed` event with the given error code.
    ///
    /// Nothing could be sent afterwards, but pending events still might be delivered.
    ///
    void complete(const int error_code = 0)
    {
        gateway_->complete(error_code);
    }

    /// Sets (or resets with empty handler) the channel event handler.
    ///
    /// An input message which can't be deserialized isn't delivered; the router completes the channel with `EINVAL`.
    ///
    void subscribe(EventHandler event_handler)
    {
        if (!event_handler)
        {
            gateway_->subscribe(nullptr);
            return;
        }

        auto& memory = memory_.get();
        gateway_->subscribe([&memory, handler = std::move(event_handler)](const GatewayEvent::Var& ge_var) {
            //
            return cetl::visit(cetl::make_overloaded(  //
                                   [&handler](const GatewayEvent::Connected&) {
                                       //
                                       handler(Connected{});
                                       return 0;
                                   },
                                   [&handler, &memory](const GatewayEvent::Message& gateway_msg) {
                                       //
                                       Input input{&memory};
                                       if (!tryDeserializePayload(gateway_msg.payload, input))
                                       {
                                           return EINVAL;
                                       }
                                       handler(input);
                                       return 0;
                                   },
                                   [&handler](const GatewayEvent::Completed& completed) {
                                       //
                                       handler(Completed{completed.error_code});
                                       return 0;
                                   }),
                               ge_var);
        });
    }

private:
    friend class ClientRouter;
    friend class ServerRouter;

    using GatewayEvent = detail::Gateway::Event;

    Channel(cetl::pmr::memory_resource& memory, detail::Gateway::Ptr gateway, const detail::ServiceDesc::Id service_id)
        : memory_{memory}
        , gateway_{std::move(gateway)}
        , service_id_{service_id}
    {
        CETL_DEBUG_ASSERT(gateway_, "");
    }

    std::reference_wrapper<cetl::pmr::memory_resource> memory_;
    detail::Gateway::Ptr                               gateway_;
    detail::ServiceDesc::Id                            service_id_;

};  // Channel

/// Daemon side channel of a service (see `svc/*_spec.hpp` for the `Spec`s).
///
template <typename Spec>
using ServerChannelOf = Channel<typename Spec::ClientMsg, typename Spec::ServerMsg>;

/// Client side channel of a service.
///
template <typename Spec>
using ClientChannelOf = Channel<typename Spec::ServerMsg, typename Spec::ClientMsg>;

}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

// MARK: - Formatting

// NOLINTBEGIN
template <>
struct fmt::formatter<netcfgd::common::ipc::AnyChannel::Connected> : formatter<string_view>
{
    auto format(netcfgd::common::ipc::AnyChannel::Connected, format_context& ctx) const
    {
        return formatter<string_view>::format("Connected", ctx);
    }
};

template <>
struct fmt::formatter<netcfgd::common::ipc::AnyChannel::Completed> : formatter<std::string>
{
    auto format(netcfgd::common::ipc::AnyChannel::Completed completed, format_context& ctx) const
    {
        return format_to(ctx.out(), "Completed(err={})", static_cast<int>(completed.error_code));
    }
};
// NOLINTEND

#endif  // NETCFGD_COMMON_IPC_CHANNEL_HPP_INCLUDED
