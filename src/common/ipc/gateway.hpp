//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_GATEWAY_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_GATEWAY_HPP_INCLUDED

#include "ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>
#include <functional>
#include <memory>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace detail
{

/// Identifies a service (channel kind) - a CRC64 of its name, plus the name itself (for logging).
///
struct ServiceDesc
{
    using Id = std::uint64_t;

    Id                id;
    cetl::string_view name;

};  // ServiceDesc

/// Gateway is a per-channel endpoint of a router.
///
/// Routers multiplex many gateways (aka channels) over a single pipe connection.
///
class Gateway
{
public:
    using Ptr     = std::shared_ptr<Gateway>;
    using WeakPtr = std::weak_ptr<Gateway>;

    struct Event final
    {
        struct Connected final
        {};
        struct Completed final
        {
            ErrorCode error_code;
        };
        struct Message final
        {
            std::uint64_t sequence;
            Payload       payload;
        };

        using Var = cetl::variant<Connected, Message, Completed>;

    };  // Event

    using EventHandler = std::function<int(const Event::Var&)>;

    Gateway(const Gateway&)                = delete;
    Gateway(Gateway&&) noexcept            = delete;
    Gateway& operator=(const Gateway&)     = delete;
    Gateway& operator=(Gateway&&) noexcept = delete;

    /// Sends a message of the channel to the remote side.
    ///
    /// The very first message of a client channel also opens the channel on the daemon side,
    /// hence the service id. A failed send does not consume a sequence number.
    ///
    /// @return `0` on success, or an `ErrorCode` (f.e. `NotConnected` before the router is connected).
    ///
    CETL_NODISCARD virtual int send(const ServiceDesc::Id service_id, const Payload payload) = 0;

    /// Sets the completion code of the channel.
    ///
    /// The remote side gets it (within the channel end) once the gateway is released.
    /// Zero `error_code` stands for a normal completion.
    ///
    virtual void complete(const int error_code) = 0;

    /// Delivers an event from the router to the subscriber of this gateway.
    ///
    /// Events which arrive before anyone has subscribed are dropped.
    ///
    CETL_NODISCARD virtual int event(const Event::Var& event) = 0;

    virtual void subscribe(EventHandler event_handler) = 0;

protected:
    Gateway()  = default;
    ~Gateway() = default;

};  // Gateway

}  // namespace detail
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_GATEWAY_HPP_INCLUDED
