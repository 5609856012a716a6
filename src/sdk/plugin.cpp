//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <netcfgd/sdk/plugin.hpp>

#include "io/socket_address.hpp"
#include "ipc/channel.hpp"
#include "ipc/client_router.hpp"
#include "ipc/ipc_types.hpp"
#include "ipc/pipe/client_pipe.hpp"
#include "ipc/pipe/socket_client.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "sdk_factory.hpp"
#include "svc/plugin/session_spec.hpp"

#include "netcfgd/common/svc/plugin/ApplyRequest_0_1.hpp"
#include "netcfgd/common/svc/plugin/QueryRequest_0_1.hpp"
#include "netcfgd/common/svc/plugin/Registration_0_1.hpp"
#include "netcfgd/common/svc/plugin/Reply_0_1.hpp"
#include "netcfgd/model/interface_state.hpp"

#include <uavcan/primitive/Empty_1_0.hpp>
#include <uavcan/primitive/String_1_0.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>

namespace netcfgd
{
namespace sdk
{
namespace
{

class PluginImpl final : public Plugin
{
public:
    /// The daemon might still be bringing up its plugin socket when a plugin starts.
    static constexpr int MaxConnectAttempts = 10;

    PluginImpl(cetl::pmr::memory_resource& memory,
               libcyphal::IExecutor&       executor,
               Capabilities&&              capabilities,
               Handler&                    handler)
        : memory_{memory}
        , executor_{executor}
        , capabilities_{std::move(capabilities)}
        , handler_{handler}
        , logger_{common::getLogger(common::logger_names::Sdk)}
    {
    }

    ~PluginImpl() override
    {
        // Channel events must not reach a half-destroyed plugin.
        if (channel_)
        {
            channel_->subscribe(nullptr);
        }
    }

    PluginImpl(const PluginImpl&)                = delete;
    PluginImpl(PluginImpl&&) noexcept            = delete;
    PluginImpl& operator=(const PluginImpl&)     = delete;
    PluginImpl& operator=(PluginImpl&&) noexcept = delete;

    CETL_NODISCARD int start(const std::string& connection)
    {
        logger_->info("Starting plugin '{}' with connection '{}'...", capabilities_.name, connection);

        const auto socket_address = Factory::parseConnection(connection, *logger_);
        if (!socket_address)
        {
            return EINVAL;
        }
        socket_address_ = *socket_address;

        retry_callback_ = executor_.registerCallback([this](const auto&) {
            //
            connect();
        });

        connect();
        return 0;
    }

    // Plugin

    bool isRunning() const override
    {
        return is_running_;
    }

private:
    using Spec    = common::svc::plugin::SessionSpec;
    using Channel = common::ipc::ClientChannelOf<Spec>;

    static constexpr std::chrono::milliseconds RetryDelay{100};

    void connect()
    {
        ++attempts_;
        logger_->debug("Connecting to the daemon (attempt={}).", attempts_);

        if (channel_)
        {
            channel_->subscribe(nullptr);
            channel_.reset();
        }
        ipc_router_ = common::ipc::ClientRouter::make(  //
            memory_,
            std::make_unique<common::ipc::pipe::SocketClient>(executor_, socket_address_));

        channel_.emplace(ipc_router_->makeChannel<Spec>());
        channel_->subscribe([this](const auto& event_var) {
            //
            cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
        });

        if (const int err = ipc_router_->start())
        {
            logger_->warn("Failed to start plugin IPC router: {}.", std::strerror(err));
            retryOrStop();
        }
    }

    void retryOrStop()
    {
        if (!is_connected_ && (attempts_ < MaxConnectAttempts))
        {
            using Schedule = libcyphal::IExecutor::Callback::Schedule;
            (void) retry_callback_.schedule(Schedule::Once{executor_.now() + RetryDelay});
            return;
        }
        logger_->info("Plugin '{}' session has ended (connected={}, attempts={}).",
                      capabilities_.name,
                      is_connected_,
                      attempts_);
        is_running_ = false;
    }

    void handleEvent(const Channel::Connected& connected)
    {
        using StringCapacity = uavcan::primitive::String_1_0::_traits_::ArrayCapacity;

        logger_->debug("Plugin::handleEvent({}).", connected);
        is_connected_ = true;

        Spec::Up msg{&memory_};
        auto&    registration = msg.set_registration();
        registration.pid      = static_cast<std::uint32_t>(::getpid());
        (void) common::fillDsdlString(registration.name,
                                      capabilities_.name,
                                      common::svc::plugin::Registration_0_1::_traits_::ArrayCapacity::name);
        for (const auto& type : capabilities_.interface_types)
        {
            registration.interface_types.emplace_back();
            (void) common::fillDsdlString(registration.interface_types.back().value, type, StringCapacity::value);
        }
        for (const auto& prefix : capabilities_.property_prefixes)
        {
            registration.property_prefixes.emplace_back();
            (void) common::fillDsdlString(registration.property_prefixes.back().value, prefix, StringCapacity::value);
        }

        if (const int err = channel_->send(msg))
        {
            logger_->error("Failed to send plugin registration: {}.", std::strerror(err));
            channel_->complete(err);
            is_running_ = false;
        }
    }

    void handleEvent(const Channel::Input& input)
    {
        cetl::visit(  //
            cetl::make_overloaded(
                [](const uavcan::primitive::Empty_1_0&) {
                    //
                    // Nunavut generated code needs a default case.
                },
                [this](const common::svc::plugin::QueryRequest_0_1& request) {
                    //
                    onQuery(request);
                },
                [this](const common::svc::plugin::ApplyRequest_0_1& request) {
                    //
                    onApply(request);
                }),
            input.union_value);
    }

    void handleEvent(const Channel::Completed& completed)
    {
        logger_->debug("Plugin::handleEvent({}).", completed);

        if (!is_connected_)
        {
            retryOrStop();
            return;
        }
        if (completed.error_code != common::ipc::ErrorCode::Success)
        {
            logger_->warn("Plugin '{}' session is closed by the daemon ({}).", capabilities_.name, completed);
        }
        is_running_ = false;
    }

    void onQuery(const common::svc::plugin::QueryRequest_0_1& request)
    {
        const auto iface = common::fromDsdlString(request.iface);
        logger_->trace("Plugin: query (req_id={}, iface='{}').", request.request_id, iface);

        Spec::Up msg{&memory_};
        auto&    reply = msg.set_reply();
        reply.request_id = request.request_id;

        auto result = handler_.query(iface);
        if (auto* const states = cetl::get_if<Handler::QueryResult::Success>(&result))
        {
            using Capacity = common::svc::plugin::Reply_0_1::_traits_::ArrayCapacity;

            reply.status = Spec::Status::Success;
            for (const auto& state : *states)
            {
                if (reply.interfaces.size() >= Capacity::interfaces)
                {
                    logger_->warn("Plugin: too many interfaces in a reply - the rest is dropped (req_id={}).",
                                  request.request_id);
                    break;
                }
                reply.interfaces.emplace_back();
                (void) common::toDsdl(state, reply.interfaces.back(), memory_);
            }
        }
        else
        {
            fillFailure(cetl::get<Handler::QueryResult::Failure>(result), reply);
        }
        sendReply(msg);
    }

    void onApply(const common::svc::plugin::ApplyRequest_0_1& request)
    {
        Spec::Up msg{&memory_};
        auto&    reply = msg.set_reply();
        reply.request_id = request.request_id;

        const auto kind = common::operationKindFromDsdl(request.kind);
        if (!kind)
        {
            fillFailure(Failure{false, "Unknown operation kind " + std::to_string(request.kind) + "."}, reply);
            sendReply(msg);
            return;
        }

        const auto target = common::fromDsdl(request.target);
        logger_->trace("Plugin: apply (req_id={}, kind={}, iface='{}').",
                       request.request_id,
                       model::toString(*kind),
                       target.name);

        auto result = handler_.apply(*kind, target);
        if (const auto* const failure = cetl::get_if<Handler::ApplyResult::Failure>(&result))
        {
            fillFailure(*failure, reply);
        }
        else
        {
            reply.status = Spec::Status::Success;
        }
        sendReply(msg);
    }

    static void fillFailure(const Failure& failure, common::svc::plugin::Reply_0_1& reply)
    {
        reply.status = failure.transient ? Spec::Status::Transient : Spec::Status::Permanent;
        (void) common::fillDsdlString(reply.message,
                                      failure.message,
                                      common::svc::plugin::Reply_0_1::_traits_::ArrayCapacity::message);
    }

    void sendReply(const Spec::Up& msg)
    {
        if (const int err = channel_->send(msg))
        {
            logger_->warn("Failed to send plugin reply: {}.", std::strerror(err));
        }
    }

    cetl::pmr::memory_resource&         memory_;
    libcyphal::IExecutor&               executor_;
    const Capabilities                  capabilities_;
    Handler&                            handler_;
    common::LoggerPtr                   logger_;
    common::io::SocketAddress           socket_address_;
    libcyphal::IExecutor::Callback::Any retry_callback_;
    common::ipc::ClientRouter::Ptr      ipc_router_;
    cetl::optional<Channel>             channel_;
    int                                 attempts_{0};
    bool                                is_connected_{false};
    bool                                is_running_{true};

};  // PluginImpl

constexpr int                       PluginImpl::MaxConnectAttempts;
constexpr std::chrono::milliseconds PluginImpl::RetryDelay;

}  // namespace

CETL_NODISCARD Plugin::Ptr Plugin::make(cetl::pmr::memory_resource& memory,
                                        libcyphal::IExecutor&       executor,
                                        const std::string&          connection,
                                        Capabilities                capabilities,
                                        Handler&                    handler)
{
    auto plugin = std::make_shared<PluginImpl>(memory, executor, std::move(capabilities), handler);
    if (0 != plugin->start(connection))
    {
        return nullptr;
    }

    return plugin;
}

}  // namespace sdk
}  // namespace netcfgd
