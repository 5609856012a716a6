//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session_service.hpp"

#include "core/executor_helpers.hpp"
#include "core/plugin_registry.hpp"
#include "core/plugin_session.hpp"
#include "ipc/channel.hpp"
#include "ipc/server_router.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/plugin/session_spec.hpp"

#include "netcfgd/common/svc/plugin/QueryRequest_0_1.hpp"
#include "netcfgd/common/svc/plugin/Registration_0_1.hpp"
#include "netcfgd/common/svc/plugin/Reply_0_1.hpp"
#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"

#include <uavcan/primitive/Empty_1_0.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace plugin
{
namespace
{

class SessionServiceImpl final
{
public:
    using Spec    = common::svc::plugin::SessionSpec;
    using Channel = common::ipc::ServerChannelOf<Spec>;

    explicit SessionServiceImpl(const SessionContext& context)
        : context_{context}
        , failures_{std::make_shared<core::Deferred>(context.executor)}
    {
    }

    void operator()(Channel&& ch, const Spec::Up& first_msg)
    {
        const auto* const registration = cetl::get_if<common::svc::plugin::Registration_0_1>(&first_msg.union_value);
        if (registration == nullptr)
        {
            logger_->warn("Plugin session has not started with registration - rejecting.");
            ch.complete(EINVAL);
            return;
        }

        core::PluginSession::Capabilities capabilities;
        for (const auto& type : registration->interface_types)
        {
            capabilities.interface_types.push_back(common::fromDsdlString(type.value));
        }
        for (const auto& prefix : registration->property_prefixes)
        {
            capabilities.property_prefixes.push_back(common::fromDsdlString(prefix.value));
        }

        const auto session_id = ++last_session_id_;
        auto       session    = std::make_shared<Session>(*this,
                                                 session_id,
                                                 std::move(ch),
                                                 common::fromDsdlString(registration->name),
                                                 std::move(capabilities));

        const auto added = context_.registry.add(session);
        if (const auto* const failure = cetl::get_if<core::PluginRegistry::AddResult::Failure>(&added))
        {
            logger_->warn("Plugin '{}' (pid={}) is rejected: {}", session->name(), registration->pid, failure->message);
            session->reject(EEXIST);
            return;
        }

        logger_->info("Plugin '{}' is registered (pid={}, session={}, types={}, prefixes={}).",
                      session->name(),
                      registration->pid,
                      session_id,
                      session->capabilities().interface_types.size(),
                      session->capabilities().property_prefixes.size());

        id_to_session_[session_id] = session;
        session->start();
    }

private:
    /// Plugin session over the IPC channel.
    ///
    /// Requests are correlated with replies by id; each one has its own deadline.
    ///
    class Session final : public core::PluginSession, public std::enable_shared_from_this<Session>
    {
    public:
        Session(SessionServiceImpl& service,
                const Id            id,
                Channel&&           channel,
                std::string         name,
                Capabilities        capabilities)
            : id_{id}
            , channel_{std::move(channel)}
            , service_{service}
            , name_{std::move(name)}
            , capabilities_{std::move(capabilities)}
            , timers_{service.context_.executor,
                      [this](const core::TimerQueue::Key request_id) {
                          //
                          onTimeout(request_id);
                      }}
            , failures_{service.failures_}
        {
            logger().trace("PluginSession (id={}, name='{}').", id_, name_);
        }

        ~Session() override
        {
            logger().trace("~PluginSession (id={}, name='{}').", id_, name_);
        }

        Session(const Session&)                = delete;
        Session(Session&&) noexcept            = delete;
        Session& operator=(const Session&)     = delete;
        Session& operator=(Session&&) noexcept = delete;

        void start()
        {
            channel_.subscribe([this](const auto& event_var) {
                //
                cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
            });
        }

        void reject(const int err)
        {
            channel_.complete(err);
        }

        // MARK: core::PluginSession

        Id id() const override
        {
            return id_;
        }

        const std::string& name() const override
        {
            return name_;
        }

        const Capabilities& capabilities() const override
        {
            return capabilities_;
        }

        void query(const cetl::optional<std::string>& iface,
                   const libcyphal::Duration          timeout,
                   QueryResult::Handler               handler) override
        {
            const auto request_id = ++last_request_id_;

            Spec::Down msg{&memory()};
            auto&      query_req = msg.set_query();
            query_req.request_id = request_id;

            using Capacity = common::svc::plugin::QueryRequest_0_1::_traits_::ArrayCapacity;

            Pending pending;
            pending.on_query = std::move(handler);
            pending.iface    = iface.value_or("");
            if (const auto err = common::fillDsdlString(query_req.iface, pending.iface, Capacity::iface))
            {
                // A truncated name would query some other interface.
                logger().warn("PluginSession: query of '{}' doesn't fit (err={}, plugin='{}').",
                              pending.iface,
                              err,
                              name_);
                auto error = model::Error::make(model::ErrorKind::OperationFailed,
                                                "Interface name '" + pending.iface + "' is too long.",
                                                {pending.iface});
                failLater(std::move(pending), std::move(error));
                return;
            }
            send(request_id, msg, timeout, std::move(pending));
        }

        void apply(const model::OperationKind    kind,
                   const model::InterfaceTarget& target,
                   const libcyphal::Duration     timeout,
                   ApplyResult::Handler          handler) override
        {
            const auto request_id = ++last_request_id_;

            Spec::Down msg{&memory()};
            auto&      apply_req = msg.set_apply();
            apply_req.request_id = request_id;
            apply_req.timeout_us = static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(timeout).count());
            apply_req.kind = static_cast<std::uint8_t>(kind);

            Pending pending;
            pending.on_apply = std::move(handler);
            pending.iface    = target.name;
            if (const auto err = common::toDsdl(target, apply_req.target, memory()))
            {
                // Partial targets must never be applied.
                logger().warn("PluginSession: apply target of '{}' doesn't fit (err={}, plugin='{}').",
                              target.name,
                              err,
                              name_);
                failLater(std::move(pending),
                          model::Error::make(model::ErrorKind::OperationFailed,
                                             "Apply request for '" + target.name + "' is too big.",
                                             {target.name}));
                return;
            }
            send(request_id, msg, timeout, std::move(pending));
        }

    private:
        using RequestId = std::uint64_t;

        struct Pending final
        {
            QueryResult::Handler on_query;
            ApplyResult::Handler on_apply;
            std::string          iface;
        };

        common::Logger& logger() const
        {
            return *service_.logger_;
        }

        cetl::pmr::memory_resource& memory() const
        {
            return service_.context_.memory;
        }

        void send(const RequestId           request_id,
                  const Spec::Down&         msg,
                  const libcyphal::Duration timeout,
                  Pending&&                 pending)
        {
            if (is_lost_)
            {
                auto error = lostError(pending.iface);
                failLater(std::move(pending), std::move(error));
                return;
            }
            if (const auto err = channel_.send(msg))
            {
                logger().warn("PluginSession: failed to send request (err={}, plugin='{}').", err, name_);
                auto error = lostError(pending.iface);
                failLater(std::move(pending), std::move(error));
                return;
            }

            logger().trace("PluginSession: request sent (req_id={}, iface='{}', plugin='{}').",
                           request_id,
                           pending.iface,
                           name_);
            pending_.emplace(request_id, std::move(pending));
            timers_.arm(request_id, service_.context_.executor.now() + timeout);
        }

        model::Error lostError(const std::string& iface) const
        {
            std::vector<std::string> interfaces;
            if (!iface.empty())
            {
                interfaces.push_back(iface);
            }
            return model::Error::make(model::ErrorKind::PluginLost,
                                      "Plugin '" + name_ + "' is lost.",
                                      std::move(interfaces));
        }

        /// Fails a request on the next spin - even if this session is gone by then.
        ///
        void failLater(Pending&& pending, model::Error&& error)
        {
            failures_->post([pending = std::move(pending), error = std::move(error)]() mutable {
                //
                fail(pending, std::move(error));
            });
        }

        static void fail(Pending& pending, model::Error&& error)
        {
            if (pending.on_query)
            {
                pending.on_query(std::move(error));
            }
            else if (pending.on_apply)
            {
                pending.on_apply(std::move(error));
            }
        }

        // We are not interested in handling this event.
        static void handleEvent(const Channel::Connected&) {}

        void handleEvent(const Channel::Input& input)
        {
            cetl::visit(  //
                cetl::make_overloaded(
                    [](const uavcan::primitive::Empty_1_0&) {
                        //
                        // Nunavut generated code needs a default case.
                    },
                    [this](const common::svc::plugin::Registration_0_1&) {
                        //
                        logger().warn("PluginSession: repeated registration is ignored (plugin='{}').", name_);
                    },
                    [this](const common::svc::plugin::Reply_0_1& reply) {
                        //
                        onReply(reply);
                    }),
                input.union_value);
        }

        void handleEvent(const Channel::Completed& completed)
        {
            logger().warn("Plugin '{}' session is lost ({}, session={}).", name_, completed, id_);
            onLost();
        }

        void onReply(const common::svc::plugin::Reply_0_1& reply)
        {
            const auto it = pending_.find(reply.request_id);
            if (it == pending_.end())
            {
                // Most probably, the request has already timed out.
                logger().debug("PluginSession: late reply is ignored (req_id={}, plugin='{}').",
                               reply.request_id,
                               name_);
                return;
            }
            auto pending = std::move(it->second);
            pending_.erase(it);
            timers_.disarm(reply.request_id);

            if (reply.status != Spec::Status::Success)
            {
                const bool is_transient = reply.status == Spec::Status::Transient;
                auto       message      = common::fromDsdlString(reply.message);
                logger().info("PluginSession: request has failed (req_id={}, transient={}, plugin='{}'): {}",
                              reply.request_id,
                              is_transient,
                              name_,
                              message);
                std::vector<std::string> interfaces;
                if (!pending.iface.empty())
                {
                    interfaces.push_back(pending.iface);
                }
                fail(pending,
                     model::Error::make(model::ErrorKind::OperationFailed,
                                        std::string{is_transient ? "Transient" : "Permanent"} + " failure of plugin '" +
                                            name_ + "': " + message,
                                        std::move(interfaces)));
                return;
            }

            if (pending.on_query)
            {
                std::vector<model::InterfaceState> states;
                states.reserve(reply.interfaces.size());
                for (const auto& iface : reply.interfaces)
                {
                    states.push_back(common::fromDsdl(iface));
                }
                pending.on_query(std::move(states));
            }
            else if (pending.on_apply)
            {
                pending.on_apply(cetl::monostate{});
            }
        }

        void onTimeout(const RequestId request_id)
        {
            const auto it = pending_.find(request_id);
            if (it == pending_.end())
            {
                return;
            }
            auto pending = std::move(it->second);
            pending_.erase(it);

            logger().warn("PluginSession: request has timed out (req_id={}, iface='{}', plugin='{}').",
                          request_id,
                          pending.iface,
                          name_);
            std::vector<std::string> interfaces;
            if (!pending.iface.empty())
            {
                interfaces.push_back(pending.iface);
            }
            fail(pending,
                 model::Error::make(model::ErrorKind::PluginTimeout,
                                    "Plugin '" + name_ + "' has not answered in time.",
                                    std::move(interfaces)));
        }

        void onLost()
        {
            if (is_lost_)
            {
                return;
            }
            is_lost_ = true;

            // Keep itself alive till the end of this method.
            const auto self = shared_from_this();

            service_.context_.registry.remove(*this);

            auto pending = std::move(pending_);
            pending_.clear();
            for (auto& id_pending : pending)
            {
                timers_.disarm(id_pending.first);
                fail(id_pending.second, lostError(id_pending.second.iface));
            }

            service_.releaseSessionBy(id_);
        }

        const Id                     id_;
        Channel                      channel_;
        SessionServiceImpl&          service_;
        const std::string            name_;
        const Capabilities           capabilities_;
        RequestId                    last_request_id_{0};
        std::map<RequestId, Pending> pending_;
        bool                         is_lost_{false};
        core::TimerQueue             timers_;

        /// Shared with the service (and so outlives this session).
        const std::shared_ptr<core::Deferred> failures_;

    };  // Session

    void releaseSessionBy(const core::PluginSession::Id session_id)
    {
        id_to_session_.erase(session_id);
    }

    const SessionContext&                                                 context_;
    std::shared_ptr<core::Deferred>                                       failures_;
    core::PluginSession::Id                                               last_session_id_{0};
    std::unordered_map<core::PluginSession::Id, std::shared_ptr<Session>> id_to_session_;
    common::LoggerPtr logger_{common::getLogger(common::logger_names::Plugin)};

};  // SessionServiceImpl

}  // namespace

void SessionService::registerWithContext(const SessionContext& context)
{
    using Impl = SessionServiceImpl;
    context.ipc_router.registerService<Impl::Spec>(Impl(context));
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
