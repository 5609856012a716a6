//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "query_service.hpp"

#include "core/pipeline.hpp"
#include "core/request_gate.hpp"
#include "core/request_serializer.hpp"
#include "core/scope.hpp"
#include "core/unified_state_merger.hpp"
#include "ipc/channel.hpp"
#include "ipc/server_router.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/net/query_spec.hpp"
#include "svc/svc_helpers.hpp"

#include "netcfgd/common/net/Error_0_1.hpp"
#include "netcfgd/common/svc/net/QueryEnd_0_1.hpp"
#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace svc
{
namespace net
{
namespace
{

class QueryServiceImpl final
{
public:
    using Spec    = common::svc::net::QuerySpec;
    using Channel = common::ipc::ServerChannelOf<Spec>;

    explicit QueryServiceImpl(const ScvContext& context)
        : context_{context}
    {
    }

    void operator()(Channel&& ch, const Spec::Request& request)
    {
        const auto fsm_id = next_fsm_id_++;
        logger_->debug("New '{}' service channel (fsm={}).", Spec::svc_full_name(), fsm_id);

        auto fsm           = std::make_shared<Fsm>(*this, fsm_id, std::move(ch));
        id_to_fsm_[fsm_id] = fsm;

        fsm->start(request);
    }

private:
    /// Admission -> locks -> snapshot -> interfaces (streamed) -> end.
    ///
    class Fsm final : public std::enable_shared_from_this<Fsm>  // Finite State Machine
    {
    public:
        using Id  = std::uint64_t;
        using Ptr = std::shared_ptr<Fsm>;

        Fsm(QueryServiceImpl& service, const Id id, Channel&& channel)
            : id_{id}
            , channel_{std::move(channel)}
            , service_{service}
        {
            logger().trace("QuerySvc::Fsm (id={}).", id_);

            channel_.subscribe([this](const auto& event_var) {
                //
                cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
            });
        }

        ~Fsm()
        {
            logger().trace("QuerySvc::~Fsm (id={}).", id_);
        }

        Fsm(const Fsm&)                = delete;
        Fsm(Fsm&&) noexcept            = delete;
        Fsm& operator=(const Fsm&)     = delete;
        Fsm& operator=(Fsm&&) noexcept = delete;

        void start(const Spec::Request& request)
        {
            const auto iface = common::fromDsdlString(request.iface);
            scope_           = iface.empty() ? core::Scope::all() : core::Scope::one(iface);
            deadline_        = pipeline().deadlineFor(request.timeout_us);

            logger().trace("QuerySvc::Fsm::start (iface='{}', fsm_id={}).", iface, id_);

            ticket_id_ = pipeline().gate().admit(deadline_, [weak = weakSelf()](auto&& result) {
                //
                if (const auto self = weak.lock())
                {
                    self->onAdmitted(std::forward<decltype(result)>(result));
                }
            });
        }

    private:
        using AdmitResult   = core::RequestGate::AdmitResult;
        using AcquireResult = core::RequestSerializer::AcquireResult;
        using QueryResult   = core::UnifiedStateMerger::QueryResult;

        common::Logger& logger() const
        {
            return *service_.logger_;
        }

        cetl::pmr::memory_resource& memory() const
        {
            return service_.context_.memory;
        }

        core::Pipeline& pipeline() const
        {
            return service_.context_.pipeline;
        }

        std::weak_ptr<Fsm> weakSelf()
        {
            return shared_from_this();
        }

        // We are not interested in handling these events.
        static void handleEvent(const Channel::Connected&) {}
        static void handleEvent(const Channel::Input&) {}

        void handleEvent(const Channel::Completed& completed)
        {
            logger().debug("QuerySvc::Fsm::handleEvent({}) (id={}).", completed, id_);
            complete(ECANCELED);
        }

        void onAdmitted(AdmitResult::Var&& result)
        {
            ticket_id_.reset();
            if (auto* const failure = cetl::get_if<AdmitResult::Failure>(&result))
            {
                replyError(*failure);
                return;
            }
            ticket_ = cetl::get<AdmitResult::Success>(std::move(result));

            lock_id_ = pipeline().serializer().acquire(core::RequestSerializer::forQuery(scope_),
                                                       deadline_,
                                                       [weak = weakSelf()](auto&& lock_result) {
                                                           //
                                                           if (const auto self = weak.lock())
                                                           {
                                                               self->onLocked(
                                                                   std::forward<decltype(lock_result)>(lock_result));
                                                           }
                                                       });
        }

        void onLocked(AcquireResult::Var&& result)
        {
            lock_id_.reset();
            if (auto* const failure = cetl::get_if<AcquireResult::Failure>(&result))
            {
                replyError(*failure);
                return;
            }
            lease_ = cetl::get<AcquireResult::Success>(std::move(result));

            pipeline().merger().query(scope_, [weak = weakSelf()](auto&& query_result) {
                //
                if (const auto self = weak.lock())
                {
                    self->onSnapshot(std::forward<decltype(query_result)>(query_result));
                }
            });
        }

        void onSnapshot(QueryResult::Var&& result)
        {
            if (auto* const failure = cetl::get_if<QueryResult::Failure>(&result))
            {
                replyError(*failure);
                return;
            }
            const auto& snapshot = cetl::get<QueryResult::Success>(result);

            for (const auto& name_state : snapshot.interfaces)
            {
                Spec::Response response{&memory()};
                auto&          iface = response.set_iface();
                if (const auto err = common::toDsdl(name_state.second, iface, memory()))
                {
                    logger().warn("QuerySvc: interface '{}' is truncated (err={}, fsm_id={}).",
                                  name_state.first,
                                  err,
                                  id_);
                }
                if (const auto err = channel_.send(response))
                {
                    logger().warn("QuerySvc: failed to send interface (err={}, fsm_id={}).", err, id_);
                    complete(err);
                    return;
                }
            }

            using MaxWarnings = common::svc::net::QueryEnd_0_1::_traits_::ArrayCapacity;

            Spec::Response response{&memory()};
            auto&          end = response.set_end();
            end.partial        = snapshot.partial;
            for (const auto& warning : snapshot.warnings)
            {
                if (end.warnings.size() == MaxWarnings::warnings)
                {
                    break;
                }
                common::net::Error_0_1 dsdl_warning{&memory()};
                (void) common::toDsdl(warning, dsdl_warning, memory());
                end.warnings.push_back(std::move(dsdl_warning));
            }
            logger().debug("QuerySvc: sending {} interfaces (partial={}, fsm_id={}).",
                           snapshot.interfaces.size(),
                           snapshot.partial,
                           id_);
            complete(channel_.send(response));
        }

        void replyError(const model::Error& error)
        {
            logger().info("QuerySvc: query has failed - {} (fsm_id={}).", error.message, id_);

            Spec::Response response{&memory()};
            (void) common::toDsdl(error, response.set_error(), memory());
            complete(channel_.send(response));
        }

        void complete(const int err)
        {
            // Cancel anything that might be still pending.
            if (ticket_id_)
            {
                pipeline().gate().cancel(*ticket_id_);
                ticket_id_.reset();
            }
            if (lock_id_)
            {
                pipeline().serializer().cancel(*lock_id_);
                lock_id_.reset();
            }
            lease_.release();
            ticket_.release();

            channel_.complete(err);

            service_.releaseFsmBy(id_);
        }

        const Id                                           id_;
        Channel                                            channel_;
        QueryServiceImpl&                                  service_;
        core::Scope                                        scope_{core::Scope::all()};
        libcyphal::TimePoint                               deadline_{};
        cetl::optional<core::RequestGate::TicketId>        ticket_id_;
        cetl::optional<core::RequestSerializer::RequestId> lock_id_;
        core::RequestGate::Ticket                          ticket_;
        core::RequestSerializer::Lease                     lease_;

    };  // Fsm

    void releaseFsmBy(const Fsm::Id fsm_id)
    {
        id_to_fsm_.erase(fsm_id);
    }

    const ScvContext&                     context_;
    std::uint64_t                         next_fsm_id_{0};
    std::unordered_map<Fsm::Id, Fsm::Ptr> id_to_fsm_;
    common::LoggerPtr                     logger_{common::getLogger(common::logger_names::Svc)};

};  // QueryServiceImpl

}  // namespace

void QueryService::registerWithContext(const ScvContext& context)
{
    using Impl = QueryServiceImpl;
    context.ipc_router.registerService<Impl::Spec>(Impl(context));
}

}  // namespace net
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
