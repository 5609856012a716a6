//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "apply_service.hpp"

#include "core/dependency_graph_builder.hpp"
#include "core/pipeline.hpp"
#include "core/plan.hpp"
#include "core/plan_executor.hpp"
#include "core/planner.hpp"
#include "core/request_gate.hpp"
#include "core/request_serializer.hpp"
#include "ipc/channel.hpp"
#include "ipc/server_router.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/net/apply_spec.hpp"
#include "svc/svc_helpers.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
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

class ApplyServiceImpl final
{
public:
    using Spec    = common::svc::net::ApplySpec;
    using Channel = common::ipc::ServerChannelOf<Spec>;

    explicit ApplyServiceImpl(const ScvContext& context)
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
    /// Admission -> locks -> plan -> operations (streamed) -> execution -> result.
    ///
    /// Once execution has started, a client disconnect doesn't stop it - the run completes
    /// (or rolls back) while still holding its admission and locks, and the result is dropped.
    ///
    class Fsm final : public std::enable_shared_from_this<Fsm>  // Finite State Machine
    {
    public:
        using Id  = std::uint64_t;
        using Ptr = std::shared_ptr<Fsm>;

        Fsm(ApplyServiceImpl& service, const Id id, Channel&& channel)
            : id_{id}
            , channel_{std::move(channel)}
            , service_{service}
        {
            logger().trace("ApplySvc::Fsm (id={}).", id_);

            channel_.subscribe([this](const auto& event_var) {
                //
                cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
            });
        }

        ~Fsm()
        {
            logger().trace("ApplySvc::~Fsm (id={}).", id_);
        }

        Fsm(const Fsm&)                = delete;
        Fsm(Fsm&&) noexcept            = delete;
        Fsm& operator=(const Fsm&)     = delete;
        Fsm& operator=(Fsm&&) noexcept = delete;

        void start(const Spec::Request& request)
        {
            for (const auto& target : request.interfaces)
            {
                desired_.interfaces.push_back(common::fromDsdl(target));
            }
            auto_commit_ = request.auto_commit;
            deadline_    = pipeline().deadlineFor(request.timeout_us);

            logger().trace("ApplySvc::Fsm::start (ifaces={}, auto_commit={}, fsm_id={}).",
                           desired_.interfaces.size(),
                           auto_commit_,
                           id_);

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
        using PlanResult    = core::Planner::PlanResult;

        /// Admission and locks of a running plan - kept until the run ends, even if this FSM is gone.
        struct Holding final
        {
            core::RequestGate::Ticket      ticket;
            core::RequestSerializer::Lease lease;
        };

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
            logger().debug("ApplySvc::Fsm::handleEvent({}) (id={}).", completed, id_);
            complete(ECANCELED);
        }

        void onAdmitted(AdmitResult::Var&& result)
        {
            ticket_id_.reset();
            if (auto* const failure = cetl::get_if<AdmitResult::Failure>(&result))
            {
                replyError(std::move(*failure));
                return;
            }
            ticket_ = cetl::get<AdmitResult::Success>(std::move(result));

            // The planner snapshots the very same scope under these locks.
            const auto scope = core::DependencyGraphBuilder::scopeOf(desired_);
            lock_id_         = pipeline().serializer().acquire(core::RequestSerializer::forApply(scope),
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
                replyError(std::move(*failure));
                return;
            }
            lease_ = cetl::get<AcquireResult::Success>(std::move(result));

            pipeline().planner().plan(std::move(desired_), [weak = weakSelf()](auto&& plan_result) {
                //
                if (const auto self = weak.lock())
                {
                    self->onPlanned(std::forward<decltype(plan_result)>(plan_result));
                }
            });
        }

        void onPlanned(PlanResult::Var&& result)
        {
            if (auto* const failure = cetl::get_if<PlanResult::Failure>(&result))
            {
                replyError(std::move(*failure));
                return;
            }
            auto plan = cetl::get<PlanResult::Success>(std::move(result));

            for (const auto& operation : plan.operations)
            {
                Spec::Response response{&memory()};
                if (const auto err = common::toDsdl(operation, response.set_operation(), memory()))
                {
                    logger().warn("ApplySvc: operation {} is truncated (err={}, fsm_id={}).", operation.id, err, id_);
                }
                if (const auto err = channel_.send(response))
                {
                    // The client is gone, but nothing has been changed yet - so just stop.
                    logger().warn("ApplySvc: failed to send operation (err={}, fsm_id={}).", err, id_);
                    complete(err);
                    return;
                }
            }

            auto holding = std::make_shared<Holding>(Holding{std::move(ticket_), std::move(lease_)});
            pipeline().planExecutor().execute(std::move(plan),
                                              auto_commit_,
                                              [weak = weakSelf(), holding](model::ExecutionResult&& exec_result) {
                                                  //
                                                  if (const auto self = weak.lock())
                                                  {
                                                      self->onExecuted(std::move(exec_result));
                                                  }
                                                  holding->lease.release();
                                                  holding->ticket.release();
                                              });
        }

        void onExecuted(model::ExecutionResult&& result)
        {
            logger().debug("ApplySvc: plan is {} (cp_id={}, fsm_id={}).",
                           model::toString(result.state),
                           result.checkpoint_id,
                           id_);
            sendResult(result);
        }

        void replyError(model::Error&& error)
        {
            logger().info("ApplySvc: request has failed before execution - {} (fsm_id={}).", error.message, id_);

            // Nothing has been executed.
            model::ExecutionResult result;
            result.state = model::ExecutionState::Planned;
            result.error = std::move(error);
            sendResult(result);
        }

        void sendResult(const model::ExecutionResult& result)
        {
            Spec::Response response{&memory()};
            if (const auto err = common::toDsdl(result, response.set_result(), memory()))
            {
                logger().warn("ApplySvc: result is truncated (err={}, fsm_id={}).", err, id_);
            }
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
        ApplyServiceImpl&                                  service_;
        model::DesiredState                                desired_;
        bool                                               auto_commit_{true};
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

};  // ApplyServiceImpl

}  // namespace

void ApplyService::registerWithContext(const ScvContext& context)
{
    using Impl = ApplyServiceImpl;
    context.ipc_router.registerService<Impl::Spec>(Impl(context));
}

}  // namespace net
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
