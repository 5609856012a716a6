//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "rollback_service.hpp"

#include "core/checkpoint_manager.hpp"
#include "core/pipeline.hpp"
#include "core/request_gate.hpp"
#include "core/request_serializer.hpp"
#include "ipc/channel.hpp"
#include "ipc/server_router.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/net/rollback_spec.hpp"
#include "svc/svc_helpers.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
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

class RollbackServiceImpl final
{
public:
    using Spec    = common::svc::net::RollbackSpec;
    using Channel = common::ipc::ServerChannelOf<Spec>;

    explicit RollbackServiceImpl(const ScvContext& context)
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
    /// Admission -> locks (of the checkpoint's interfaces) -> reversal -> result.
    ///
    class Fsm final : public std::enable_shared_from_this<Fsm>  // Finite State Machine
    {
    public:
        using Id  = std::uint64_t;
        using Ptr = std::shared_ptr<Fsm>;

        Fsm(RollbackServiceImpl& service, const Id id, Channel&& channel)
            : id_{id}
            , channel_{std::move(channel)}
            , service_{service}
        {
            logger().trace("RollbackSvc::Fsm (id={}).", id_);

            channel_.subscribe([this](const auto& event_var) {
                //
                cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
            });
        }

        ~Fsm()
        {
            logger().trace("RollbackSvc::~Fsm (id={}).", id_);
        }

        Fsm(const Fsm&)                = delete;
        Fsm(Fsm&&) noexcept            = delete;
        Fsm& operator=(const Fsm&)     = delete;
        Fsm& operator=(Fsm&&) noexcept = delete;

        void start(const Spec::Request& request)
        {
            checkpoint_id_ = request.checkpoint_id;
            deadline_      = pipeline().deadlineFor(request.timeout_us);

            logger().trace("RollbackSvc::Fsm::start (cp_id={}, fsm_id={}).", checkpoint_id_, id_);

            ticket_id_ = pipeline().gate().admit(deadline_, [weak = weakSelf()](auto&& result) {
                //
                if (const auto self = weak.lock())
                {
                    self->onAdmitted(std::forward<decltype(result)>(result));
                }
            });
        }

    private:
        using AdmitResult    = core::RequestGate::AdmitResult;
        using AcquireResult  = core::RequestSerializer::AcquireResult;
        using RollbackResult = core::CheckpointManager::RollbackResult;

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
            logger().debug("RollbackSvc::Fsm::handleEvent({}) (id={}).", completed, id_);
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

            const auto touched = pipeline().checkpoints().touchedInterfaces(checkpoint_id_);
            const std::set<std::string> names{touched.cbegin(), touched.cend()};
            lock_id_ = pipeline().serializer().acquire(core::RequestSerializer::forApply(names),
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

            auto holding = std::make_shared<Holding>(
                Holding{std::move(ticket_), cetl::get<AcquireResult::Success>(std::move(result))});
            pipeline().checkpoints().rollback(checkpoint_id_,
                                              [weak = weakSelf(), holding](RollbackResult::Var&& rollback_result) {
                                                  //
                                                  if (const auto self = weak.lock())
                                                  {
                                                      self->onRolledBack(std::move(rollback_result));
                                                  }
                                                  holding->lease.release();
                                                  holding->ticket.release();
                                              });
        }

        void onRolledBack(RollbackResult::Var&& rollback_result)
        {
            if (auto* const failure = cetl::get_if<RollbackResult::Failure>(&rollback_result))
            {
                replyError(std::move(*failure));
                return;
            }
            auto& reverted = cetl::get<RollbackResult::Success>(rollback_result);

            model::ExecutionResult result;
            result.checkpoint_id = checkpoint_id_;
            result.state         = reverted.indeterminate.empty() ? model::ExecutionState::RolledBack
                                                                  : model::ExecutionState::Failed;
            result.reverted      = std::move(reverted.reverted);
            result.indeterminate = std::move(reverted.indeterminate);
            if (!result.indeterminate.empty())
            {
                result.error = model::Error::make(model::ErrorKind::OperationFailed,
                                                  "Some interfaces could not be restored.",
                                                  result.indeterminate);
            }
            sendResult(result);
        }

        void replyError(model::Error&& error)
        {
            logger().info("RollbackSvc: rollback has failed - {} (cp_id={}, fsm_id={}).",
                          error.message,
                          checkpoint_id_,
                          id_);

            // Report the state the checkpoint has actually ended in.
            model::ExecutionResult result;
            result.checkpoint_id = checkpoint_id_;
            result.state         = model::ExecutionState::Failed;
            if (const auto status = pipeline().checkpoints().statusOf(checkpoint_id_))
            {
                switch (*status)
                {
                case core::CheckpointManager::Status::Committed:
                    result.state = model::ExecutionState::Committed;
                    break;
                case core::CheckpointManager::Status::Pending:
                case core::CheckpointManager::Status::Expired:
                    result.state = model::ExecutionState::Applied;
                    break;
                case core::CheckpointManager::Status::RolledBack:
                    result.state = model::ExecutionState::RolledBack;
                    break;
                default:
                    break;
                }
            }
            result.error = std::move(error);
            sendResult(result);
        }

        void sendResult(const model::ExecutionResult& result)
        {
            Spec::Response response{&memory()};
            if (const auto err = common::toDsdl(result, response.result, memory()))
            {
                logger().warn("RollbackSvc: result is truncated (err={}, fsm_id={}).", err, id_);
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
            ticket_.release();

            channel_.complete(err);

            service_.releaseFsmBy(id_);
        }

        const Id                                           id_;
        Channel                                            channel_;
        RollbackServiceImpl&                               service_;
        model::CheckpointId                                checkpoint_id_{0};
        libcyphal::TimePoint                               deadline_{};
        cetl::optional<core::RequestGate::TicketId>        ticket_id_;
        cetl::optional<core::RequestSerializer::RequestId> lock_id_;
        core::RequestGate::Ticket                          ticket_;

    };  // Fsm

    void releaseFsmBy(const Fsm::Id fsm_id)
    {
        id_to_fsm_.erase(fsm_id);
    }

    const ScvContext&                     context_;
    std::uint64_t                         next_fsm_id_{0};
    std::unordered_map<Fsm::Id, Fsm::Ptr> id_to_fsm_;
    common::LoggerPtr                     logger_{common::getLogger(common::logger_names::Svc)};

};  // RollbackServiceImpl

}  // namespace

void RollbackService::registerWithContext(const ScvContext& context)
{
    using Impl = RollbackServiceImpl;
    context.ipc_router.registerService<Impl::Spec>(Impl(context));
}

}  // namespace net
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
