//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "commit_service.hpp"

#include "core/checkpoint_manager.hpp"
#include "core/pipeline.hpp"
#include "ipc/channel.hpp"
#include "ipc/server_router.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/net/commit_spec.hpp"
#include "svc/svc_helpers.hpp"

#include "netcfgd/common/net/Error_0_1.hpp"

#include <cetl/pf17/cetlpf.hpp>

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

/// Commit doesn't touch any interface, so it is handled right away (without admission or locks).
///
class CommitServiceImpl final
{
public:
    using Spec    = common::svc::net::CommitSpec;
    using Channel = common::ipc::ServerChannelOf<Spec>;

    explicit CommitServiceImpl(const ScvContext& context)
        : context_{context}
    {
    }

    void operator()(Channel&& ch, const Spec::Request& request)
    {
        logger_->debug("New '{}' service channel (cp_id={}).", Spec::svc_full_name(), request.checkpoint_id);

        Spec::Response response{&context_.memory};

        auto result = context_.pipeline.checkpoints().commit(request.checkpoint_id);
        if (const auto* const failure = cetl::get_if<core::CheckpointManager::CommitResult::Failure>(&result))
        {
            logger_->info("CommitSvc: commit has failed - {} (cp_id={}).", failure->message, request.checkpoint_id);

            common::net::Error_0_1 error{&context_.memory};
            (void) common::toDsdl(*failure, error, context_.memory);
            response.error.push_back(std::move(error));
        }

        if (const auto err = ch.sendAndComplete(response))
        {
            logger_->warn("CommitSvc: failed to send response (err={}, cp_id={}).", err, request.checkpoint_id);
        }
    }

private:
    const ScvContext& context_;
    common::LoggerPtr logger_{common::getLogger(common::logger_names::Svc)};

};  // CommitServiceImpl

}  // namespace

void CommitService::registerWithContext(const ScvContext& context)
{
    using Impl = CommitServiceImpl;
    context.ipc_router.registerService<Impl::Spec>(Impl(context));
}

}  // namespace net
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
