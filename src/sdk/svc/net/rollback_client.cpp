//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "rollback_client.hpp"

#include "ipc/channel.hpp"
#include "ipc/client_router.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/net/rollback_spec.hpp"
#include "svc/svc_client_helpers.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace netcfgd
{
namespace sdk
{
namespace svc
{
namespace net
{
namespace
{

class RollbackClientImpl final : public RollbackClient
{
public:
    RollbackClientImpl(const common::ipc::ClientRouter::Ptr& ipc_router, Spec::Request&& request)
        : logger_{common::getLogger(common::logger_names::Sdk)}
        , request_{std::move(request)}
        , channel_{ipc_router->makeChannel<Spec>()}
    {
    }

    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver_ = std::move(receiver);

        channel_.subscribe([this](const auto& event_var) {
            //
            cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
        });
    }

private:
    using Channel = common::ipc::ClientChannelOf<Spec>;

    void handleEvent(const Channel::Connected& connected)
    {
        logger_->trace("RollbackClient::handleEvent({}).", connected);

        if (const auto err = channel_.send(request_))
        {
            deliver(makeTransportError("rollback", err));
        }
    }

    void handleEvent(const Channel::Input& input)
    {
        deliver(common::fromDsdl(input.result));
    }

    void handleEvent(const Channel::Completed& completed)
    {
        logger_->debug("RollbackClient::handleEvent({}).", completed);

        if (completed.error_code != common::ipc::ErrorCode::Success)
        {
            deliver(makeTransportError("rollback", static_cast<int>(completed.error_code)));
            return;
        }
        deliver(makeProtocolError("rollback", "no response"));
    }

    void deliver(Result&& result)
    {
        if (receiver_)
        {
            auto receiver = std::move(receiver_);
            receiver_     = nullptr;
            receiver(std::move(result));
        }
    }

    common::LoggerPtr             logger_;
    Spec::Request                 request_;
    Channel                       channel_;
    std::function<void(Result&&)> receiver_;

};  // RollbackClientImpl

}  // namespace

CETL_NODISCARD RollbackClient::Ptr RollbackClient::make(const common::ipc::ClientRouter::Ptr& ipc_router,
                                                    Spec::Request&&                       request)
{
    return std::make_shared<RollbackClientImpl>(ipc_router, std::move(request));
}

}  // namespace net
}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd
