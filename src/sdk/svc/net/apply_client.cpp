//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "apply_client.hpp"

#include "ipc/channel.hpp"
#include "ipc/client_router.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/net/apply_spec.hpp"
#include "svc/svc_client_helpers.hpp"

#include "netcfgd/common/net/ExecutionResult_0_1.hpp"
#include "netcfgd/common/net/Operation_0_1.hpp"

#include <uavcan/primitive/Empty_1_0.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

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

class ApplyClientImpl final : public ApplyClient
{
public:
    ApplyClientImpl(const common::ipc::ClientRouter::Ptr& ipc_router, Spec::Request&& request)
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
        logger_->trace("ApplyClient::handleEvent({}).", connected);

        if (const auto err = channel_.send(request_))
        {
            deliver(makeTransportError("apply", err));
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
                [this](const common::net::Operation_0_1& operation) {
                    //
                    success_.operations.push_back(common::fromDsdl(operation));
                },
                [this](const common::net::ExecutionResult_0_1& result) {
                    //
                    success_.result = common::fromDsdl(result);
                    deliver(std::move(success_));
                }),
            input.union_value);
    }

    void handleEvent(const Channel::Completed& completed)
    {
        logger_->debug("ApplyClient::handleEvent({}).", completed);

        if (completed.error_code != common::ipc::ErrorCode::Success)
        {
            deliver(makeTransportError("apply", static_cast<int>(completed.error_code)));
            return;
        }
        deliver(makeProtocolError("apply", "no final result"));
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
    NetworkState::Apply::Success  success_;

};  // ApplyClientImpl

}  // namespace

CETL_NODISCARD ApplyClient::Ptr ApplyClient::make(const common::ipc::ClientRouter::Ptr& ipc_router,
                                                  Spec::Request&&                       request)
{
    return std::make_shared<ApplyClientImpl>(ipc_router, std::move(request));
}

}  // namespace net
}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd
