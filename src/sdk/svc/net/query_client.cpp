//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "query_client.hpp"

#include "ipc/channel.hpp"
#include "ipc/client_router.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "svc/net/query_spec.hpp"
#include "svc/svc_client_helpers.hpp"

#include "netcfgd/common/net/Error_0_1.hpp"
#include "netcfgd/common/net/Interface_0_1.hpp"
#include "netcfgd/common/svc/net/QueryEnd_0_1.hpp"
#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"

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

class QueryClientImpl final : public QueryClient
{
public:
    QueryClientImpl(const common::ipc::ClientRouter::Ptr& ipc_router, Spec::Request&& request)
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
        logger_->trace("QueryClient::handleEvent({}).", connected);

        if (const auto err = channel_.send(request_))
        {
            deliver(makeTransportError("query", err));
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
                [this](const common::net::Interface_0_1& iface) {
                    //
                    auto state = common::fromDsdl(iface);
                    auto name  = state.name;
                    snapshot_.interfaces[std::move(name)] = std::move(state);
                },
                [this](const common::net::Error_0_1& error) {
                    //
                    deliver(common::fromDsdl(error));
                },
                [this](const common::svc::net::QueryEnd_0_1& end) {
                    //
                    snapshot_.partial = end.partial;
                    for (const auto& warning : end.warnings)
                    {
                        snapshot_.warnings.push_back(common::fromDsdl(warning));
                    }
                    deliver(std::move(snapshot_));
                }),
            input.union_value);
    }

    void handleEvent(const Channel::Completed& completed)
    {
        logger_->debug("QueryClient::handleEvent({}).", completed);

        if (completed.error_code != common::ipc::ErrorCode::Success)
        {
            deliver(makeTransportError("query", static_cast<int>(completed.error_code)));
            return;
        }
        deliver(makeProtocolError("query", "no final response"));
    }

    /// Delivers the result; only the first one reaches the receiver.
    ///
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
    model::UnifiedSnapshot        snapshot_;

};  // QueryClientImpl

}  // namespace

CETL_NODISCARD QueryClient::Ptr QueryClient::make(const common::ipc::ClientRouter::Ptr& ipc_router,
                                                  Spec::Request&&                       request)
{
    return std::make_shared<QueryClientImpl>(ipc_router, std::move(request));
}

}  // namespace net
}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd
