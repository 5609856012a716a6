//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <netcfgd/sdk/network_state.hpp>

#include "ipc/client_router.hpp"
#include "logging.hpp"
#include "model_dsdl.hpp"
#include "sdk_factory.hpp"
#include "svc/as_sender.hpp"
#include "svc/net/apply_client.hpp"
#include "svc/net/commit_client.hpp"
#include "svc/net/query_client.hpp"
#include "svc/net/rollback_client.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/sdk/execution.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace netcfgd
{
namespace sdk
{
namespace
{

/// Sender of an already known result - used for requests rejected before reaching the daemon.
///
template <typename Result>
class ReadySender final : public SenderOf<Result>
{
public:
    explicit ReadySender(Result&& result)
        : result_{std::move(result)}
    {
    }

    void start(typename SenderOf<Result>::Receiver&& receiver) override
    {
        receiver(std::move(result_));
    }

private:
    Result result_;

};  // ReadySender

class NetworkStateImpl final : public NetworkState
{
public:
    NetworkStateImpl(cetl::pmr::memory_resource& memory, common::ipc::ClientRouter::Ptr ipc_router)
        : memory_{memory}
        , ipc_router_{std::move(ipc_router)}
        , logger_{common::getLogger(common::logger_names::Sdk)}
    {
    }

    // NetworkState

    SenderOf<Query::Result>::Ptr query(const std::string& iface, const std::chrono::microseconds timeout) override
    {
        using QueryClient = svc::net::QueryClient;
        using Capacity    = QueryClient::Spec::Request::_traits_::ArrayCapacity;

        QueryClient::Spec::Request request{&memory_};
        request.timeout_us = toTimeoutUs(timeout);
        if (0 != common::fillDsdlString(request.iface, iface, Capacity::iface))
        {
            return rejected<Query::Result>("Interface name is too long.");
        }

        auto svc_client = QueryClient::make(ipc_router_, std::move(request));
        return std::make_unique<svc::AsSender<QueryClient, Query::Result>>("query", std::move(svc_client), logger_);
    }

    SenderOf<Apply::Result>::Ptr apply(const model::DesiredState&      desired,
                                       const bool                      auto_commit,
                                       const std::chrono::microseconds timeout) override
    {
        using ApplyClient = svc::net::ApplyClient;
        using Capacity    = ApplyClient::Spec::Request::_traits_::ArrayCapacity;

        if (desired.interfaces.size() > Capacity::interfaces)
        {
            return rejected<Apply::Result>("Too many interfaces in a single request (max " +
                                           std::to_string(Capacity::interfaces) + ").");
        }

        ApplyClient::Spec::Request request{&memory_};
        request.timeout_us  = toTimeoutUs(timeout);
        request.auto_commit = auto_commit;
        request.interfaces.reserve(desired.interfaces.size());
        for (const auto& target : desired.interfaces)
        {
            request.interfaces.emplace_back();
            if (0 != common::toDsdl(target, request.interfaces.back(), memory_))
            {
                return rejected<Apply::Result>("Desired state of '" + target.name + "' doesn't fit into a request.");
            }
        }

        auto svc_client = ApplyClient::make(ipc_router_, std::move(request));
        return std::make_unique<svc::AsSender<ApplyClient, Apply::Result>>("apply", std::move(svc_client), logger_);
    }

    SenderOf<Commit::Result>::Ptr commit(const model::CheckpointId checkpoint_id) override
    {
        using CommitClient = svc::net::CommitClient;

        CommitClient::Spec::Request request{&memory_};
        request.checkpoint_id = checkpoint_id;

        auto svc_client = CommitClient::make(ipc_router_, std::move(request));
        return std::make_unique<svc::AsSender<CommitClient, Commit::Result>>("commit", std::move(svc_client), logger_);
    }

    SenderOf<Rollback::Result>::Ptr rollback(const model::CheckpointId       checkpoint_id,
                                             const std::chrono::microseconds timeout) override
    {
        using RollbackClient = svc::net::RollbackClient;

        RollbackClient::Spec::Request request{&memory_};
        request.timeout_us    = toTimeoutUs(timeout);
        request.checkpoint_id = checkpoint_id;

        auto svc_client = RollbackClient::make(ipc_router_, std::move(request));
        return std::make_unique<svc::AsSender<RollbackClient, Rollback::Result>>("rollback",
                                                                                 std::move(svc_client),
                                                                                 logger_);
    }

private:
    static std::uint64_t toTimeoutUs(const std::chrono::microseconds timeout)
    {
        return static_cast<std::uint64_t>(std::max<std::chrono::microseconds::rep>(0, timeout.count()));
    }

    template <typename Result>
    typename SenderOf<Result>::Ptr rejected(std::string message) const
    {
        logger_->warn("Request is rejected locally: {}", message);
        return std::make_unique<ReadySender<Result>>(
            Result{model::Error::make(model::ErrorKind::InvalidRequest, std::move(message))});
    }

    cetl::pmr::memory_resource&    memory_;
    common::ipc::ClientRouter::Ptr ipc_router_;
    common::LoggerPtr              logger_;

};  // NetworkStateImpl

}  // namespace

CETL_NODISCARD NetworkState::Ptr Factory::makeNetworkState(cetl::pmr::memory_resource&    memory,
                                                           common::ipc::ClientRouter::Ptr ipc_router)
{
    return std::make_shared<NetworkStateImpl>(memory, std::move(ipc_router));
}

}  // namespace sdk
}  // namespace netcfgd
