//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_SVC_NET_ROLLBACK_CLIENT_HPP_INCLUDED
#define NETCFGD_SDK_SVC_NET_ROLLBACK_CLIENT_HPP_INCLUDED

#include "ipc/client_router.hpp"
#include "svc/net/rollback_spec.hpp"

#include <netcfgd/sdk/network_state.hpp>

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

/// Client side of the `rollback` service.
///
class RollbackClient
{
public:
    using Ptr    = std::shared_ptr<RollbackClient>;
    using Spec   = common::svc::net::RollbackSpec;
    using Result = NetworkState::Rollback::Result;

    CETL_NODISCARD static Ptr make(const common::ipc::ClientRouter::Ptr& ipc_router, Spec::Request&& request);

    RollbackClient(RollbackClient&&)                 = delete;
    RollbackClient(const RollbackClient&)            = delete;
    RollbackClient& operator=(RollbackClient&&)      = delete;
    RollbackClient& operator=(const RollbackClient&) = delete;

    virtual ~RollbackClient() = default;

    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    RollbackClient() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // RollbackClient

}  // namespace net
}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_SVC_NET_ROLLBACK_CLIENT_HPP_INCLUDED
