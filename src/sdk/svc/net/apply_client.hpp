//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_SVC_NET_APPLY_CLIENT_HPP_INCLUDED
#define NETCFGD_SDK_SVC_NET_APPLY_CLIENT_HPP_INCLUDED

#include "ipc/client_router.hpp"
#include "svc/net/apply_spec.hpp"

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

/// Client side of the `apply` service - collects the streamed plan and the final result.
///
class ApplyClient
{
public:
    using Ptr    = std::shared_ptr<ApplyClient>;
    using Spec   = common::svc::net::ApplySpec;
    using Result = NetworkState::Apply::Result;

    CETL_NODISCARD static Ptr make(const common::ipc::ClientRouter::Ptr& ipc_router, Spec::Request&& request);

    ApplyClient(ApplyClient&&)                 = delete;
    ApplyClient(const ApplyClient&)            = delete;
    ApplyClient& operator=(ApplyClient&&)      = delete;
    ApplyClient& operator=(const ApplyClient&) = delete;

    virtual ~ApplyClient() = default;

    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    ApplyClient() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // ApplyClient

}  // namespace net
}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_SVC_NET_APPLY_CLIENT_HPP_INCLUDED
