//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_SVC_NET_COMMIT_CLIENT_HPP_INCLUDED
#define NETCFGD_SDK_SVC_NET_COMMIT_CLIENT_HPP_INCLUDED

#include "ipc/client_router.hpp"
#include "svc/net/commit_spec.hpp"

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

/// Client side of the `commit` service.
///
class CommitClient
{
public:
    using Ptr    = std::shared_ptr<CommitClient>;
    using Spec   = common::svc::net::CommitSpec;
    using Result = NetworkState::Commit::Result;

    CETL_NODISCARD static Ptr make(const common::ipc::ClientRouter::Ptr& ipc_router, Spec::Request&& request);

    CommitClient(CommitClient&&)                 = delete;
    CommitClient(const CommitClient&)            = delete;
    CommitClient& operator=(CommitClient&&)      = delete;
    CommitClient& operator=(const CommitClient&) = delete;

    virtual ~CommitClient() = default;

    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    CommitClient() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // CommitClient

}  // namespace net
}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_SVC_NET_COMMIT_CLIENT_HPP_INCLUDED
