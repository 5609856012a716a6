//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_SVC_NET_QUERY_CLIENT_HPP_INCLUDED
#define NETCFGD_SDK_SVC_NET_QUERY_CLIENT_HPP_INCLUDED

#include "ipc/client_router.hpp"
#include "svc/net/query_spec.hpp"

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

/// Client side of the `query` service - collects the streamed interfaces into a snapshot.
///
class QueryClient
{
public:
    using Ptr    = std::shared_ptr<QueryClient>;
    using Spec   = common::svc::net::QuerySpec;
    using Result = NetworkState::Query::Result;

    CETL_NODISCARD static Ptr make(const common::ipc::ClientRouter::Ptr& ipc_router, Spec::Request&& request);

    QueryClient(QueryClient&&)                 = delete;
    QueryClient(const QueryClient&)            = delete;
    QueryClient& operator=(QueryClient&&)      = delete;
    QueryClient& operator=(const QueryClient&) = delete;

    virtual ~QueryClient() = default;

    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    QueryClient() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // QueryClient

}  // namespace net
}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_SVC_NET_QUERY_CLIENT_HPP_INCLUDED
