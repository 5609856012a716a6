//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_SVC_NET_COMMIT_SPEC_HPP_INCLUDED
#define NETCFGD_COMMON_SVC_NET_COMMIT_SPEC_HPP_INCLUDED

#include "netcfgd/common/svc/net/Commit_0_1.hpp"

namespace netcfgd
{
namespace common
{
namespace svc
{
namespace net
{

struct CommitSpec
{
    using Request  = Commit::Request_0_1;
    using Response = Commit::Response_0_1;

    using ClientMsg = Request;
    using ServerMsg = Response;

    constexpr auto static svc_full_name()
    {
        return "netcfgd.svc.net.commit";
    }

    CommitSpec() = delete;
};

}  // namespace net
}  // namespace svc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_SVC_NET_COMMIT_SPEC_HPP_INCLUDED
