//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_SVC_NET_QUERY_SERVICE_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_SVC_NET_QUERY_SERVICE_HPP_INCLUDED

#include "svc/svc_helpers.hpp"

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

/// Defines registration factory of the 'Query' network service.
///
class QueryService
{
public:
    QueryService() = delete;
    static void registerWithContext(const ScvContext& context);

};  // QueryService

}  // namespace net
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_SVC_NET_QUERY_SERVICE_HPP_INCLUDED
