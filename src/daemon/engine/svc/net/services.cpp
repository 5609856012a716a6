//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "services.hpp"

#include "apply_service.hpp"
#include "commit_service.hpp"
#include "query_service.hpp"
#include "rollback_service.hpp"
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

void registerAllServices(const ScvContext& context)
{
    QueryService::registerWithContext(context);
    ApplyService::registerWithContext(context);
    CommitService::registerWithContext(context);
    RollbackService::registerWithContext(context);
}

}  // namespace net
}  // namespace svc
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
