//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "pipeline.hpp"

#include "state_provider.hpp"

#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

Pipeline::Pipeline(libcyphal::IExecutor& executor, StateProvider& provider, const Settings& settings)
    : executor_{executor}
    , settings_{settings}
    , provider_{executor, provider, settings.provider_timeout}
    , registry_{[this](const std::string& type) {
        //
        return provider_.supportsType(type);
    }}
    , merger_{executor, provider_, registry_, settings.plugin_query_timeout}
    , builder_{provider_, registry_}
    , planner_{merger_, builder_}
    , dispatcher_{executor, provider_, registry_, settings.plugin_apply_timeout}
    , checkpoints_{executor, dispatcher_, settings.checkpoint_retention}
    , plan_executor_{executor, dispatcher_, checkpoints_}
    , serializer_{executor}
    , gate_{executor, settings.max_concurrent_requests, settings.max_queued_requests}
{
}

libcyphal::TimePoint Pipeline::deadlineFor(const std::uint64_t timeout_us) const
{
    const auto timeout = (timeout_us > 0) ? std::chrono::duration_cast<libcyphal::Duration>(
                                              std::chrono::microseconds{static_cast<std::int64_t>(timeout_us)})
                                          : settings_.default_request_timeout;
    return executor_.now() + timeout;
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
