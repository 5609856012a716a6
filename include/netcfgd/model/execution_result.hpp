//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_MODEL_EXECUTION_RESULT_HPP_INCLUDED
#define NETCFGD_MODEL_EXECUTION_RESULT_HPP_INCLUDED

#include "error.hpp"
#include "operation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace netcfgd
{
namespace model
{

using CheckpointId = std::uint64_t;

/// Final outcome of an apply (or rollback) request.
///
struct ExecutionResult
{
    ExecutionState state{ExecutionState::Planned};

    /// Zero if no checkpoint has been created (f.e. planning has failed).
    CheckpointId checkpoint_id{0};

    cetl::optional<Error> error;

    /// Interfaces which were successfully restored to their pre-change state.
    std::vector<std::string> reverted;

    /// Interfaces whose restoration has failed, so their state is unknown.
    std::vector<std::string> indeterminate;

};  // ExecutionResult

}  // namespace model
}  // namespace netcfgd

#endif  // NETCFGD_MODEL_EXECUTION_RESULT_HPP_INCLUDED
