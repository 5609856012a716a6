//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_CLI_PRINTER_HPP_INCLUDED
#define NETCFGD_CLI_PRINTER_HPP_INCLUDED

#include <netcfgd/model/error.hpp>
#include <netcfgd/model/execution_result.hpp>
#include <netcfgd/model/interface_state.hpp>
#include <netcfgd/model/operation.hpp>

#include <ostream>
#include <vector>

namespace netcfgd
{
namespace cli
{

/// Prints interfaces as TOML-like text (`[[interface]]` tables), so that the output
/// could be edited and fed back to `netcfgctl apply`.
///
void printSnapshot(std::ostream& out, const model::UnifiedSnapshot& snapshot);

void printOperations(std::ostream& out, const std::vector<model::Operation>& operations);

void printResult(std::ostream& out, const model::ExecutionResult& result);

void printError(std::ostream& out, const model::Error& error);

/// `true` if the result state means that the request has fully succeeded.
///
bool isSuccess(const model::ExecutionResult& result);

}  // namespace cli
}  // namespace netcfgd

#endif  // NETCFGD_CLI_PRINTER_HPP_INCLUDED
