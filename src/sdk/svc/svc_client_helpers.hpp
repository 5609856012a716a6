//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_SVC_CLIENT_HELPERS_HPP_INCLUDED
#define NETCFGD_SDK_SVC_CLIENT_HELPERS_HPP_INCLUDED

#include "ipc/ipc_types.hpp"

#include "netcfgd/model/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstring>
#include <string>

namespace netcfgd
{
namespace sdk
{
namespace svc
{

/// Makes an error which reports failed communication with the daemon.
///
inline model::Error makeTransportError(const char* const op_name, const int err)
{
    return model::Error::make(model::ErrorKind::BackendUnavailable,
                              fmt::format("Failed to communicate with the daemon during `{}` (err={}, {}).",
                                          op_name,
                                          err,
                                          std::strerror(err)));
}

/// Makes an error which reports a daemon response which doesn't follow the protocol.
///
inline model::Error makeProtocolError(const char* const op_name, const std::string& details)
{
    return model::Error::make(model::ErrorKind::InvalidRequest,
                              fmt::format("Unexpected daemon response to `{}`: {}.", op_name, details));
}

}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_SVC_CLIENT_HELPERS_HPP_INCLUDED
