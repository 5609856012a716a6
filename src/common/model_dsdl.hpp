//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_MODEL_DSDL_HPP_INCLUDED
#define NETCFGD_COMMON_MODEL_DSDL_HPP_INCLUDED

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/execution_result.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"
#include "netcfgd/model/property.hpp"

#include "netcfgd/common/net/Error_0_1.hpp"
#include "netcfgd/common/net/ExecutionResult_0_1.hpp"
#include "netcfgd/common/net/InterfaceTarget_0_1.hpp"
#include "netcfgd/common/net/Interface_0_1.hpp"
#include "netcfgd/common/net/Operation_0_1.hpp"
#include "netcfgd/common/net/Value_0_1.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

namespace netcfgd
{
namespace common
{

// Conversions between the model types (used everywhere inside the daemon and SDK)
// and their DSDL counterparts (used only on the wire).
//
// `toDsdl` functions fill as much as fits into the DSDL type, and return `EMSGSIZE` if something didn't fit.

template <typename Vla>
int fillDsdlString(Vla& dst, const std::string& src, const std::size_t capacity)
{
    dst.clear();
    const auto size = std::min(src.size(), capacity);
    std::copy(src.cbegin(), src.cbegin() + static_cast<std::ptrdiff_t>(size), std::back_inserter(dst));
    return (size < src.size()) ? EMSGSIZE : 0;
}

template <typename Vla>
std::string fromDsdlString(const Vla& src)
{
    return std::string{src.cbegin(), src.cend()};
}

int                  toDsdl(const model::PropertyValue& value, net::Value_0_1& out);
model::PropertyValue fromDsdl(const net::Value_0_1& value);

int toDsdl(const model::InterfaceState& state, net::Interface_0_1& out, cetl::pmr::memory_resource& memory);
model::InterfaceState fromDsdl(const net::Interface_0_1& iface);

int toDsdl(const model::InterfaceTarget& target, net::InterfaceTarget_0_1& out, cetl::pmr::memory_resource& memory);
model::InterfaceTarget fromDsdl(const net::InterfaceTarget_0_1& target);

int          toDsdl(const model::Error& error, net::Error_0_1& out, cetl::pmr::memory_resource& memory);
model::Error fromDsdl(const net::Error_0_1& error);

int toDsdl(const model::Operation& operation, net::Operation_0_1& out, cetl::pmr::memory_resource& memory);
model::Operation fromDsdl(const net::Operation_0_1& operation);

int toDsdl(const model::ExecutionResult& result, net::ExecutionResult_0_1& out, cetl::pmr::memory_resource& memory);
model::ExecutionResult fromDsdl(const net::ExecutionResult_0_1& result);

/// Decodes an operation kind; unknown values are not accepted.
cetl::optional<model::OperationKind> operationKindFromDsdl(const std::uint8_t kind);

}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_MODEL_DSDL_HPP_INCLUDED
