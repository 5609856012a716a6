//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "model_dsdl.hpp"

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
#include "netcfgd/common/net/Property_0_1.hpp"
#include "netcfgd/common/net/Value_0_1.hpp"
#include "uavcan/primitive/Empty_1_0.hpp"
#include "uavcan/primitive/String_1_0.hpp"
#include "uavcan/primitive/scalar/Bit_1_0.hpp"
#include "uavcan/primitive/scalar/Integer64_1_0.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace common
{
namespace
{

using StringCapacity = uavcan::primitive::String_1_0::_traits_::ArrayCapacity;

/// Keeps the first error (if any) - so that conversion continues but reports the problem.
///
void keepFirstError(int& result, const int err)
{
    if ((result == 0) && (err != 0))
    {
        result = err;
    }
}

template <typename PropertyVla>
int propertiesToDsdl(const model::Properties&    properties,
                     PropertyVla&                out,
                     const std::size_t           capacity,
                     cetl::pmr::memory_resource& memory)
{
    using Capacity = net::Property_0_1::_traits_::ArrayCapacity;

    int result = 0;
    out.clear();
    for (const auto& key_value : properties)
    {
        if (out.size() >= capacity)
        {
            keepFirstError(result, EMSGSIZE);
            break;
        }

        net::Property_0_1 property{&memory};
        keepFirstError(result, fillDsdlString(property.key, key_value.first, Capacity::key));
        keepFirstError(result, toDsdl(key_value.second, property.value));
        out.push_back(std::move(property));
    }
    return result;
}

template <typename PropertyVla>
model::Properties propertiesFromDsdl(const PropertyVla& properties)
{
    model::Properties result;
    for (const auto& property : properties)
    {
        result[fromDsdlString(property.key)] = fromDsdl(property.value);
    }
    return result;
}

template <typename StringVla>
int stringsToDsdl(const std::vector<std::string>& strings,
                  StringVla&                      out,
                  const std::size_t               capacity,
                  cetl::pmr::memory_resource&     memory)
{
    int result = 0;
    out.clear();
    for (const auto& str : strings)
    {
        if (out.size() >= capacity)
        {
            keepFirstError(result, EMSGSIZE);
            break;
        }

        uavcan::primitive::String_1_0 item{&memory};
        keepFirstError(result, fillDsdlString(item.value, str, StringCapacity::value));
        out.push_back(std::move(item));
    }
    return result;
}

template <typename StringVla>
std::vector<std::string> stringsFromDsdl(const StringVla& strings)
{
    std::vector<std::string> result;
    result.reserve(strings.size());
    for (const auto& str : strings)
    {
        result.push_back(fromDsdlString(str.value));
    }
    return result;
}

}  // namespace

int toDsdl(const model::PropertyValue& value, net::Value_0_1& out)
{
    int result = 0;
    cetl::visit(  //
        cetl::make_overloaded(
            [&out](const cetl::monostate&) {
                //
                out.set_empty();
            },
            [&out](const bool bool_value) {
                //
                out.set_bit().value = bool_value;
            },
            [&out](const std::int64_t int_value) {
                //
                out.set_integer().value = int_value;
            },
            [&out, &result](const std::string& str_value) {
                //
                result = fillDsdlString(out.set_text().value, str_value, StringCapacity::value);
            }),
        value);
    return result;
}

model::PropertyValue fromDsdl(const net::Value_0_1& value)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [](const uavcan::primitive::Empty_1_0&) -> model::PropertyValue {
                //
                return cetl::monostate{};
            },
            [](const uavcan::primitive::scalar::Bit_1_0& bit) -> model::PropertyValue {
                //
                return static_cast<bool>(bit.value);
            },
            [](const uavcan::primitive::scalar::Integer64_1_0& integer) -> model::PropertyValue {
                //
                return static_cast<std::int64_t>(integer.value);
            },
            [](const uavcan::primitive::String_1_0& text) -> model::PropertyValue {
                //
                return fromDsdlString(text.value);
            }),
        value.union_value);
}

int toDsdl(const model::InterfaceState& state, net::Interface_0_1& out, cetl::pmr::memory_resource& memory)
{
    using Capacity = net::Interface_0_1::_traits_::ArrayCapacity;

    int result = 0;
    keepFirstError(result, fillDsdlString(out.name, state.name, Capacity::name));
    keepFirstError(result, fillDsdlString(out.type, state.type, Capacity::type));
    keepFirstError(result, fillDsdlString(out.owner, state.owner, Capacity::owner));
    out.kernel_index = state.kernel_index.value_or(-1);
    out.source       = static_cast<std::uint8_t>(state.source);
    keepFirstError(result, propertiesToDsdl(state.properties, out.properties, Capacity::properties, memory));
    return result;
}

model::InterfaceState fromDsdl(const net::Interface_0_1& iface)
{
    model::InterfaceState state;
    state.name  = fromDsdlString(iface.name);
    state.type  = fromDsdlString(iface.type);
    state.owner = fromDsdlString(iface.owner);
    if (iface.kernel_index >= 0)
    {
        state.kernel_index = iface.kernel_index;
    }
    switch (iface.source)
    {
    case static_cast<std::uint8_t>(model::StateSource::PluginOnly):
        state.source = model::StateSource::PluginOnly;
        break;
    case static_cast<std::uint8_t>(model::StateSource::Merged):
        state.source = model::StateSource::Merged;
        break;
    default:
        state.source = model::StateSource::KernelOnly;
        break;
    }
    state.properties = propertiesFromDsdl(iface.properties);
    return state;
}

int toDsdl(const model::InterfaceTarget& target, net::InterfaceTarget_0_1& out, cetl::pmr::memory_resource& memory)
{
    using Capacity = net::InterfaceTarget_0_1::_traits_::ArrayCapacity;

    int result = 0;
    keepFirstError(result, fillDsdlString(out.name, target.name, Capacity::name));
    keepFirstError(result, fillDsdlString(out.type, target.type, Capacity::type));
    keepFirstError(result, propertiesToDsdl(target.properties, out.properties, Capacity::properties, memory));
    return result;
}

model::InterfaceTarget fromDsdl(const net::InterfaceTarget_0_1& target)
{
    return model::InterfaceTarget{fromDsdlString(target.name),
                                  fromDsdlString(target.type),
                                  propertiesFromDsdl(target.properties)};
}

int toDsdl(const model::Error& error, net::Error_0_1& out, cetl::pmr::memory_resource& memory)
{
    using Capacity = net::Error_0_1::_traits_::ArrayCapacity;

    int result = 0;
    out.kind   = static_cast<std::uint8_t>(error.kind);
    keepFirstError(result, fillDsdlString(out.message, error.message, Capacity::message));
    keepFirstError(result, stringsToDsdl(error.interfaces, out.interfaces, Capacity::interfaces, memory));
    return result;
}

model::Error fromDsdl(const net::Error_0_1& error)
{
    auto kind = model::ErrorKind::OperationFailed;
    if ((error.kind >= static_cast<std::uint8_t>(model::ErrorKind::BackendUnavailable)) &&
        (error.kind <= static_cast<std::uint8_t>(model::ErrorKind::InvalidRequest)))
    {
        kind = static_cast<model::ErrorKind>(error.kind);
    }
    return model::Error{kind, fromDsdlString(error.message), stringsFromDsdl(error.interfaces)};
}

cetl::optional<model::OperationKind> operationKindFromDsdl(const std::uint8_t kind)
{
    switch (kind)
    {
    case static_cast<std::uint8_t>(model::OperationKind::Create):
        return model::OperationKind::Create;
    case static_cast<std::uint8_t>(model::OperationKind::Modify):
        return model::OperationKind::Modify;
    case static_cast<std::uint8_t>(model::OperationKind::Delete):
        return model::OperationKind::Delete;
    default:
        return cetl::nullopt;
    }
}

int toDsdl(const model::Operation& operation, net::Operation_0_1& out, cetl::pmr::memory_resource& memory)
{
    using Capacity = net::Operation_0_1::_traits_::ArrayCapacity;

    int result = 0;
    out.id     = operation.id;
    out.kind   = static_cast<std::uint8_t>(operation.kind);
    keepFirstError(result, fillDsdlString(out.iface, operation.interface, Capacity::iface));
    keepFirstError(result, fillDsdlString(out.type, operation.type, Capacity::type));
    keepFirstError(result, fillDsdlString(out.plugin, operation.plugin, Capacity::plugin));
    keepFirstError(result, propertiesToDsdl(operation.desired, out.desired, Capacity::desired, memory));

    out.predecessors.clear();
    for (const auto predecessor : operation.predecessors)
    {
        if (out.predecessors.size() >= Capacity::predecessors)
        {
            keepFirstError(result, EMSGSIZE);
            break;
        }
        out.predecessors.push_back(predecessor);
    }
    return result;
}

model::Operation fromDsdl(const net::Operation_0_1& operation)
{
    model::Operation result;
    result.id        = operation.id;
    result.interface = fromDsdlString(operation.iface);
    result.type      = fromDsdlString(operation.type);
    result.kind      = operationKindFromDsdl(operation.kind).value_or(model::OperationKind::Modify);
    result.plugin    = fromDsdlString(operation.plugin);
    result.desired   = propertiesFromDsdl(operation.desired);
    result.predecessors.assign(operation.predecessors.cbegin(), operation.predecessors.cend());
    return result;
}

int toDsdl(const model::ExecutionResult& result, net::ExecutionResult_0_1& out, cetl::pmr::memory_resource& memory)
{
    using Capacity = net::ExecutionResult_0_1::_traits_::ArrayCapacity;

    int err           = 0;
    out.state         = static_cast<std::uint8_t>(result.state);
    out.checkpoint_id = result.checkpoint_id;

    out.error.clear();
    if (result.error)
    {
        net::Error_0_1 error{&memory};
        keepFirstError(err, toDsdl(*result.error, error, memory));
        out.error.push_back(std::move(error));
    }

    keepFirstError(err, stringsToDsdl(result.reverted, out.reverted, Capacity::reverted, memory));
    keepFirstError(err, stringsToDsdl(result.indeterminate, out.indeterminate, Capacity::indeterminate, memory));
    return err;
}

model::ExecutionResult fromDsdl(const net::ExecutionResult_0_1& result)
{
    model::ExecutionResult out;
    out.state = model::ExecutionState::Failed;
    if (result.state <= static_cast<std::uint8_t>(model::ExecutionState::Failed))
    {
        out.state = static_cast<model::ExecutionState>(result.state);
    }
    out.checkpoint_id = result.checkpoint_id;
    if (!result.error.empty())
    {
        out.error = fromDsdl(result.error.front());
    }
    out.reverted      = stringsFromDsdl(result.reverted);
    out.indeterminate = stringsFromDsdl(result.indeterminate);
    return out;
}

}  // namespace common
}  // namespace netcfgd
