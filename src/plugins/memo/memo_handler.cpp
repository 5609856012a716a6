//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "memo_handler.hpp"

#include "logging.hpp"

#include <netcfgd/model/interface_state.hpp>
#include <netcfgd/model/operation.hpp>
#include <netcfgd/model/property.hpp>
#include <netcfgd/sdk/plugin.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace plugins
{
namespace memo
{

constexpr const char* MemoHandler::Name;
constexpr const char* MemoHandler::InterfaceType;
constexpr const char* MemoHandler::PropertyPrefix;

MemoHandler::MemoHandler()
    : logger_{common::getLogger(common::logger_names::Plugin)}
{
}

sdk::Plugin::Capabilities MemoHandler::capabilities()
{
    return sdk::Plugin::Capabilities{Name, {InterfaceType}, {PropertyPrefix}};
}

MemoHandler::QueryResult::Var MemoHandler::query(const std::string& iface)
{
    std::vector<model::InterfaceState> states;
    for (const auto* const states_map : {&records_, &annotations_})
    {
        for (const auto& name_state : *states_map)
        {
            if (iface.empty() || (name_state.first == iface))
            {
                states.push_back(name_state.second);
            }
        }
    }
    logger_->debug("Memo: query '{}' -> {} interface(s).", iface, states.size());
    return states;
}

MemoHandler::ApplyResult::Var MemoHandler::apply(const model::OperationKind kind, const model::InterfaceTarget& target)
{
    logger_->info("Memo: {} '{}' (type='{}', props={}).",
                  model::toString(kind),
                  target.name,
                  target.type,
                  target.properties.size());

    if ((target.type == InterfaceType) || (records_.find(target.name) != records_.end()))
    {
        return applyToRecord(kind, target);
    }
    return applyToForeign(kind, target);
}

MemoHandler::ApplyResult::Var MemoHandler::applyToRecord(const model::OperationKind    kind,
                                                         const model::InterfaceTarget& target)
{
    const auto it = records_.find(target.name);
    switch (kind)
    {
    case model::OperationKind::Create: {
        if (it != records_.end())
        {
            return Failure{false, "Interface '" + target.name + "' already exists."};
        }
        model::InterfaceState record;
        record.name = target.name;
        record.type = InterfaceType;
        record.properties.emplace(model::property::State, std::string{model::property::StateUp});
        patch(record.properties, target.properties);
        records_.emplace(target.name, std::move(record));
        break;
    }
    case model::OperationKind::Modify: {
        if (it == records_.end())
        {
            return Failure{false, "Interface '" + target.name + "' doesn't exist."};
        }
        patch(it->second.properties, target.properties);
        break;
    }
    case model::OperationKind::Delete: {
        // Deleting a missing record is fine - the result is the same.
        if (it != records_.end())
        {
            records_.erase(it);
        }
        break;
    }
    }
    return cetl::monostate{};
}

MemoHandler::ApplyResult::Var MemoHandler::applyToForeign(const model::OperationKind    kind,
                                                          const model::InterfaceTarget& target)
{
    if (kind == model::OperationKind::Create)
    {
        return Failure{false, "Interface type '" + target.type + "' is not supported."};
    }
    if (kind == model::OperationKind::Delete)
    {
        annotations_.erase(target.name);
        return cetl::monostate{};
    }

    for (const auto& key_value : target.properties)
    {
        if (!isOwnedProperty(key_value.first))
        {
            return Failure{false, "Property '" + key_value.first + "' is not owned."};
        }
    }

    auto& annotation = annotations_[target.name];
    annotation.name  = target.name;
    annotation.type  = target.type;
    patch(annotation.properties, target.properties);
    if (annotation.properties.empty())
    {
        annotations_.erase(target.name);
    }
    return cetl::monostate{};
}

bool MemoHandler::isOwnedProperty(const std::string& key)
{
    const std::string prefix{PropertyPrefix};
    return (key == prefix) || (0 == key.compare(0, prefix.size() + 1, prefix + "."));
}

void MemoHandler::patch(model::Properties& properties, const model::Properties& changes)
{
    for (const auto& key_value : changes)
    {
        if (cetl::holds_alternative<cetl::monostate>(key_value.second))
        {
            properties.erase(key_value.first);
        }
        else
        {
            properties[key_value.first] = key_value.second;
        }
    }
}

}  // namespace memo
}  // namespace plugins
}  // namespace netcfgd
