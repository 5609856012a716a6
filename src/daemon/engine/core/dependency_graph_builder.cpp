//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dependency_graph_builder.hpp"

#include "plan.hpp"
#include "plugin_registry.hpp"
#include "scope.hpp"
#include "state_provider_adapter.hpp"

#include "netcfgd/model/error.hpp"
#include "netcfgd/model/interface_state.hpp"
#include "netcfgd/model/operation.hpp"
#include "netcfgd/model/property.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{
namespace
{

constexpr std::array<const char*, 2> ReferenceKeys{{model::property::Controller, model::property::Parent}};

/// Operations (and references) of a single interface.
///
struct InterfaceOps final
{
    bool                                 deleting{false};
    cetl::optional<model::Operation::Id> owner_op;
    std::vector<model::Operation::Id>    plugin_ops;

    /// Interfaces referred to by the desired state, and by the current one.
    std::set<std::string> desired_refs;
    std::set<std::string> current_refs;

    std::vector<model::Operation::Id> allOps() const
    {
        std::vector<model::Operation::Id> ids{plugin_ops};
        if (owner_op)
        {
            ids.push_back(*owner_op);
        }
        return ids;
    }

    /// Operations which attach the interface to something - the owner's one if any, otherwise all of them.
    std::vector<model::Operation::Id> attachingOps() const
    {
        if (owner_op)
        {
            return {*owner_op};
        }
        return plugin_ops;
    }
};

/// Unlisted interfaces which have to follow deletions of listed ones.
///
std::map<std::string, model::InterfaceTarget> impliedTargets(const std::set<std::string>&  listed,
                                                             std::vector<std::string>      deleted,
                                                             const model::UnifiedSnapshot& current)
{
    std::map<std::string, model::InterfaceTarget> implied;
    while (!deleted.empty())
    {
        const auto gone = std::move(deleted.back());
        deleted.pop_back();

        for (const auto& name_state : current.interfaces)
        {
            const auto& name = name_state.first;
            if (listed.find(name) != listed.end())
            {
                continue;
            }

            const auto parent     = model::findString(name_state.second.properties, model::property::Parent);
            const auto controller = model::findString(name_state.second.properties, model::property::Controller);
            const auto it         = implied.find(name);
            if (parent && (*parent == gone))
            {
                // A child can't outlive its parent.
                if ((it == implied.end()) || !it->second.isAbsent())
                {
                    implied[name] = model::InterfaceTarget{name,
                                                           "",
                                                           {{model::property::State,
                                                             std::string{model::property::StateAbsent}}}};
                    deleted.push_back(name);
                }
            }
            else if (controller && (*controller == gone) && (it == implied.end()))
            {
                implied[name] = model::InterfaceTarget{name, "", {{model::property::Controller, cetl::monostate{}}}};
            }
        }
    }
    return implied;
}

class GraphBuilding final
{
public:
    using BuildResult = DependencyGraphBuilder::BuildResult;

    GraphBuilding(const StateProviderAdapter&   provider,
                  const PluginRegistry&         registry,
                  const model::UnifiedSnapshot& current)
        : provider_{provider}
        , registry_{registry}
        , current_{current}
    {
    }

    CETL_NODISCARD cetl::optional<model::Error> addTarget(const model::InterfaceTarget& target)
    {
        const auto* const cur = findCurrent(target.name);

        if (auto error = validate(target, cur))
        {
            return error;
        }

        const bool absent = target.isAbsent();
        if (absent && (cur == nullptr))
        {
            // Already absent - nothing to do.
            return cetl::nullopt;
        }

        const auto type = target.type.empty() ? cur->type : target.type;

        // Who owns the interface itself? Empty name stands for the state provider.
        std::string owner;
        if (!provider_.supportsType(type))
        {
            const auto session = registry_.findTypeOwner(type);
            if (!session)
            {
                return model::Error::make(model::ErrorKind::UnknownInterfaceType,
                                          "Nobody owns interface type '" + type + "'.",
                                          {target.name});
            }
            owner = session->name();
        }

        auto& ops = iface_ops_[target.name];
        collectReferences(target, cur, ops);

        if (absent)
        {
            addDeletion(target.name, type, owner, *cur, ops);
            return cetl::nullopt;
        }

        // Partition properties by their owners.
        std::map<std::string, model::Properties> parts;
        parts[owner];
        for (const auto& key_value : target.properties)
        {
            parts[propertyOwner(key_value.first, owner)].insert(key_value);
        }

        if (cur != nullptr)
        {
            addModification(target.name, type, owner, *cur, parts, ops);
        }
        else
        {
            addCreation(target.name, type, owner, parts, ops);
        }
        return cetl::nullopt;
    }

    CETL_NODISCARD cetl::optional<model::Error> addReferenceEdges()
    {
        for (auto& name_ops : iface_ops_)
        {
            const auto& name = name_ops.first;
            auto&       ops  = name_ops.second;

            // Attaching: after the referred interface is created (or modified).
            //
            if (!ops.deleting)
            {
                for (const auto& ref : ops.desired_refs)
                {
                    if (ref == name)
                    {
                        return model::Error::make(model::ErrorKind::InvalidRequest,
                                                  "Interface '" + name + "' refers to itself.",
                                                  {name});
                    }

                    const auto ref_it = iface_ops_.find(ref);
                    if ((ref_it != iface_ops_.end()) && ref_it->second.deleting)
                    {
                        return model::Error::make(model::ErrorKind::InvalidRequest,
                                                  "Interface '" + name + "' refers to '" + ref +
                                                      "', which is being deleted.",
                                                  {name, ref});
                    }

                    const bool is_planned = (ref_it != iface_ops_.end()) && ref_it->second.owner_op;
                    if (!is_planned && (findCurrent(ref) == nullptr))
                    {
                        return model::Error::make(model::ErrorKind::InvalidRequest,
                                                  "Interface '" + name + "' refers to unknown interface '" + ref +
                                                      "'.",
                                                  {name, ref});
                    }

                    if (is_planned)
                    {
                        for (const auto child_op : ops.attachingOps())
                        {
                            addEdges(child_op, {*ref_it->second.owner_op});
                        }
                    }
                }
            }

            // Detaching (or deleting): before the referred interface is deleted.
            //
            for (const auto& ref : ops.current_refs)
            {
                const auto ref_it = iface_ops_.find(ref);
                if ((ref_it != iface_ops_.end()) && ref_it->second.deleting && ref_it->second.owner_op)
                {
                    addEdges(*ref_it->second.owner_op, ops.allOps());
                }
            }
        }
        return cetl::nullopt;
    }

    std::vector<model::Operation> takeOperations()
    {
        return std::move(operations_);
    }

private:
    CETL_NODISCARD const model::InterfaceState* findCurrent(const std::string& name) const
    {
        const auto it = current_.interfaces.find(name);
        return (it != current_.interfaces.end()) ? &it->second : nullptr;
    }

    CETL_NODISCARD cetl::optional<model::Error> validate(const model::InterfaceTarget& target,
                                                         const model::InterfaceState*  cur) const
    {
        const auto state = target.properties.find(model::property::State);
        if (state != target.properties.end())
        {
            const auto* const value = cetl::get_if<std::string>(&state->second);
            if ((value == nullptr) ||
                ((*value != model::property::StateUp) && (*value != model::property::StateDown) &&
                 (*value != model::property::StateAbsent)))
            {
                return model::Error::make(model::ErrorKind::InvalidRequest,
                                          "Invalid 'state' of '" + target.name + "' (expected up, down or absent).",
                                          {target.name});
            }
        }

        for (const auto* const key : ReferenceKeys)
        {
            const auto ref = target.properties.find(key);
            if ((ref != target.properties.end()) && !cetl::holds_alternative<cetl::monostate>(ref->second) &&
                !cetl::holds_alternative<std::string>(ref->second))
            {
                return model::Error::make(model::ErrorKind::InvalidRequest,
                                          std::string{"Property '"} + key + "' of '" + target.name +
                                              "' must be an interface name.",
                                          {target.name});
            }
        }

        if (target.isAbsent())
        {
            return cetl::nullopt;
        }

        if (cur == nullptr)
        {
            if (target.type.empty())
            {
                return model::Error::make(model::ErrorKind::InvalidRequest,
                                          "Type of the new interface '" + target.name + "' is not specified.",
                                          {target.name});
            }
        }
        else if (!target.type.empty() && (target.type != cur->type))
        {
            return model::Error::make(model::ErrorKind::InvalidRequest,
                                      "Type of '" + target.name + "' can't be changed from '" + cur->type + "' to '" +
                                          target.type + "'.",
                                      {target.name});
        }
        return cetl::nullopt;
    }

    void collectReferences(const model::InterfaceTarget& target, const model::InterfaceState* cur, InterfaceOps& ops)
    {
        for (const auto* const key : ReferenceKeys)
        {
            const auto current_ref = (cur != nullptr) ? model::findString(cur->properties, key) : cetl::nullopt;
            if (current_ref)
            {
                ops.current_refs.insert(*current_ref);
            }

            if (target.properties.find(key) != target.properties.end())
            {
                const auto desired_ref = model::findString(target.properties, key);
                if (desired_ref)
                {
                    ops.desired_refs.insert(*desired_ref);
                }
            }
            else if (current_ref)
            {
                ops.desired_refs.insert(*current_ref);
            }
        }
    }

    std::string propertyOwner(const std::string& key, const std::string& type_owner) const
    {
        if (!model::property::isReserved(key))
        {
            if (const auto session = registry_.findPropertyOwner(key))
            {
                return session->name();
            }
        }
        return type_owner;
    }

    void addDeletion(const std::string&           name,
                     const std::string&           type,
                     const std::string&           owner,
                     const model::InterfaceState& cur,
                     InterfaceOps&                ops)
    {
        ops.deleting = true;

        // Other plugins clean up their properties first; the owner takes the rest with it.
        std::map<std::string, model::Properties> unset;
        std::map<std::string, model::Properties> previous;
        model::Properties                        owner_previous;
        for (const auto& key_value : cur.properties)
        {
            const auto prop_owner = propertyOwner(key_value.first, owner);
            if (prop_owner != owner)
            {
                unset[prop_owner][key_value.first] = cetl::monostate{};
                previous[prop_owner].insert(key_value);
            }
            else
            {
                owner_previous.insert(key_value);
            }
        }

        for (auto& plugin_props : unset)
        {
            ops.plugin_ops.push_back(addOperation(name,
                                                  type,
                                                  model::OperationKind::Modify,
                                                  plugin_props.first,
                                                  std::move(plugin_props.second),
                                                  std::move(previous[plugin_props.first])));
        }

        model::Properties desired{{model::property::State, std::string{model::property::StateAbsent}}};
        ops.owner_op = addOperation(name,
                                    type,
                                    model::OperationKind::Delete,
                                    owner,
                                    std::move(desired),
                                    std::move(owner_previous));
        addEdges(*ops.owner_op, ops.plugin_ops);
    }

    void addModification(const std::string&                              name,
                         const std::string&                              type,
                         const std::string&                              owner,
                         const model::InterfaceState&                    cur,
                         const std::map<std::string, model::Properties>& parts,
                         InterfaceOps&                                   ops)
    {
        for (const auto& plugin_props : parts)
        {
            model::Properties diff;
            model::Properties previous;
            for (const auto& key_value : plugin_props.second)
            {
                const auto current_value = model::findValue(cur.properties, key_value.first);
                if (!model::isSameValue(current_value, key_value.second))
                {
                    diff.insert(key_value);
                    previous.emplace(key_value.first, current_value);
                }
            }
            if (diff.empty())
            {
                continue;
            }

            const auto op_id = addOperation(name,  //
                                            type,
                                            model::OperationKind::Modify,
                                            plugin_props.first,
                                            std::move(diff),
                                            std::move(previous));
            if (plugin_props.first == owner)
            {
                ops.owner_op = op_id;
            }
            else
            {
                ops.plugin_ops.push_back(op_id);
            }
        }

        if (ops.owner_op)
        {
            for (const auto plugin_op : ops.plugin_ops)
            {
                addEdges(plugin_op, {*ops.owner_op});
            }
        }
    }

    void addCreation(const std::string&                              name,
                     const std::string&                              type,
                     const std::string&                              owner,
                     const std::map<std::string, model::Properties>& parts,
                     InterfaceOps&                                   ops)
    {
        ops.owner_op = addOperation(name,  //
                                    type,
                                    model::OperationKind::Create,
                                    owner,
                                    withoutUnset(parts.at(owner)),
                                    {});

        for (const auto& plugin_props : parts)
        {
            if (plugin_props.first == owner)
            {
                continue;
            }

            auto desired = withoutUnset(plugin_props.second);
            if (desired.empty())
            {
                continue;
            }
            model::Properties previous;
            for (const auto& key_value : desired)
            {
                previous.emplace(key_value.first, cetl::monostate{});
            }

            const auto op_id = addOperation(name,
                                            type,
                                            model::OperationKind::Modify,
                                            plugin_props.first,
                                            std::move(desired),
                                            std::move(previous));
            ops.plugin_ops.push_back(op_id);
            addEdges(op_id, {*ops.owner_op});
        }
    }

    static model::Properties withoutUnset(const model::Properties& properties)
    {
        model::Properties result;
        for (const auto& key_value : properties)
        {
            if (!cetl::holds_alternative<cetl::monostate>(key_value.second))
            {
                result.insert(key_value);
            }
        }
        return result;
    }

    model::Operation::Id addOperation(const std::string&         name,
                                      const std::string&         type,
                                      const model::OperationKind kind,
                                      const std::string&         plugin,
                                      model::Properties&&        desired,
                                      model::Properties&&        previous)
    {
        model::Operation operation;
        operation.id        = static_cast<model::Operation::Id>(operations_.size() + 1);
        operation.interface = name;
        operation.type      = type;
        operation.kind      = kind;
        operation.plugin    = plugin;
        operation.desired   = std::move(desired);
        operation.previous  = std::move(previous);
        operations_.push_back(std::move(operation));
        return operations_.back().id;
    }

    /// Makes `successor` depend on each of `predecessors`.
    void addEdges(const model::Operation::Id successor, const std::vector<model::Operation::Id>& predecessors)
    {
        auto& preds = operations_.at(successor - 1).predecessors;
        for (const auto pred : predecessors)
        {
            if ((pred != successor) && (std::find(preds.cbegin(), preds.cend(), pred) == preds.cend()))
            {
                preds.push_back(pred);
            }
        }
        std::sort(preds.begin(), preds.end());
    }

    const StateProviderAdapter&         provider_;
    const PluginRegistry&               registry_;
    const model::UnifiedSnapshot&       current_;
    std::map<std::string, InterfaceOps> iface_ops_;
    std::vector<model::Operation>       operations_;

};  // GraphBuilding

}  // namespace

DependencyGraphBuilder::DependencyGraphBuilder(const StateProviderAdapter& provider, const PluginRegistry& registry)
    : provider_{provider}
    , registry_{registry}
{
}

DependencyGraphBuilder::BuildResult::Var DependencyGraphBuilder::build(const model::DesiredState&    desired,
                                                                       const model::UnifiedSnapshot& current) const
{
    // Targets are processed in name order, so that operation ids don't depend on the document order.
    std::vector<const model::InterfaceTarget*> targets;
    std::set<std::string>                      names;
    for (const auto& target : desired.interfaces)
    {
        if (target.name.empty())
        {
            return model::Error::make(model::ErrorKind::InvalidRequest, "Interface name must not be empty.");
        }
        if (!names.insert(target.name).second)
        {
            return model::Error::make(model::ErrorKind::InvalidRequest,
                                      "Interface '" + target.name + "' is listed more than once.",
                                      {target.name});
        }
        targets.push_back(&target);
    }

    std::vector<std::string> deleted;
    for (const auto* const target : targets)
    {
        if (target->isAbsent() && (current.interfaces.find(target->name) != current.interfaces.end()))
        {
            deleted.push_back(target->name);
        }
    }
    const auto implied = impliedTargets(names, std::move(deleted), current);
    for (const auto& name_target : implied)
    {
        logger_->debug("Unlisted '{}' follows a deletion (absent={}).",
                       name_target.first,
                       name_target.second.isAbsent());
        targets.push_back(&name_target.second);
    }
    std::sort(targets.begin(), targets.end(), [](const auto* lhs, const auto* rhs) { return lhs->name < rhs->name; });

    GraphBuilding building{provider_, registry_, current};
    for (const auto* const target : targets)
    {
        if (auto error = building.addTarget(*target))
        {
            logger_->info("Can't build graph: {}", error->message);
            return std::move(*error);
        }
    }
    if (auto error = building.addReferenceEdges())
    {
        logger_->info("Can't build graph: {}", error->message);
        return std::move(*error);
    }

    auto sorted = sortTopologically(building.takeOperations());
    if (const auto* const cycle = cetl::get_if<SortResult::Failure>(&sorted))
    {
        std::string names_str;
        for (const auto& name : *cycle)
        {
            names_str += names_str.empty() ? name : (", " + name);
        }
        logger_->info("Dependency cycle between: {}.", names_str);
        return model::Error::make(model::ErrorKind::DependencyCycle,
                                  "Dependency cycle between: " + names_str + ".",
                                  *cycle);
    }

    auto operations = cetl::get<SortResult::Success>(std::move(sorted));
    logger_->debug("Graph is built (ops={}).", operations.size());
    return operations;
}

Scope DependencyGraphBuilder::scopeOf(const model::DesiredState& desired)
{
    std::set<std::string> names;
    for (const auto& target : desired.interfaces)
    {
        if (target.isAbsent())
        {
            return Scope::all();
        }
        for (const auto* const key : ReferenceKeys)
        {
            if (target.properties.find(key) != target.properties.end())
            {
                return Scope::all();
            }
        }
        names.insert(target.name);
    }
    return Scope::of(std::move(names));
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
