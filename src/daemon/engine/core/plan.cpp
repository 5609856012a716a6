//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plan.hpp"

#include "netcfgd/model/operation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <tuple>
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

using OrderKey = std::tuple<std::string, std::string, model::OperationKind, model::Operation::Id>;

OrderKey makeOrderKey(const model::Operation& operation)
{
    return OrderKey{operation.interface, operation.plugin, operation.kind, operation.id};
}

/// Finds operations which are on a dependency cycle - those of non-trivial strongly connected components
/// (Tarjan's algorithm). Operations which merely depend on a cycle are not reported.
///
class CycleFinder final
{
public:
    CycleFinder(const std::vector<std::vector<std::size_t>>& successors, std::vector<bool> candidates)
        : successors_{successors}
        , candidates_{std::move(candidates)}
        , visited_(successors.size(), false)
        , on_stack_(successors.size(), false)
        , index_(successors.size(), 0)
        , low_link_(successors.size(), 0)
    {
    }

    std::set<std::size_t> find()
    {
        for (std::size_t node = 0; node < successors_.size(); ++node)
        {
            if (candidates_[node] && !visited_[node])
            {
                visit(node);
            }
        }
        return std::move(on_cycle_);
    }

private:
    void visit(const std::size_t node)
    {
        visited_[node]  = true;
        index_[node]    = next_index_;
        low_link_[node] = next_index_;
        ++next_index_;
        stack_.push_back(node);
        on_stack_[node] = true;

        bool has_self_loop = false;
        for (const auto succ : successors_[node])
        {
            if (!candidates_[succ])
            {
                continue;
            }
            has_self_loop = has_self_loop || (succ == node);

            if (!visited_[succ])
            {
                visit(succ);
                low_link_[node] = std::min(low_link_[node], low_link_[succ]);
            }
            else if (on_stack_[succ])
            {
                low_link_[node] = std::min(low_link_[node], index_[succ]);
            }
        }

        if (low_link_[node] != index_[node])
        {
            return;
        }

        // The node is the root of a component - pop it.
        std::vector<std::size_t> component;
        std::size_t              member = 0;
        do
        {
            member = stack_.back();
            stack_.pop_back();
            on_stack_[member] = false;
            component.push_back(member);
        } while (member != node);

        if ((component.size() > 1) || has_self_loop)
        {
            on_cycle_.insert(component.cbegin(), component.cend());
        }
    }

    const std::vector<std::vector<std::size_t>>& successors_;
    const std::vector<bool>                      candidates_;
    std::vector<bool>                            visited_;
    std::vector<bool>                            on_stack_;
    std::vector<std::size_t>                     index_;
    std::vector<std::size_t>                     low_link_;
    std::size_t                                  next_index_{0};
    std::vector<std::size_t>                     stack_;
    std::set<std::size_t>                        on_cycle_;

};  // CycleFinder

}  // namespace

std::vector<std::string> Plan::touchedInterfaces() const
{
    std::set<std::string> names;
    for (const auto& operation : operations)
    {
        names.insert(operation.interface);
    }
    return {names.cbegin(), names.cend()};
}

SortResult::Var sortTopologically(std::vector<model::Operation> operations)
{
    std::map<model::Operation::Id, std::size_t> id_to_index;
    for (std::size_t i = 0; i < operations.size(); ++i)
    {
        id_to_index[operations[i].id] = i;
    }

    // In-degrees, and reverse edges (from a predecessor to its successors).
    std::vector<std::size_t>              in_degree(operations.size(), 0);
    std::vector<std::vector<std::size_t>> successors(operations.size());
    for (std::size_t i = 0; i < operations.size(); ++i)
    {
        const std::set<model::Operation::Id> unique_preds{operations[i].predecessors.cbegin(),
                                                           operations[i].predecessors.cend()};
        for (const auto pred_id : unique_preds)
        {
            const auto it = id_to_index.find(pred_id);
            CETL_DEBUG_ASSERT(it != id_to_index.end(), "Unknown predecessor.");
            if (it != id_to_index.end())
            {
                successors[it->second].push_back(i);
                ++in_degree[i];
            }
        }
    }

    std::map<OrderKey, std::size_t> ready;
    for (std::size_t i = 0; i < operations.size(); ++i)
    {
        if (in_degree[i] == 0)
        {
            ready.emplace(makeOrderKey(operations[i]), i);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(operations.size());
    while (!ready.empty())
    {
        const auto index = ready.begin()->second;
        ready.erase(ready.begin());
        order.push_back(index);

        for (const auto succ : successors[index])
        {
            if (--in_degree[succ] == 0)
            {
                ready.emplace(makeOrderKey(operations[succ]), succ);
            }
        }
    }

    if (order.size() < operations.size())
    {
        // Whatever is left unsorted is either on a cycle or after one.
        std::vector<bool> unsorted(operations.size(), false);
        for (std::size_t i = 0; i < operations.size(); ++i)
        {
            unsorted[i] = in_degree[i] > 0;
        }

        std::set<std::string> on_cycle;
        for (const auto index : CycleFinder{successors, std::move(unsorted)}.find())
        {
            on_cycle.insert(operations[index].interface);
        }
        return SortResult::Failure{on_cycle.cbegin(), on_cycle.cend()};
    }

    // Renumber to plan positions.
    std::map<model::Operation::Id, model::Operation::Id> old_to_new;
    for (std::size_t pos = 0; pos < order.size(); ++pos)
    {
        old_to_new[operations[order[pos]].id] = static_cast<model::Operation::Id>(pos + 1);
    }

    SortResult::Success sorted;
    sorted.reserve(order.size());
    for (const auto index : order)
    {
        auto operation = std::move(operations[index]);
        operation.id   = old_to_new[operation.id];

        std::set<model::Operation::Id> new_preds;
        for (const auto pred_id : operation.predecessors)
        {
            const auto it = old_to_new.find(pred_id);
            if (it != old_to_new.end())
            {
                new_preds.insert(it->second);
            }
        }
        operation.predecessors.assign(new_preds.cbegin(), new_preds.cend());

        sorted.push_back(std::move(operation));
    }
    return sorted;
}

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd
