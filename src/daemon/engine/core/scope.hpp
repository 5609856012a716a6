//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_SCOPE_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_SCOPE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <set>
#include <string>
#include <utility>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

/// Set of interfaces a request is about - either all of them, or a specific (possibly empty) set of names.
///
class Scope final
{
public:
    static Scope all()
    {
        return Scope{};
    }

    static Scope one(std::string name)
    {
        return of({std::move(name)});
    }

    static Scope of(std::set<std::string> names)
    {
        Scope scope;
        scope.names_.emplace(std::move(names));
        return scope;
    }

    bool isAll() const
    {
        return !names_.has_value();
    }

    /// Gets the name of the only interface in the scope (if that's the case).
    cetl::optional<std::string> single() const
    {
        if (names_ && (names_->size() == 1))
        {
            return *names_->begin();
        }
        return cetl::nullopt;
    }

    bool contains(const std::string& name) const
    {
        return !names_ || (names_->find(name) != names_->end());
    }

    /// Names of the scope; empty for the "all" scope.
    const std::set<std::string>& names() const
    {
        static const std::set<std::string> empty;
        return names_ ? *names_ : empty;
    }

private:
    Scope() = default;

    cetl::optional<std::set<std::string>> names_;

};  // Scope

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_SCOPE_HPP_INCLUDED
