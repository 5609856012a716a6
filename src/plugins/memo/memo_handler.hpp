//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_PLUGINS_MEMO_HANDLER_HPP_INCLUDED
#define NETCFGD_PLUGINS_MEMO_HANDLER_HPP_INCLUDED

#include "logging.hpp"

#include <netcfgd/model/interface_state.hpp>
#include <netcfgd/model/operation.hpp>
#include <netcfgd/model/property.hpp>
#include <netcfgd/sdk/plugin.hpp>

#include <map>
#include <string>

namespace netcfgd
{
namespace plugins
{
namespace memo
{

/// Keeps plugin owned configuration in memory only.
///
/// Owns the `memo` interface type (records without any kernel counterpart),
/// and `memo.*` properties of interfaces of any other type.
///
class MemoHandler final : public sdk::Plugin::Handler
{
public:
    static constexpr const char* Name           = "memo";
    static constexpr const char* InterfaceType  = "memo";
    static constexpr const char* PropertyPrefix = "memo";

    MemoHandler();

    static sdk::Plugin::Capabilities capabilities();

    // Handler

    QueryResult::Var query(const std::string& iface) override;
    ApplyResult::Var apply(const model::OperationKind kind, const model::InterfaceTarget& target) override;

private:
    static bool isOwnedProperty(const std::string& key);
    static void patch(model::Properties& properties, const model::Properties& changes);

    ApplyResult::Var applyToRecord(const model::OperationKind kind, const model::InterfaceTarget& target);
    ApplyResult::Var applyToForeign(const model::OperationKind kind, const model::InterfaceTarget& target);

    common::LoggerPtr logger_;

    /// Interfaces of the own type.
    std::map<std::string, model::InterfaceState> records_;

    /// Owned properties of interfaces of other types.
    std::map<std::string, model::InterfaceState> annotations_;

};  // MemoHandler

}  // namespace memo
}  // namespace plugins
}  // namespace netcfgd

#endif  // NETCFGD_PLUGINS_MEMO_HANDLER_HPP_INCLUDED
