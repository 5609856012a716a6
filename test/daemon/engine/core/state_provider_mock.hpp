//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_MOCK_HPP_INCLUDED
#define NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_MOCK_HPP_INCLUDED

#include "core/state_provider.hpp"

#include "netcfgd/model/interface_state.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <string>

namespace netcfgd
{
namespace daemon
{
namespace engine
{
namespace core
{

class StateProviderMock : public StateProvider
{
public:
    MOCK_METHOD(GetStateResult::Var, getState, (const cetl::optional<std::string>& name), (override));
    MOCK_METHOD(ApplyStateResult::Var, applyState, (const model::InterfaceState& desired), (override));
    MOCK_METHOD(bool, supportsType, (const std::string& type), (const, override));

};  // StateProviderMock

}  // namespace core
}  // namespace engine
}  // namespace daemon
}  // namespace netcfgd

#endif  // NETCFGD_DAEMON_ENGINE_CORE_STATE_PROVIDER_MOCK_HPP_INCLUDED
