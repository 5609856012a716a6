//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_SERVER_ROUTER_MOCK_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_SERVER_ROUTER_MOCK_HPP_INCLUDED

#include "dsdl_helpers.hpp"
#include "gateway_mock.hpp"
#include "ipc/channel.hpp"
#include "ipc/server_router.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace netcfgd
{
namespace common
{
namespace ipc
{

/// Keeps channel factories registered by services, so that tests could open service channels directly.
///
class ServerRouterMock : public ServerRouter
{
public:
    explicit ServerRouterMock(cetl::pmr::memory_resource& memory)
        : memory_{memory}
    {
    }

    MOCK_METHOD(void, registerChannelFactoryByName, (const std::string& service_name), (const));

    /// Emulates arrival of the very first message of a new channel of the given service.
    ///
    /// The channel goes through the gateway mock.
    ///
    template <typename Msg>
    void openChannel(const cetl::string_view service_name, detail::GatewayMock& gateway_mock, const Msg& first_msg)
    {
        const auto it = factories_.find(AnyChannel::getServiceDesc<Msg>(service_name).id);
        if (it == factories_.end())
        {
            ADD_FAILURE() << "Service '" << std::string{service_name.data(), service_name.size()}
                          << "' is not registered.";
            return;
        }

        auto&      factory = it->second;
        const auto result  = tryPerformOnSerialized(first_msg, [&factory, &gateway_mock](const auto payload) {
            //
            factory(std::make_shared<detail::GatewayMock::Proxy>(gateway_mock), payload);
            return 0;
        });
        EXPECT_THAT(result, 0);
    }

    // ServerRouter

    MOCK_METHOD(int, start, (), (override));

    cetl::pmr::memory_resource& memory() override
    {
        return memory_;
    }

    void registerChannelFactory(const detail::ServiceDesc service_desc,  //
                                TypeErasedChannelFactory  channel_factory) override
    {
        registerChannelFactoryByName(std::string{service_desc.name.data(), service_desc.name.size()});
        factories_[service_desc.id] = std::move(channel_factory);
    }

private:
    cetl::pmr::memory_resource&                                            memory_;
    std::unordered_map<detail::ServiceDesc::Id, TypeErasedChannelFactory> factories_;

};  // ServerRouterMock

}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_SERVER_ROUTER_MOCK_HPP_INCLUDED
