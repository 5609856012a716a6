//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_COMMON_IPC_SERVER_PIPE_MOCK_HPP_INCLUDED
#define NETCFGD_COMMON_IPC_SERVER_PIPE_MOCK_HPP_INCLUDED

#include "ipc/ipc_types.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "mock_proxy.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <utility>
#include <vector>

namespace netcfgd
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Server pipe which is driven by the test - it plays all the connected clients.
///
class ServerPipeMock : public ServerPipe
{
public:
    class Proxy final : public MockProxy<ServerPipe, ServerPipeMock>
    {
    public:
        using MockProxy::MockProxy;

        int start(EventHandler event_handler) override
        {
            mock().event_handler_ = event_handler;
            return mock().start(std::move(event_handler));
        }

        int send(const ClientId client_id, const Payloads payloads) override
        {
            return mock().send(client_id, payloads);
        }

    };  // Proxy

    MOCK_METHOD(void, proxyDestroyed, (), (const));
    MOCK_METHOD(int, start, (EventHandler event_handler), (override));
    MOCK_METHOD(int, send, (const ClientId client_id, const Payloads payloads), (override));

    bool isStarted() const
    {
        return static_cast<bool>(event_handler_);
    }

    int emitConnected(const ClientId client_id)
    {
        return emit(Event::Connected{client_id});
    }

    int emitMessage(const ClientId client_id, const std::vector<std::uint8_t>& bytes)
    {
        return emit(Event::Message{client_id, {bytes.data(), bytes.size()}});
    }

    int emitDisconnected(const ClientId client_id)
    {
        return emit(Event::Disconnected{client_id});
    }

private:
    int emit(const Event::Var& event)
    {
        if (!event_handler_)
        {
            ADD_FAILURE() << "Server pipe is not started.";
            return ENOTCONN;
        }
        return event_handler_(event);
    }

    EventHandler event_handler_;

};  // ServerPipeMock

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace netcfgd

#endif  // NETCFGD_COMMON_IPC_SERVER_PIPE_MOCK_HPP_INCLUDED
