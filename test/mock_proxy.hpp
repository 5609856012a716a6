//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_MOCK_PROXY_HPP_INCLUDED
#define NETCFGD_MOCK_PROXY_HPP_INCLUDED

namespace netcfgd
{

/// Owned stand-in for a mock which is kept by the test itself.
///
/// Production code owns (and eventually destroys) the proxy, while expectations stay on the mock;
/// destruction of the proxy is reported to the mock as `proxyDestroyed()` call.
///
template <typename Interface, typename Mock>
class MockProxy : public Interface
{
public:
    explicit MockProxy(Mock& mock)
        : mock_{mock}
    {
    }

    MockProxy(const MockProxy&)                = delete;
    MockProxy(MockProxy&&) noexcept            = delete;
    MockProxy& operator=(const MockProxy&)     = delete;
    MockProxy& operator=(MockProxy&&) noexcept = delete;

    ~MockProxy() override
    {
        mock_.proxyDestroyed();
    }

protected:
    Mock& mock() const noexcept
    {
        return mock_;
    }

private:
    Mock& mock_;

};  // MockProxy

}  // namespace netcfgd

#endif  // NETCFGD_MOCK_PROXY_HPP_INCLUDED
