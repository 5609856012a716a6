//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_SVC_AS_SENDER_HPP_INCLUDED
#define NETCFGD_SDK_SVC_AS_SENDER_HPP_INCLUDED

#include "logging.hpp"

#include <netcfgd/model/error.hpp>
#include <netcfgd/sdk/execution.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <utility>

namespace netcfgd
{
namespace sdk
{
namespace svc
{

/// Exposes a network service client as a sender of the public SDK.
///
/// The sender owns the client, so the request lives for as long as the sender does.
/// Results of the client are expected to be `cetl::variant<..., model::Error>`.
///
template <typename SvcClient, typename Result>
class AsSender final : public SenderOf<Result>
{
public:
    AsSender(const cetl::string_view op_name, typename SvcClient::Ptr&& svc_client, common::LoggerPtr logger)
        : op_name_{op_name}
        , svc_client_{std::move(svc_client)}
        , logger_{std::move(logger)}
    {
    }

    void start(typename SenderOf<Result>::Receiver&& receiver) override
    {
        logger_->trace("Starting '{}' request.", op_name_);

        svc_client_->submit([this, receiver = std::move(receiver)](typename SvcClient::Result&& result) mutable {
            //
            if (const auto* const error = cetl::get_if<model::Error>(&result))
            {
                logger_->debug("'{}' request has failed (kind={}, msg='{}').",
                               op_name_,
                               model::toString(error->kind),
                               error->message);
            }
            else
            {
                logger_->trace("'{}' request has succeeded.", op_name_);
            }
            receiver(std::move(result));
        });
    }

private:
    const cetl::string_view op_name_;
    typename SvcClient::Ptr svc_client_;
    common::LoggerPtr       logger_;

};  // AsSender

}  // namespace svc
}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_SVC_AS_SENDER_HPP_INCLUDED
