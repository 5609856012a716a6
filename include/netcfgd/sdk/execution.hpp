//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef NETCFGD_SDK_EXECUTION_HPP_INCLUDED
#define NETCFGD_SDK_EXECUTION_HPP_INCLUDED

#include "netcfgd/platform/defines.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace netcfgd
{
namespace sdk
{

/// Abstract interface of an asynchronous operation which eventually emits exactly one result.
///
/// Destroying the sender cancels the operation (the receiver won't be called then).
///
template <typename Result_>
class SenderOf
{
public:
    using Ptr      = std::unique_ptr<SenderOf>;
    using Result   = Result_;
    using Receiver = std::function<void(Result&&)>;

    SenderOf(SenderOf&&)                 = delete;
    SenderOf(const SenderOf&)            = delete;
    SenderOf& operator=(SenderOf&&)      = delete;
    SenderOf& operator=(const SenderOf&) = delete;

    virtual ~SenderOf() = default;

    /// Starts the operation; its result will be passed to the receiver.
    ///
    /// The receiver may be called right away (f.e. for a request rejected locally), or later,
    /// from within a spin of the executor. Submitting the same sender twice is not supported.
    ///
    template <typename AnyReceiver>
    void submit(AnyReceiver&& receiver)
    {
        start(Receiver{std::forward<AnyReceiver>(receiver)});
    }

protected:
    SenderOf() = default;

    virtual void start(Receiver&& receiver) = 0;

};  // SenderOf

template <typename Sender, typename Receiver>
void submit(Sender& sender, Receiver&& receiver)
{
    sender.submit(std::forward<Receiver>(receiver));
}

template <typename Sender, typename Receiver>
void submit(std::unique_ptr<Sender>& sender_ptr, Receiver&& receiver)
{
    sender_ptr->submit(std::forward<Receiver>(receiver));
}

/// Spins the executor until either the sender emits its result, or `keep_waiting` stops to hold
/// (f.e. on a termination signal).
///
/// The sender must outlive the wait.
///
/// @return The result, or `nullopt` if the waiting was given up first.
///
template <typename Result, typename Executor, typename Sender, typename Predicate>
cetl::optional<Result> sync_wait_while(Executor& executor, Sender&& sender, Predicate&& keep_waiting)
{
    // Shared with the receiver, which may outlive this call if the waiting was given up.
    auto maybe_result = std::make_shared<cetl::optional<Result>>();

    submit(sender, [maybe_result](Result&& result) {
        //
        maybe_result->emplace(std::move(result));
    });

    platform::waitPollingUntil(executor, [&maybe_result, &keep_waiting] {
        //
        return maybe_result->has_value() || !keep_waiting();
    });

    return std::move(*maybe_result);
}

}  // namespace sdk
}  // namespace netcfgd

#endif  // NETCFGD_SDK_EXECUTION_HPP_INCLUDED
