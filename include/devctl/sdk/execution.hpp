//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_EXECUTION_HPP_INCLUDED
#define DEVCTL_SDK_EXECUTION_HPP_INCLUDED

#include "devctl/platform/executor.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace devctl
{
namespace sdk
{

namespace detail
{

/// Where `sync_wait` keeps the result until the executor loop notices it.
///
/// Shared with the receiver, which may outlive the wait.
///
template <typename Result>
struct AwaitedResult final
{
    cetl::optional<Result> value;
};

}  // namespace detail

/// Abstract interface of a result sender.
///
/// Destroying a sender before it has emitted its result cancels the operation:
/// resources held by the operation (f.e. open IPC channels) are released, and the receiver is never called.
/// The receiver itself is allowed to destroy the sender.
///
template <typename Result_>
class SenderOf
{
public:
    using Ptr    = std::unique_ptr<SenderOf>;
    using Result = Result_;

    SenderOf(SenderOf&&)                 = delete;
    SenderOf(const SenderOf&)            = delete;
    SenderOf& operator=(SenderOf&&)      = delete;
    SenderOf& operator=(const SenderOf&) = delete;

    virtual ~SenderOf() = default;

    /// Starts the operation; the receiver is called once, with the result, unless the sender is destroyed first.
    ///
    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    SenderOf() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // SenderOf

/// Sender which immediately emits an already known result.
///
template <typename Result>
class JustSender final : public SenderOf<Result>
{
public:
    explicit JustSender(Result&& result)
        : result_{std::move(result)}
    {
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver(std::move(result_));
    }

private:
    Result result_;

};  // JustSender

/// Makes a sender which emits the given value as its result (on submit).
///
template <typename Result, typename Value>
typename SenderOf<Result>::Ptr just(Value&& value)
{
    return std::make_unique<JustSender<Result>>(Result{std::forward<Value>(value)});
}

/// Starts the operation of the sender; the receiver gets its result.
///
/// The receiver is consumed (no longer usable after this call).
///
template <typename Sender, typename Receiver>
void submit(Sender& sender, Receiver&& receiver)
{
    sender.submit(std::forward<Receiver>(receiver));
}

/// Same as above, for a sender owned by the caller.
///
template <typename Sender, typename Receiver>
void submit(std::unique_ptr<Sender>& sender_ptr, Receiver&& receiver)
{
    sender_ptr->submit(std::forward<Receiver>(receiver));
}

/// Submits the sender and runs the executor until the sender emits its result.
///
/// The sender is consumed (no longer usable after this call).
///
template <typename Result, typename Executor, typename Sender>
Result sync_wait(Executor& executor, Sender&& sender)
{
    const auto awaited = std::make_shared<detail::AwaitedResult<Result>>();

    submit(sender, [awaited](Result&& result) {
        //
        awaited->value.emplace(std::move(result));
    });
    platform::spinUntil(executor, [&awaited] { return awaited->value.has_value(); });

    return std::move(*awaited->value);
}

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_EXECUTION_HPP_INCLUDED
