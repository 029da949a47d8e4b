//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_SVC_REQUEST_CLIENT_HPP_INCLUDED
#define DEVCTL_SDK_SVC_REQUEST_CLIENT_HPP_INCLUDED

#include "ipc/channel.hpp"
#include "ipc/client_router.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"
#include "svc_types.hpp"

#include <devctl/sdk/execution.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <functional>
#include <memory>
#include <utility>

namespace devctl
{
namespace sdk
{
namespace svc
{

/// Generic client of a request/response(s) service.
///
/// Sends one request on connection, and feeds every response into the `Collector`, which:
/// - `accept`s a response, and returns failure if the response carries a fault;
/// - `take`s the final success result;
/// - tells (by `IsStreaming`) whether responses are collected until the channel completion,
///   or the first (and only) response finishes the request.
///
template <typename Spec, typename Collector>
class RequestClient final : public SenderOf<ResultOf<typename Collector::Success>>
{
public:
    using Success = typename Collector::Success;
    using Result  = ResultOf<Success>;
    using Ptr     = typename SenderOf<Result>::Ptr;

    CETL_NODISCARD static Ptr make(const common::ipc::ClientRouter::Ptr& ipc_router,
                                   const typename Spec::Request&         request,
                                   Collector                             collector = {})
    {
        return std::make_unique<RequestClient>(ipc_router, request, std::move(collector));
    }

    RequestClient(const common::ipc::ClientRouter::Ptr& ipc_router,
                  const typename Spec::Request&         request,
                  Collector                             collector)
        : logger_{common::getLogger("svc")}
        , request_{request}
        , collector_{std::move(collector)}
        , channel_{ipc_router->makeChannel<Channel>(Spec::svc_full_name())}
        , done_{false}
    {
    }

    RequestClient(const RequestClient&)                = delete;
    RequestClient(RequestClient&&) noexcept            = delete;
    RequestClient& operator=(const RequestClient&)     = delete;
    RequestClient& operator=(RequestClient&&) noexcept = delete;

    ~RequestClient() override
    {
        if (!done_)
        {
            logger_->debug("Request `{}` is canceled.", Spec::svc_full_name());
        }
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver_ = std::move(receiver);

        channel_->subscribe([this](const auto& event_var) {
            //
            cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
        });
    }

private:
    using Channel = common::ipc::Channel<typename Spec::Response, typename Spec::Request>;

    void handleEvent(const typename Channel::Connected& connected)
    {
        logger_->trace("RequestClient::handleEvent({}) - `{}`.", connected, Spec::svc_full_name());

        if (const auto err = channel_->send(request_))
        {
            finish(ChannelFault{err});
        }
    }

    void handleEvent(const typename Channel::Input& input)
    {
        logger_->trace("RequestClient::handleEvent(Input) - `{}`.", Spec::svc_full_name());

        if (done_)
        {
            return;
        }
        if (auto failure = collector_.accept(input))
        {
            finish(std::move(*failure));
            return;
        }
        if (!Collector::IsStreaming)
        {
            finish(collector_.take());
        }
    }

    void handleEvent(const typename Channel::Completed& completed)
    {
        logger_->debug("RequestClient::handleEvent({}) - `{}`.", completed, Spec::svc_full_name());

        if (done_)
        {
            return;
        }
        if (completed.error_code != common::ipc::ErrorCode::Success)
        {
            finish(ChannelFault{static_cast<int>(completed.error_code)});
            return;
        }
        if (Collector::IsStreaming)
        {
            finish(collector_.take());
            return;
        }
        // Normal completion, but without any response.
        finish(ChannelFault{ENODATA});
    }

    void finish(Result&& result)
    {
        CETL_DEBUG_ASSERT(receiver_, "");

        done_ = true;
        channel_.reset();

        // The receiver is free to destroy this client, so nothing should be touched after the call.
        auto receiver = std::move(receiver_);
        receiver(std::move(result));
    }

    common::LoggerPtr             logger_;
    typename Spec::Request        request_;
    Collector                     collector_;
    cetl::optional<Channel>       channel_;
    bool                          done_;
    std::function<void(Result&&)> receiver_;

};  // RequestClient

/// Collector of services which respond with just a fault (zero code on success).
///
struct FaultOnlyCollector final
{
    using Success = cetl::monostate;

    static constexpr bool IsStreaming = false;

    template <typename Response>
    cetl::optional<Failure> accept(const Response& response) const
    {
        return remoteFaultOf(response.fault);
    }

    Success take() const
    {
        return {};
    }

};  // FaultOnlyCollector

}  // namespace svc
}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_SVC_REQUEST_CLIENT_HPP_INCLUDED
