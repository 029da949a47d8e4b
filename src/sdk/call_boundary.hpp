//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_CALL_BOUNDARY_HPP_INCLUDED
#define DEVCTL_SDK_CALL_BOUNDARY_HPP_INCLUDED

#include "logging.hpp"
#include "svc/svc_types.hpp"

#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{

/// Translates a service level failure into the SDK domain error of the given operation.
///
/// - remote fault -> `TransportFault` (with the remote message);
/// - `ENOTCONN` channel fault -> `ConnectionError`;
/// - any other channel fault -> `ProtocolFault` (with the code and its description);
/// - domain error -> itself (just tagged with the operation name).
///
Error translateFailure(const std::string& op_name, svc::Failure&& failure);

/// Adapter of a service level sender to an SDK operation sender.
///
/// Logs the call boundary events, and translates failures (see `translateFailure`).
///
template <typename Op>
class CallBoundarySender final : public SenderOf<typename Op::Result>
{
public:
    using Result    = typename Op::Result;
    using SvcResult = svc::ResultOf<typename Op::Success>;

    CallBoundarySender(std::string                          op_name,
                       common::LoggerPtr                    logger,
                       typename SenderOf<SvcResult>::Ptr&& svc_sender)
        : op_name_{std::move(op_name)}
        , logger_{std::move(logger)}
        , svc_sender_{std::move(svc_sender)}
    {
        CETL_DEBUG_ASSERT(svc_sender_, "");
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        logger_->debug("Calling `{}`...", op_name_);

        svc_sender_->submit([this, receiver = std::move(receiver)](SvcResult&& svc_result) mutable {
            //
            if (auto* const success = cetl::get_if<typename Op::Success>(&svc_result))
            {
                logger_->debug("Call `{}` succeeded.", op_name_);
                receiver(Result{std::move(*success)});
                return;
            }

            auto error = translateFailure(op_name_, cetl::get<svc::Failure>(std::move(svc_result)));
            logger_->warn("Call `{}` failed: {}", op_name_, error);
            receiver(Result{std::move(error)});
        });
    }

private:
    const std::string                 op_name_;
    common::LoggerPtr                 logger_;
    typename SenderOf<SvcResult>::Ptr svc_sender_;

};  // CallBoundarySender

template <typename Op>
typename SenderOf<typename Op::Result>::Ptr withCallBoundary(
    std::string                                                           op_name,
    common::LoggerPtr                                                     logger,
    typename SenderOf<svc::ResultOf<typename Op::Success>>::Ptr&& svc_sender)
{
    return std::make_unique<CallBoundarySender<Op>>(std::move(op_name), std::move(logger), std::move(svc_sender));
}

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_CALL_BOUNDARY_HPP_INCLUDED
