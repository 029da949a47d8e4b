//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_DAEMON_CALLS_HPP_INCLUDED
#define DEVCTL_SDK_DAEMON_CALLS_HPP_INCLUDED

#include "connection_manager.hpp"
#include "logging.hpp"
#include "svc/svc_types.hpp"

#include <devctl/sdk/client.hpp>
#include <devctl/sdk/execution.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{

/// Table of the daemon routed operations, bound once (see `bindDaemonCalls`).
///
struct DaemonCalls final
{
    std::function<SenderOf<Client::Describe::Result>::Ptr()>                      describe;
    std::function<SenderOf<Client::ListTargets::Result>::Ptr()>                   list_targets;
    std::function<SenderOf<Client::Terminate::Result>::Ptr(const std::string&)> terminate;
};

struct DaemonCallContext final
{
    cetl::pmr::memory_resource& memory;
    ConnectionManager::Ptr      connections;
    common::LoggerPtr           logger;
};

/// Registry entry of a daemon routed operation.
///
/// The binder installs the operation (already wrapped into the call boundary) into its slot of the table.
///
struct DaemonCallDescriptor final
{
    const char* name;
    void (*bind)(DaemonCalls& calls, const DaemonCallContext& context);
};

/// Gets the ordered registry of all daemon routed operations.
///
cetl::span<const DaemonCallDescriptor> daemonCallRegistry();

/// Invokes every binder of the registry (exactly once each), and returns the resulting table.
///
DaemonCalls bindDaemonCalls(const DaemonCallContext& context);

/// Sender which first obtains the daemon connection, and then performs a service request over it.
///
/// Failure to obtain the connection is passed through as is (as a domain error).
///
template <typename Success>
class ViaDaemonSender final : public SenderOf<svc::ResultOf<Success>>
{
public:
    using Result         = svc::ResultOf<Success>;
    using RequestFactory = std::function<typename SenderOf<Result>::Ptr(const DaemonConnection&)>;

    ViaDaemonSender(const ConnectionManager::Ptr& connections, RequestFactory request_factory)
        : provide_op_{connections->provideDaemonConnection()}
        , request_factory_{std::move(request_factory)}
    {
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver_ = std::move(receiver);

        provide_op_->submit([this](ConnectionManager::Provide::Result&& provided) {
            //
            if (auto* const error = cetl::get_if<ConnectionManager::Provide::Failure>(&provided))
            {
                finish(svc::Failure{std::move(*error)});
                return;
            }
            const auto& connection = cetl::get<ConnectionManager::Provide::Success>(provided);

            request_op_ = request_factory_(connection);
            request_op_->submit([this](Result&& result) {
                //
                finish(std::move(result));
            });
        });
    }

private:
    void finish(Result&& result)
    {
        // The receiver is free to destroy this sender.
        auto receiver = std::move(receiver_);
        receiver(std::move(result));
    }

    typename SenderOf<ConnectionManager::Provide::Result>::Ptr provide_op_;
    RequestFactory                                             request_factory_;
    typename SenderOf<Result>::Ptr                             request_op_;
    std::function<void(Result&&)>                              receiver_;

};  // ViaDaemonSender

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_DAEMON_CALLS_HPP_INCLUDED
