//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "daemon_calls.hpp"

#include "call_boundary.hpp"
#include "common_helpers.hpp"
#include "connection_manager.hpp"
#include "svc/daemon/daemon_clients.hpp"

#include <devctl/sdk/client.hpp>
#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <memory>
#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{
namespace
{

using svc::daemon::DescribeClient;
using svc::daemon::DescribeSpec;
using svc::daemon::ListTargetsClient;
using svc::daemon::ListTargetsSpec;
using svc::daemon::TerminateClient;
using svc::daemon::TerminateSpec;

/// Fails a service request which argument does not fit its DSDL field.
///
template <typename Success>
typename SenderOf<svc::ResultOf<Success>>::Ptr invalidArgument(std::string message)
{
    return just<svc::ResultOf<Success>>(svc::Failure{Error{ErrorKind::InvalidArgument, std::move(message)}});
}

/// @return `false` if the target device id does not fit the request (nothing is truncated then).
///
template <typename Request>
CETL_NODISCARD bool assignTargetUdid(Request& request, const DaemonConnection& connection)
{
    if (!connection.target_device_id)
    {
        return true;
    }
    return common::assignString(request.target_udid,
                                *connection.target_device_id,
                                Request::_traits_::ArrayCapacity::target_udid);
}

template <typename Success>
typename SenderOf<svc::ResultOf<Success>>::Ptr tooLongTargetUdid(const DaemonConnection& connection)
{
    return invalidArgument<Success>(
        fmt::format("Target device id is too long ({} bytes).", connection.target_device_id->size()));
}

void bindDescribe(DaemonCalls& calls, const DaemonCallContext& context)
{
    calls.describe = [context] {
        //
        using Success = Client::Describe::Success;
        auto svc_op   = std::make_unique<ViaDaemonSender<Success>>(  //
            context.connections,
            [&memory = context.memory](const DaemonConnection& connection) {
                //
                DescribeSpec::Request request{&memory};
                if (!assignTargetUdid(request, connection))
                {
                    return tooLongTargetUdid<Success>(connection);
                }
                return DescribeClient::make(connection.router, request);
            });
        return withCallBoundary<Client::Describe>("describe", context.logger, std::move(svc_op));
    };
}

void bindListTargets(DaemonCalls& calls, const DaemonCallContext& context)
{
    calls.list_targets = [context] {
        //
        using Success = Client::ListTargets::Success;
        auto svc_op   = std::make_unique<ViaDaemonSender<Success>>(  //
            context.connections,
            [&memory = context.memory](const DaemonConnection& connection) {
                //
                return ListTargetsClient::make(connection.router, ListTargetsSpec::Request{&memory});
            });
        return withCallBoundary<Client::ListTargets>("list_targets", context.logger, std::move(svc_op));
    };
}

void bindTerminate(DaemonCalls& calls, const DaemonCallContext& context)
{
    calls.terminate = [context](const std::string& bundle_id) {
        //
        using Success = Client::Terminate::Success;

        TerminateSpec::Request request{&context.memory};
        if (!common::assignString(request.bundle_id,
                                  bundle_id,
                                  TerminateSpec::Request::_traits_::ArrayCapacity::bundle_id))
        {
            return withCallBoundary<Client::Terminate>(  //
                "terminate",
                context.logger,
                invalidArgument<Success>(fmt::format("Bundle id is too long ({} bytes).", bundle_id.size())));
        }

        auto svc_op = std::make_unique<ViaDaemonSender<Success>>(  //
            context.connections,
            [request](const DaemonConnection& connection) {
                //
                auto targeted_request = request;
                if (!assignTargetUdid(targeted_request, connection))
                {
                    return tooLongTargetUdid<Success>(connection);
                }
                return TerminateClient::make(connection.router, targeted_request);
            });
        return withCallBoundary<Client::Terminate>("terminate", context.logger, std::move(svc_op));
    };
}

const std::array<DaemonCallDescriptor, 3> Registry{{
    {"describe", bindDescribe},
    {"list_targets", bindListTargets},
    {"terminate", bindTerminate},
}};

}  // namespace

cetl::span<const DaemonCallDescriptor> daemonCallRegistry()
{
    return {Registry.data(), Registry.size()};
}

DaemonCalls bindDaemonCalls(const DaemonCallContext& context)
{
    DaemonCalls calls;
    for (const auto& descriptor : daemonCallRegistry())
    {
        context.logger->trace("Binding daemon call `{}`.", descriptor.name);
        descriptor.bind(calls, context);
    }
    return calls;
}

}  // namespace sdk
}  // namespace devctl
