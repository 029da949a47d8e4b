//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_SVC_DAEMON_CLIENTS_HPP_INCLUDED
#define DEVCTL_SDK_SVC_DAEMON_CLIENTS_HPP_INCLUDED

#include "svc/daemon/describe_spec.hpp"
#include "svc/daemon/list_targets_spec.hpp"
#include "svc/daemon/terminate_spec.hpp"
#include "svc/request_client.hpp"
#include "svc/svc_types.hpp"

#include <devctl/sdk/types.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <vector>

namespace devctl
{
namespace sdk
{
namespace svc
{
namespace daemon
{

using DescribeSpec    = common::svc::daemon::DescribeSpec;
using ListTargetsSpec = common::svc::daemon::ListTargetsSpec;
using TerminateSpec   = common::svc::daemon::TerminateSpec;

class DescribeCollector final
{
public:
    using Success = TargetDescription;

    static constexpr bool IsStreaming = false;

    cetl::optional<Failure> accept(const DescribeSpec::Response& response);

    Success take()
    {
        return std::move(target_);
    }

private:
    Success target_;

};  // DescribeCollector

/// Collects one target per response, until the channel completion.
///
class ListTargetsCollector final
{
public:
    using Success = std::vector<TargetDescription>;

    static constexpr bool IsStreaming = true;

    cetl::optional<Failure> accept(const ListTargetsSpec::Response& response);

    Success take()
    {
        return std::move(targets_);
    }

private:
    Success targets_;

};  // ListTargetsCollector

using DescribeClient    = RequestClient<DescribeSpec, DescribeCollector>;
using ListTargetsClient = RequestClient<ListTargetsSpec, ListTargetsCollector>;
using TerminateClient   = RequestClient<TerminateSpec, FaultOnlyCollector>;

}  // namespace daemon
}  // namespace svc
}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_SVC_DAEMON_CLIENTS_HPP_INCLUDED
