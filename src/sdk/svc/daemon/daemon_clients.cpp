//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "daemon_clients.hpp"

#include "common_helpers.hpp"
#include "svc/svc_types.hpp"

#include "devctl/common/svc/Fault_0_1.hpp"
#include "devctl/common/svc/daemon/TargetDescription_0_1.hpp"

#include <devctl/sdk/types.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>

namespace devctl
{
namespace sdk
{
namespace svc
{
namespace daemon
{
namespace
{

using Fault_0_1             = common::svc::Fault_0_1;
using TargetDescription_0_1 = common::svc::daemon::TargetDescription_0_1;

TargetDescription toTargetDescription(const TargetDescription_0_1& target)
{
    return {common::stringFrom(target.udid),
            common::stringFrom(target.name),
            common::stringFrom(target.state),
            common::stringFrom(target.os_version)};
}

}  // namespace

cetl::optional<Failure> DescribeCollector::accept(const DescribeSpec::Response& response)
{
    if (const auto* const target = cetl::get_if<TargetDescription_0_1>(&response.union_value))
    {
        target_ = toTargetDescription(*target);
        return cetl::nullopt;
    }
    if (const auto* const fault = cetl::get_if<Fault_0_1>(&response.union_value))
    {
        if (auto failure = remoteFaultOf(*fault))
        {
            return failure;
        }
    }
    return Failure{ChannelFault{EBADMSG}};
}

cetl::optional<Failure> ListTargetsCollector::accept(const ListTargetsSpec::Response& response)
{
    if (const auto* const target = cetl::get_if<TargetDescription_0_1>(&response.union_value))
    {
        targets_.push_back(toTargetDescription(*target));
        return cetl::nullopt;
    }
    if (const auto* const fault = cetl::get_if<Fault_0_1>(&response.union_value))
    {
        return remoteFaultOf(*fault);
    }
    return cetl::nullopt;
}

}  // namespace daemon
}  // namespace svc
}  // namespace sdk
}  // namespace devctl
