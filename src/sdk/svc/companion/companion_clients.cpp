//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "companion_clients.hpp"

#include "common_helpers.hpp"
#include "svc/svc_types.hpp"

#include "devctl/common/svc/Fault_0_1.hpp"
#include "devctl/common/svc/companion/InstalledApp_0_1.hpp"

#include <devctl/sdk/types.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{
namespace svc
{
namespace companion
{
namespace
{

using Fault_0_1        = common::svc::Fault_0_1;
using InstalledApp_0_1 = common::svc::companion::InstalledApp_0_1;

AppProcessState toProcessState(const std::uint8_t process_state)
{
    switch (process_state)
    {
    case InstalledApp_0_1::PROCESS_STATE_NOT_RUNNING:
        return AppProcessState::NotRunning;
    case InstalledApp_0_1::PROCESS_STATE_RUNNING:
        return AppProcessState::Running;
    default:
        return AppProcessState::Unknown;
    }
}

InstalledApp toInstalledApp(const InstalledApp_0_1& app)
{
    InstalledApp result;
    result.bundle_id    = common::stringFrom(app.bundle_id);
    result.name         = common::stringFrom(app.name);
    result.install_type = common::stringFrom(app.install_type);
    for (const auto& arch : app.architectures)
    {
        result.architectures.push_back(common::stringFrom(arch.name));
    }
    result.process_state = toProcessState(app.process_state);
    result.debuggable    = app.debuggable;
    return result;
}

}  // namespace

cetl::optional<Failure> ListAppsCollector::accept(const ListAppsSpec::Response& response)
{
    if (const auto* const fault = cetl::get_if<Fault_0_1>(&response.union_value))
    {
        return remoteFaultOf(*fault);
    }
    if (const auto* const app = cetl::get_if<InstalledApp_0_1>(&response.union_value))
    {
        apps_.push_back(toInstalledApp(*app));
    }
    return cetl::nullopt;
}

cetl::optional<Failure> AccessibilityInfoCollector::accept(const AccessibilityInfoSpec::Response& response)
{
    if (const auto* const fault = cetl::get_if<Fault_0_1>(&response.union_value))
    {
        if (auto failure = remoteFaultOf(*fault))
        {
            return failure;
        }
        // A zero code fault instead of the info is still a malformed answer.
        return Failure{ChannelFault{EBADMSG}};
    }
    using Json = AccessibilityInfoSpec::Response::_traits_::TypeOf::json;
    if (const auto* const json = cetl::get_if<Json>(&response.union_value))
    {
        info_.json = common::stringFrom(*json);
    }
    return cetl::nullopt;
}

}  // namespace companion
}  // namespace svc
}  // namespace sdk
}  // namespace devctl
