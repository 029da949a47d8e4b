//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_SVC_COMPANION_CLIENTS_HPP_INCLUDED
#define DEVCTL_SDK_SVC_COMPANION_CLIENTS_HPP_INCLUDED

#include "svc/companion/accessibility_info_spec.hpp"
#include "svc/companion/approve_spec.hpp"
#include "svc/companion/list_apps_spec.hpp"
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
namespace companion
{

using ListAppsSpec          = common::svc::companion::ListAppsSpec;
using AccessibilityInfoSpec = common::svc::companion::AccessibilityInfoSpec;
using ApproveSpec           = common::svc::companion::ApproveSpec;

/// Collects one installed application per response, until the channel completion.
///
class ListAppsCollector final
{
public:
    using Success = std::vector<InstalledApp>;

    static constexpr bool IsStreaming = true;

    cetl::optional<Failure> accept(const ListAppsSpec::Response& response);

    Success take()
    {
        return std::move(apps_);
    }

private:
    Success apps_;

};  // ListAppsCollector

class AccessibilityInfoCollector final
{
public:
    using Success = AccessibilityInfo;

    static constexpr bool IsStreaming = false;

    cetl::optional<Failure> accept(const AccessibilityInfoSpec::Response& response);

    Success take()
    {
        return std::move(info_);
    }

private:
    Success info_;

};  // AccessibilityInfoCollector

using ListAppsClient          = RequestClient<ListAppsSpec, ListAppsCollector>;
using AccessibilityInfoClient = RequestClient<AccessibilityInfoSpec, AccessibilityInfoCollector>;
using ApproveClient           = RequestClient<ApproveSpec, FaultOnlyCollector>;

}  // namespace companion
}  // namespace svc
}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_SVC_COMPANION_CLIENTS_HPP_INCLUDED
