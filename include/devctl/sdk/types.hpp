//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_TYPES_HPP_INCLUDED
#define DEVCTL_SDK_TYPES_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace devctl
{
namespace sdk
{

/// Locality and address of a companion peer, as resolved for a device.
///
struct PeerInfo final
{
    std::string                 host;
    std::uint16_t               port{0};
    cetl::optional<std::string> device_id;
    bool                        is_local{false};

};  // PeerInfo

enum class AppProcessState : std::uint8_t
{
    Unknown    = 0,
    NotRunning = 1,
    Running    = 2,

};  // AppProcessState

struct InstalledApp final
{
    std::string              bundle_id;
    std::string              name;
    std::vector<std::string> architectures;
    std::string              install_type;
    AppProcessState          process_state{AppProcessState::Unknown};
    bool                     debuggable{false};

};  // InstalledApp

struct Point final
{
    std::int32_t x;
    std::int32_t y;

};  // Point

/// Opaque (JSON) description of the accessibility elements.
///
struct AccessibilityInfo final
{
    std::string json;

};  // AccessibilityInfo

struct TargetDescription final
{
    std::string udid;
    std::string name;
    std::string state;
    std::string os_version;

};  // TargetDescription

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_TYPES_HPP_INCLUDED
