//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_SVC_TYPES_HPP_INCLUDED
#define DEVCTL_SDK_SVC_TYPES_HPP_INCLUDED

#include <devctl/sdk/errors.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace devctl
{
namespace sdk
{
namespace svc
{

/// Structured fault reported by the remote service in its response.
///
struct RemoteFault final
{
    std::int32_t code;
    std::string  message;
};

/// Abnormal channel termination, malformed payload or failure to send (`errno`-like code).
///
struct ChannelFault final
{
    int error_code;
};

/// Service level failure. `Error` is a domain error detected locally.
///
using Failure = cetl::variant<RemoteFault, ChannelFault, Error>;

template <typename Success>
using ResultOf = cetl::variant<Success, Failure>;

/// Makes `RemoteFault` out of DSDL `Fault`, unless it's a zero (aka success) code.
///
template <typename Fault>
cetl::optional<Failure> remoteFaultOf(const Fault& fault)
{
    if (fault.code == 0)
    {
        return cetl::nullopt;
    }
    return Failure{RemoteFault{fault.code, std::string{fault.message.begin(), fault.message.end()}}};
}

}  // namespace svc
}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_SVC_TYPES_HPP_INCLUDED
