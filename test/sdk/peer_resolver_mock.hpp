//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_PEER_RESOLVER_MOCK_HPP_INCLUDED
#define DEVCTL_SDK_PEER_RESOLVER_MOCK_HPP_INCLUDED

#include <devctl/sdk/peer_resolver.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <string>

namespace devctl
{
namespace sdk
{

class PeerResolverMock : public PeerResolver
{
public:
    MOCK_METHOD(Resolve::Result, resolve, (const cetl::optional<std::string>& device_id), (override));

};  // PeerResolverMock

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_PEER_RESOLVER_MOCK_HPP_INCLUDED
