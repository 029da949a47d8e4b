//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_FACTORY_HPP_INCLUDED
#define DEVCTL_SDK_FACTORY_HPP_INCLUDED

#include "connection_manager.hpp"

#include <devctl/sdk/client.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

namespace devctl
{
namespace sdk
{

struct Factory
{
    /// Makes the client facade with the given dialer of IPC routes.
    ///
    CETL_NODISCARD static Client::Ptr makeClient(cetl::pmr::memory_resource& memory,
                                                 libcyphal::IExecutor&       executor,
                                                 const Client::Params&       params,
                                                 Client::Collaborators       collaborators,
                                                 Dialer::Ptr                 dialer);

};  // Factory

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_FACTORY_HPP_INCLUDED
