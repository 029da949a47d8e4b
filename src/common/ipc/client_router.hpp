//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IPC_CLIENT_ROUTER_HPP_INCLUDED
#define DEVCTL_COMMON_IPC_CLIENT_ROUTER_HPP_INCLUDED

#include "channel.hpp"
#include "gateway.hpp"
#include "pipe/client_pipe.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>

namespace devctl
{
namespace common
{
namespace ipc
{

/// Client end of the IPC route to a daemon (or a companion).
///
/// Any number of channels share the one pipe, each under its own tag. The route counts as connected
/// once the server accepts `RouteConnect`; a lost pipe completes every channel, including ones made later.
///
class ClientRouter
{
public:
    using Ptr = std::shared_ptr<ClientRouter>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory, pipe::ClientPipe::Ptr client_pipe);

    ClientRouter(const ClientRouter&)                = delete;
    ClientRouter(ClientRouter&&) noexcept            = delete;
    ClientRouter& operator=(const ClientRouter&)     = delete;
    ClientRouter& operator=(ClientRouter&&) noexcept = delete;

    virtual ~ClientRouter() = default;

    /// Starts the pipe (connecting it). Result is `errno`-like.
    ///
    CETL_NODISCARD virtual int start() = 0;

    /// Memory of the DSDL messages which are routed.
    ///
    CETL_NODISCARD virtual cetl::pmr::memory_resource& memory() = 0;

    /// Makes a new channel to the named service. Nothing is sent until the channel is subscribed.
    ///
    template <typename Ch>
    CETL_NODISCARD Ch makeChannel(const cetl::string_view service_name)
    {
        return Ch{memory(), makeGateway(), detail::serviceIdOf(service_name)};
    }

protected:
    ClientRouter() = default;

    CETL_NODISCARD virtual detail::Gateway::Ptr makeGateway() = 0;

};  // ClientRouter

}  // namespace ipc
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IPC_CLIENT_ROUTER_HPP_INCLUDED
