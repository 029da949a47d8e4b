//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
#define DEVCTL_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED

#include "client_pipe.hpp"
#include "io/socket_address.hpp"
#include "ipc/ipc_types.hpp"
#include "framed_socket.hpp"

#include "devctl/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

namespace devctl
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Client pipe over a non-blocking stream socket (Unix domain or TCP).
///
class SocketClient final : public FramedSocket, public ClientPipe
{
public:
    SocketClient(libcyphal::IExecutor& executor, const io::SocketAddress& address);

    SocketClient(const SocketClient&)                = delete;
    SocketClient(SocketClient&&) noexcept            = delete;
    SocketClient& operator=(const SocketClient&)     = delete;
    SocketClient& operator=(SocketClient&&) noexcept = delete;

    ~SocketClient() override = default;

private:
    int  makeSocketHandle();
    void awaitSocketIo();
    void handleConnect();
    void handleSocketIo();
    void handleDisconnect(const int reason);

    // ClientPipe
    //
    CETL_NODISCARD int start(EventHandler event_handler) override;
    CETL_NODISCARD int  send(const Payloads payloads) override;
    CETL_NODISCARD bool isBacklogged() const override;

    io::SocketAddress                        socket_address_;
    platform::IPosixExecutorExtension* const posix_executor_ext_;
    IoState                                  io_state_;
    libcyphal::IExecutor::Callback::Any      socket_callback_;
    bool                                     is_connected_;
    bool                                     awaits_writable_;
    EventHandler                             event_handler_;

};  // SocketClient

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
