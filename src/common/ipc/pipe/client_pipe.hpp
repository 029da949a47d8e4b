//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
#define DEVCTL_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED

#include "ipc/ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>

namespace devctl
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Connection of a client to a peer (the daemon or a companion), carrying whole messages.
///
/// The pipe is not reconnectable: once disconnected, it stays so.
///
class ClientPipe
{
public:
    using Ptr = std::unique_ptr<ClientPipe>;

    struct Event final
    {
        struct Connected final
        {};

        /// A complete message from the peer. The payload is valid only during the handler call.
        struct Message final
        {
            Payload payload;
        };

        struct Disconnected final
        {
            /// Why the connection is closed (`errno`-like), or zero if the peer has just closed it.
            int reason;
        };

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    /// Non-zero result of the handler (for `Connected` or `Message`) closes the pipe.
    using EventHandler = std::function<int(const Event::Var&)>;

    ClientPipe(const ClientPipe&)                = delete;
    ClientPipe(ClientPipe&&) noexcept            = delete;
    ClientPipe& operator=(const ClientPipe&)     = delete;
    ClientPipe& operator=(ClientPipe&&) noexcept = delete;

    virtual ~ClientPipe() = default;

    /// Initiates connection; the outcome comes later, as either `Connected` or `Disconnected` event.
    ///
    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends the concatenation of the payload fragments as one message.
    ///
    /// Never blocks: whatever the connection can't take immediately is queued, and written out later.
    ///
    CETL_NODISCARD virtual int send(const Payloads payloads) = 0;

    CETL_NODISCARD virtual bool isBacklogged() const = 0;

protected:
    ClientPipe() = default;

};  // ClientPipe

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
