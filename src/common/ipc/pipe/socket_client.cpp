//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_client.hpp"

#include "ipc/ipc_types.hpp"
#include "framed_socket.hpp"

#include "devctl/platform/posix_executor_extension.hpp"
#include "devctl/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace devctl
{
namespace common
{
namespace ipc
{
namespace pipe
{

SocketClient::SocketClient(libcyphal::IExecutor& executor, const io::SocketAddress& address)
    : socket_address_{address}
    , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
    , is_connected_{false}
    , awaits_writable_{false}
{
    CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");

    io_state_.inbound.on_frame = [this](const Payload payload) {
        //
        return event_handler_(Event::Message{payload});
    };
}

int SocketClient::start(EventHandler event_handler)
{
    CETL_DEBUG_ASSERT(event_handler, "");
    CETL_DEBUG_ASSERT(!io_state_.fd.valid(), "");

    if (posix_executor_ext_ == nullptr)
    {
        logger().error("Executor has no POSIX extension - can't await socket events.");
        return EINVAL;
    }

    event_handler_ = std::move(event_handler);

    if (const auto err = makeSocketHandle())
    {
        logger().debug("Failed to make client socket handle: {}.", std::strerror(err));
        return err;
    }

    socket_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            handleConnect();
        },
        platform::IPosixExecutorExtension::Trigger::Writable{io_state_.fd.get()});

    return 0;
}

int SocketClient::makeSocketHandle()
{
    using SocketResult = io::SocketAddress::SocketResult;

    auto maybe_socket = socket_address_.socket(SOCK_STREAM);
    if (const auto* const err = cetl::get_if<SocketResult::Failure>(&maybe_socket))
    {
        return *err;
    }
    auto socket_fd = cetl::get<SocketResult::Success>(std::move(maybe_socket));
    CETL_DEBUG_ASSERT(socket_fd.valid(), "");

    if (const int err = socket_address_.connect(socket_fd))
    {
        return err;
    }

    io_state_.fd = std::move(socket_fd);
    return 0;
}

int SocketClient::send(const Payloads payloads)
{
    if (const int err = sendFrame(io_state_, payloads))
    {
        return err;
    }
    if (is_connected_)
    {
        awaitSocketIo();
    }
    return 0;
}

bool SocketClient::isBacklogged() const
{
    return FramedSocket::isBacklogged(io_state_);
}

/// (Re)registers the socket callback, so that it also awaits writability while there is queued data.
///
void SocketClient::awaitSocketIo()
{
    using Trigger = platform::IPosixExecutorExtension::Trigger;

    const bool needs_writable = hasOutbound(io_state_);
    if (socket_callback_ && (needs_writable == awaits_writable_))
    {
        return;
    }

    // The socket could be registered within the executor only once, hence the reset first.
    socket_callback_.reset();
    awaits_writable_ = needs_writable;

    auto handler = [this](const auto&) {
        //
        handleSocketIo();
    };
    if (needs_writable)
    {
        socket_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
            std::move(handler),
            Trigger::ReadableOrWritable{io_state_.fd.get()});
    }
    else
    {
        socket_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
            std::move(handler),
            Trigger::Readable{io_state_.fd.get()});
    }
}

void SocketClient::handleConnect()
{
    socket_callback_.reset();

    int so_error = 0;
    if (const auto err = platform::posixSyscallError([this, &so_error] {
            //
            socklen_t len = sizeof(so_error);
            return ::getsockopt(io_state_.fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
        }))
    {
        logger().warn("Failed to query socket error: {}.", std::strerror(err));
        so_error = err;
    }
    if (so_error != 0)
    {
        logger().error("Failed to connect to server: {}.", std::strerror(so_error));
        handleDisconnect(so_error);
        return;
    }

    is_connected_ = true;
    awaitSocketIo();

    const int err = event_handler_(Event::Connected{});
    if (err != 0)
    {
        logger().warn("Failed to handle connection - closing it (err={}): {}.", err, std::strerror(err));
        handleDisconnect(err);
    }
}

void SocketClient::handleSocketIo()
{
    if (hasOutbound(io_state_))
    {
        if (const auto err = flushOutbound(io_state_))
        {
            logger().warn("Failed to send queued data - closing connection (err={}): {}.", err, std::strerror(err));
            handleDisconnect(err);
            return;
        }
        awaitSocketIo();
    }

    if (const auto err = receiveFrame(io_state_))
    {
        if (err == -1)
        {
            logger().debug("End of server stream - closing connection.");
            handleDisconnect(0);
            return;
        }
        logger().warn("Failed to handle server data - closing connection (err={}): {}.", err, std::strerror(err));
        handleDisconnect(err);
    }
}

void SocketClient::handleDisconnect(const int reason)
{
    socket_callback_.reset();
    is_connected_    = false;
    awaits_writable_ = false;
    resetIoState(io_state_);

    const int err = event_handler_(Event::Disconnected{reason});
    (void) err;  // Nothing else to do with the pipe which is already closed.
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace devctl
