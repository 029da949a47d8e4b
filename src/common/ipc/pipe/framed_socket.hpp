//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IPC_PIPE_FRAMED_SOCKET_HPP_INCLUDED
#define DEVCTL_COMMON_IPC_PIPE_FRAMED_SOCKET_HPP_INCLUDED

#include "io/io.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace devctl
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Exchange of frames (see `FrameHeader`) over a non-blocking stream socket.
///
/// Nothing here ever blocks. Outgoing frames are queued whole, and written out as far as the socket accepts;
/// the rest waits for `flushOutbound` (once the socket becomes writable). Incoming frames are assembled
/// from whatever is available, and handed over to `Inbound::on_frame` one by one.
///
class FramedSocket
{
public:
    struct Inbound final
    {
        struct AwaitingHeader final
        {
            FrameHeader header;
        };
        struct AwaitingPayload final
        {
            std::vector<std::uint8_t> payload;
        };

        cetl::variant<AwaitingHeader, AwaitingPayload> stage{AwaitingHeader{}};
        std::size_t                                    filled{0};
        std::function<int(Payload)>                    on_frame;

    };  // Inbound

    struct Outbound final
    {
        std::deque<std::vector<std::uint8_t>> frames;
        std::size_t                           front_offset{0};
        std::size_t                           queued_size{0};

    };  // Outbound

    struct IoState final
    {
        io::OwnFd fd;
        Inbound   inbound;
        Outbound  outbound;

    };  // IoState

    FramedSocket(const FramedSocket&)                = delete;
    FramedSocket(FramedSocket&&) noexcept            = delete;
    FramedSocket& operator=(const FramedSocket&)     = delete;
    FramedSocket& operator=(FramedSocket&&) noexcept = delete;

protected:
    FramedSocket()  = default;
    ~FramedSocket() = default;

    Logger& logger() const noexcept
    {
        return *logger_;
    }

    /// Frames the concatenation of the payloads, queues the frame, and writes out as much as possible.
    ///
    /// @return Zero if the frame is sent or queued, otherwise `errno`.
    ///
    CETL_NODISCARD int sendFrame(IoState& io_state, const Payloads payloads) const;

    /// @return Zero if either everything is written out, or the socket would block; otherwise `errno`.
    ///
    CETL_NODISCARD int flushOutbound(IoState& io_state) const;

    CETL_NODISCARD static bool hasOutbound(const IoState& io_state) noexcept
    {
        return !io_state.outbound.frames.empty();
    }

    CETL_NODISCARD static bool isBacklogged(const IoState& io_state) noexcept
    {
        return io_state.outbound.queued_size >= BacklogThreshold;
    }

    /// Closes the socket, and drops whatever was queued or partially received.
    ///
    static void resetIoState(IoState& io_state);

    /// Reads whatever is available of the current frame.
    ///
    /// @return Zero if more data is expected, `-1` on the end of stream, or `errno` on failure
    ///         (including an invalid frame header, and a non-zero result of `on_frame`).
    ///
    CETL_NODISCARD int receiveFrame(IoState& io_state) const;

private:
    CETL_NODISCARD int readInto(IoState& io_state, std::uint8_t* const dst, const std::size_t size) const;

    LoggerPtr logger_{getLogger("ipc")};

};  // FramedSocket

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IPC_PIPE_FRAMED_SOCKET_HPP_INCLUDED
