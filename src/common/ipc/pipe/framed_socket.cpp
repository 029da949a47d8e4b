//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "framed_socket.hpp"

#include "ipc/ipc_types.hpp"

#include "devctl/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <sys/socket.h>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace devctl
{
namespace common
{
namespace ipc
{

constexpr std::uint32_t FrameHeader::Signature;
constexpr std::size_t   FrameHeader::MaxPayloadSize;

namespace pipe
{

int FramedSocket::sendFrame(IoState& io_state, const Payloads payloads) const
{
    if (!io_state.fd.valid())
    {
        return ENOTCONN;
    }

    std::size_t payload_size = 0;
    for (const auto payload : payloads)
    {
        payload_size += payload.size();
    }
    if ((payload_size == 0) || (payload_size > FrameHeader::MaxPayloadSize))
    {
        logger_->error("Invalid frame payload size (fd={}, size={}).", io_state.fd.get(), payload_size);
        return EMSGSIZE;
    }

    FrameHeader header{};
    header.signature    = FrameHeader::Signature;
    header.payload_size = static_cast<std::uint32_t>(payload_size);

    std::vector<std::uint8_t> frame(sizeof(header));
    std::memcpy(frame.data(), &header, sizeof(header));
    frame.reserve(sizeof(header) + payload_size);
    for (const auto payload : payloads)
    {
        frame.insert(frame.end(), payload.begin(), payload.end());
    }

    io_state.outbound.queued_size += frame.size();
    io_state.outbound.frames.push_back(std::move(frame));

    if (const int err = flushOutbound(io_state))
    {
        logger_->error("Failed to send frame (fd={}): {}.", io_state.fd.get(), std::strerror(err));
        return err;
    }
    return 0;
}

int FramedSocket::flushOutbound(IoState& io_state) const
{
    auto& outbound = io_state.outbound;
    while (!outbound.frames.empty())
    {
        const auto& front = outbound.frames.front();
        CETL_DEBUG_ASSERT(outbound.front_offset < front.size(), "");

        ssize_t sent = 0;
        if (const int err = platform::posixSyscallError([&io_state, &front, &sent] {
                //
                const auto offset = io_state.outbound.front_offset;
                // NOLINTNEXTLINE(*-pointer-arithmetic)
                return sent = ::send(io_state.fd.get(), front.data() + offset, front.size() - offset, MSG_DONTWAIT | MSG_NOSIGNAL);
            }))
        {
            if ((err == EAGAIN) || (err == EWOULDBLOCK))
            {
                logger_->trace("Socket is full (fd={}, queued={}).", io_state.fd.get(), outbound.queued_size);
                return 0;
            }
            return err;
        }

        outbound.front_offset += static_cast<std::size_t>(sent);
        outbound.queued_size -= static_cast<std::size_t>(sent);
        if (outbound.front_offset == front.size())
        {
            outbound.frames.pop_front();
            outbound.front_offset = 0;
        }
    }
    return 0;
}

void FramedSocket::resetIoState(IoState& io_state)
{
    io_state.fd.reset();
    io_state.inbound.stage.emplace<Inbound::AwaitingHeader>();
    io_state.inbound.filled = 0;
    io_state.outbound.frames.clear();
    io_state.outbound.front_offset = 0;
    io_state.outbound.queued_size  = 0;
}

int FramedSocket::readInto(IoState& io_state, std::uint8_t* const dst, const std::size_t size) const
{
    auto& inbound = io_state.inbound;
    CETL_DEBUG_ASSERT(inbound.filled < size, "");

    ssize_t received = 0;
    if (const auto err = platform::posixSyscallError([&io_state, &received, dst, size] {
            //
            const auto filled = io_state.inbound.filled;
            // NOLINTNEXTLINE(*-pointer-arithmetic)
            return received = ::recv(io_state.fd.get(), dst + filled, size - filled, MSG_DONTWAIT);
        }))
    {
        if ((err == EAGAIN) || (err == EWOULDBLOCK))
        {
            return 0;
        }
        logger_->error("Failed to receive frame (fd={}): {}.", io_state.fd.get(), std::strerror(err));
        return err;
    }
    if (received == 0)
    {
        logger_->debug("End of stream (fd={}).", io_state.fd.get());
        return -1;
    }

    inbound.filled += static_cast<std::size_t>(received);
    return 0;
}

int FramedSocket::receiveFrame(IoState& io_state) const
{
    auto& inbound = io_state.inbound;

    if (auto* const awaiting_header = cetl::get_if<Inbound::AwaitingHeader>(&inbound.stage))
    {
        auto& header = awaiting_header->header;
        // NOLINTNEXTLINE(*-reinterpret-cast)
        if (const int err = readInto(io_state, reinterpret_cast<std::uint8_t*>(&header), sizeof(header)))
        {
            return err;
        }
        if (inbound.filled < sizeof(header))
        {
            return 0;
        }
        if (!header.isValid())
        {
            logger_->error("Invalid frame header (fd={}, signature={:#x}, payload_size={}).",
                           io_state.fd.get(),
                           header.signature,
                           header.payload_size);
            return EINVAL;
        }

        const std::size_t payload_size = header.payload_size;
        inbound.filled                 = 0;
        inbound.stage.emplace<Inbound::AwaitingPayload>(
            Inbound::AwaitingPayload{std::vector<std::uint8_t>(payload_size)});
    }

    auto& payload = cetl::get<Inbound::AwaitingPayload>(inbound.stage).payload;
    if (const int err = readInto(io_state, payload.data(), payload.size()))
    {
        return err;
    }
    if (inbound.filled < payload.size())
    {
        return 0;
    }

    // The frame is complete, so the next one starts with its header.
    const auto frame_payload = std::move(payload);
    inbound.filled           = 0;
    inbound.stage.emplace<Inbound::AwaitingHeader>();

    return inbound.on_frame(Payload{frame_payload.data(), frame_payload.size()});
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace devctl
