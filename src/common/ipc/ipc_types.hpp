//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IPC_TYPES_HPP_INCLUDED
#define DEVCTL_COMMON_IPC_TYPES_HPP_INCLUDED

#include <cetl/pf20/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace devctl
{
namespace common
{
namespace ipc
{

/// `errno`-like completion codes of channels and pipes (zero on success).
///
enum class ErrorCode : int  // NOLINT
{
    Success = 0,

    /// The peer was never reached (f.e. the pipe got disconnected before the route was connected).
    NotConnected = ENOTCONN,

    /// An established connection to the peer was lost.
    Disconnected = ESHUTDOWN,

    /// The local side has given up on the channel (f.e. the operation was destroyed).
    Canceled = ECANCELED,

};  // ErrorCode

using Payload  = cetl::span<const std::uint8_t>;
using Payloads = cetl::span<const Payload>;

/// Every message on the wire is a frame: this header immediately followed by `payload_size` bytes.
///
/// Both fields are in the host byte order (peers are on the same machine, or of the same architecture).
///
struct FrameHeader final
{
    static constexpr std::uint32_t Signature = 0x4C544344;  // "DCTL" when read as little-endian bytes

    /// Upper limit of the payload size. Empty payloads are not valid either.
    static constexpr std::size_t MaxPayloadSize = 1ULL << 20ULL;

    std::uint32_t signature{0};
    std::uint32_t payload_size{0};

    bool isValid() const noexcept
    {
        return (signature == Signature) && (payload_size > 0) && (payload_size <= MaxPayloadSize);
    }

};  // FrameHeader

/// Amount of not yet written out data, from which a pipe reports itself as backlogged.
///
constexpr std::size_t BacklogThreshold = 1ULL << 16ULL;

}  // namespace ipc
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IPC_TYPES_HPP_INCLUDED
