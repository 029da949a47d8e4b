//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_ERRORS_HPP_INCLUDED
#define DEVCTL_SDK_ERRORS_HPP_INCLUDED

#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{

/// Defines kinds of failures reported by the SDK operations.
///
enum class ErrorKind  // NOLINT(performance-enum-size)
{
    /// No companion peer is known for the requested device.
    PeerNotFound,
    /// The background daemon could not be started.
    DaemonUnavailable,
    /// Connection to a peer could not be established (or was lost before use).
    ConnectionError,
    /// The remote side has reported a structured fault (see the message).
    TransportFault,
    /// Malformed framing, invalid payload or abnormal termination of a channel.
    ProtocolFault,
    /// Bulk media upload has been aborted.
    UploadFailed,
    /// Requested capability name is not one of the known ones; reported before any network interaction.
    UnknownCapability,
    /// Argument of the operation does not fit its request (f.e. too long identifier); reported before any network
    /// interaction.
    InvalidArgument,

};  // ErrorKind

/// Domain error of the SDK operations.
///
struct Error final
{
    ErrorKind   kind;
    std::string message;

    /// Name of the operation which has failed. Empty if the failure happened outside of any operation.
    std::string op_name;

    Error(const ErrorKind error_kind, std::string error_message, std::string operation_name = {})
        : kind{error_kind}
        , message{std::move(error_message)}
        , op_name{std::move(operation_name)}
    {
    }

};  // Error

constexpr const char* toString(const ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::PeerNotFound:
        return "PeerNotFound";
    case ErrorKind::DaemonUnavailable:
        return "DaemonUnavailable";
    case ErrorKind::ConnectionError:
        return "ConnectionError";
    case ErrorKind::TransportFault:
        return "TransportFault";
    case ErrorKind::ProtocolFault:
        return "ProtocolFault";
    case ErrorKind::UploadFailed:
        return "UploadFailed";
    case ErrorKind::UnknownCapability:
        return "UnknownCapability";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "?";
}

}  // namespace sdk
}  // namespace devctl

// MARK: - Formatting

// NOLINTBEGIN
template <>
struct fmt::formatter<devctl::sdk::ErrorKind> : formatter<string_view>
{
    auto format(const devctl::sdk::ErrorKind kind, format_context& ctx) const
    {
        return formatter<string_view>::format(devctl::sdk::toString(kind), ctx);
    }
};

template <>
struct fmt::formatter<devctl::sdk::Error> : formatter<std::string>
{
    auto format(const devctl::sdk::Error& error, format_context& ctx) const
    {
        if (error.op_name.empty())
        {
            return format_to(ctx.out(), "{}: {}", error.kind, error.message);
        }
        return format_to(ctx.out(), "{} in `{}`: {}", error.kind, error.op_name, error.message);
    }
};
// NOLINTEND

#endif  // DEVCTL_SDK_ERRORS_HPP_INCLUDED
