//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define DEVCTL_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <utility>

namespace devctl
{
namespace common
{
namespace io
{

/// Address of a peer socket to connect to.
///
/// Supported textual forms:
/// - `unix:<path>` and `unix-abstract:<name>` - Unix domain sockets;
/// - `<ipv4>[:<port>]`, `[<ipv6>]:<port>` or bare `<ipv6>` - numeric inet addresses;
/// - `<hostname>[:<port>]` - resolved to the first IPv4/IPv6 address.
///
class SocketAddress final
{
public:
    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    static ParseResult::Var parse(const std::string& str, const std::uint16_t port_hint);

    /// Builds textual connection string out of separate host and port.
    ///
    /// A host which is already a Unix domain address is returned as is.
    ///
    static std::string makeConnectionString(const std::string& host, const std::uint16_t port);

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    bool isUnix() const noexcept
    {
        return asGenericAddr().sa_family == AF_UNIX;
    }

    bool isAnyInet() const noexcept
    {
        const auto family = asGenericAddr().sa_family;
        return (family == AF_INET) || (family == AF_INET6);
    }

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    SocketResult::Var socket(const int type) const;

    /// Starts connecting the given (non-blocking) socket.
    ///
    /// @return Zero if connected or connection is in progress, otherwise `errno`.
    ///
    int connect(const OwnFd& socket_fd) const;

private:
    static ParseResult::Var fromUnixName(const std::string& name, const bool is_abstract);
    static ParseResult::Var fromInetHost(const std::string& host, const std::uint16_t port, const bool is_ipv6);
    static ParseResult::Var resolveHostName(const std::string& host, const std::uint16_t port);

    void setInetPort(const std::uint16_t port);

    sockaddr& asGenericAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr&>(addr_storage_);
    }
    const sockaddr& asGenericAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr&>(addr_storage_);
    }
    sockaddr_un& asUnixAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_un&>(addr_storage_);
    }
    sockaddr_in& asInetAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in&>(addr_storage_);
    }
    sockaddr_in6& asInet6Addr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in6&>(addr_storage_);
    }

    socklen_t        addr_len_;
    sockaddr_storage addr_storage_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
