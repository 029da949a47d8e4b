//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_address.hpp"

#include "io.hpp"
#include "logging.hpp"

#include "devctl/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <utility>

namespace devctl
{
namespace common
{
namespace io
{
namespace
{

constexpr const char* UnixPrefix         = "unix:";
constexpr const char* AbstractUnixPrefix = "unix-abstract:";

/// Host part of an inet connection string, with its port (if any).
///
struct HostAndPort
{
    std::string                   host;
    cetl::optional<std::uint16_t> port;
    bool                          is_ipv6;
};

cetl::optional<std::string> withoutPrefix(const std::string& str, const char* const prefix)
{
    const std::size_t prefix_len = std::strlen(prefix);
    if (str.compare(0, prefix_len, prefix) != 0)
    {
        return cetl::nullopt;
    }
    return str.substr(prefix_len);
}

/// Decimal port number, which has to fit 16 bits.
///
cetl::optional<std::uint16_t> parsePort(const std::string& str)
{
    if (str.empty() || (str.find_first_not_of("0123456789") != std::string::npos))
    {
        getLogger("io")->error("Invalid port number (port='{}').", str);
        return cetl::nullopt;
    }
    const auto number = std::strtoull(str.c_str(), nullptr, 10);
    if (number > std::numeric_limits<std::uint16_t>::max())
    {
        getLogger("io")->error("Port number is too large (port={}).", number);
        return cetl::nullopt;
    }
    return static_cast<std::uint16_t>(number);
}

/// Splits `host[:port]`, `[ipv6][:port]` or a bare IPv6 literal (two colons or more, no port).
///
cetl::optional<HostAndPort> splitHostAndPort(const std::string& str)
{
    HostAndPort result{{}, cetl::nullopt, false};
    std::string port_str;
    bool        has_port = false;

    if (!str.empty() && (str.front() == '['))
    {
        const auto closing = str.find(']');
        if (closing == std::string::npos)
        {
            getLogger("io")->error("Unclosed '[' in IPv6 address (addr='{}').", str);
            return cetl::nullopt;
        }
        result.host    = str.substr(1, closing - 1);
        result.is_ipv6 = true;

        const auto rest = str.substr(closing + 1);
        if (!rest.empty())
        {
            if (rest.front() != ':')
            {
                getLogger("io")->error("Only ':<port>' may follow IPv6 address (addr='{}').", str);
                return cetl::nullopt;
            }
            port_str = rest.substr(1);
            has_port = true;
        }
    }
    else
    {
        const auto colon = str.find(':');
        if ((colon != std::string::npos) && (str.find(':', colon + 1) == std::string::npos))
        {
            result.host = str.substr(0, colon);
            port_str    = str.substr(colon + 1);
            has_port    = true;
        }
        else
        {
            result.host    = str;
            result.is_ipv6 = colon != std::string::npos;
        }
    }

    if (result.host.empty())
    {
        getLogger("io")->error("Empty host (addr='{}').", str);
        return cetl::nullopt;
    }
    if (has_port)
    {
        result.port = parsePort(port_str);
        if (!result.port)
        {
            return cetl::nullopt;
        }
    }
    return result;
}

}  // namespace

SocketAddress::SocketAddress() noexcept
    : addr_len_{0}
    , addr_storage_{}
{
}

std::pair<const sockaddr*, socklen_t> SocketAddress::getRaw() const noexcept
{
    return {&asGenericAddr(), addr_len_};
}

std::string SocketAddress::makeConnectionString(const std::string& host, const std::uint16_t port)
{
    if (withoutPrefix(host, UnixPrefix) || withoutPrefix(host, AbstractUnixPrefix))
    {
        return host;
    }
    const bool is_ipv6 = host.find(':') != std::string::npos;
    return (is_ipv6 ? "[" + host + "]" : host) + ":" + std::to_string(port);
}

SocketAddress::ParseResult::Var SocketAddress::parse(const std::string& str, const std::uint16_t port_hint)
{
    if (const auto name = withoutPrefix(str, AbstractUnixPrefix))
    {
        return fromUnixName(*name, true);
    }
    if (const auto path = withoutPrefix(str, UnixPrefix))
    {
        return fromUnixName(*path, false);
    }

    const auto host_and_port = splitHostAndPort(str);
    if (!host_and_port)
    {
        return EINVAL;
    }
    const std::uint16_t port = host_and_port->port.value_or(port_hint);
    return fromInetHost(host_and_port->host, port, host_and_port->is_ipv6);
}

SocketAddress::ParseResult::Var SocketAddress::fromUnixName(const std::string& name, const bool is_abstract)
{
    SocketAddress result{};
    auto&         addr_un = result.asUnixAddr();
    addr_un.sun_family    = AF_UNIX;

    // An abstract name follows the leading zero byte; a path is followed by the terminating one.
    const std::size_t offset = is_abstract ? 1 : 0;
    if ((offset + name.size() + 1) > sizeof(addr_un.sun_path))
    {
        getLogger("io")->error("Unix domain name is too long (name='{}').", name);
        return EINVAL;
    }

    // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay, *-pointer-arithmetic)
    std::memcpy(addr_un.sun_path + offset, name.c_str(), name.size() + 1);

    result.addr_len_ = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + offset + name.size() + 1);
    return result;
}

SocketAddress::ParseResult::Var SocketAddress::fromInetHost(const std::string&  host,
                                                            const std::uint16_t port,
                                                            const bool          is_ipv6)
{
    SocketAddress result{};
    int           converted = 0;
    if (is_ipv6)
    {
        auto& addr_in6       = result.asInet6Addr();
        addr_in6.sin6_family = AF_INET6;
        converted            = ::inet_pton(AF_INET6, host.c_str(), &addr_in6.sin6_addr);
        result.addr_len_     = sizeof(addr_in6);
    }
    else
    {
        auto& addr_in      = result.asInetAddr();
        addr_in.sin_family = AF_INET;
        converted          = ::inet_pton(AF_INET, host.c_str(), &addr_in.sin_addr);
        result.addr_len_   = sizeof(addr_in);
    }

    if (converted == 1)
    {
        result.setInetPort(port);
        return result;
    }
    if (converted < 0)
    {
        const int err = errno;
        getLogger("io")->error("Failed to parse address (addr='{}'): {}", host, std::strerror(err));
        return err;
    }
    if (is_ipv6)
    {
        getLogger("io")->error("Unsupported IPv6 address (addr='{}').", host);
        return EINVAL;
    }
    // Not a numeric IPv4 address, so it has to be a host name.
    return resolveHostName(host, port);
}

SocketAddress::ParseResult::Var SocketAddress::resolveHostName(const std::string& host, const std::uint16_t port)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* infos   = nullptr;
    const int gai_err = ::getaddrinfo(host.c_str(), nullptr, &hints, &infos);
    if (gai_err != 0)
    {
        getLogger("io")->error("Failed to resolve host name (host='{}'): {}.", host, ::gai_strerror(gai_err));
        return EHOSTUNREACH;
    }

    SocketAddress result{};
    for (const addrinfo* info = infos; info != nullptr; info = info->ai_next)
    {
        const bool is_inet = (info->ai_family == AF_INET) || (info->ai_family == AF_INET6);
        if (is_inet && (info->ai_addrlen <= sizeof(result.addr_storage_)))
        {
            std::memcpy(&result.addr_storage_, info->ai_addr, info->ai_addrlen);
            result.addr_len_ = info->ai_addrlen;
            result.setInetPort(port);
            break;
        }
    }
    ::freeaddrinfo(infos);

    if (result.addr_len_ == 0)
    {
        getLogger("io")->error("No inet address found for host (host='{}').", host);
        return EHOSTUNREACH;
    }
    return result;
}

void SocketAddress::setInetPort(const std::uint16_t port)
{
    if (asGenericAddr().sa_family == AF_INET6)
    {
        asInet6Addr().sin6_port = htons(port);
    }
    else
    {
        asInetAddr().sin_port = htons(port);
    }
}

SocketAddress::SocketResult::Var SocketAddress::socket(const int type) const
{
    int flags = 0;
#if __linux__
    flags = SOCK_NONBLOCK | SOCK_CLOEXEC;
#endif

    OwnFd      socket_fd;
    const auto family = asGenericAddr().sa_family;
    if (const auto err = platform::posixSyscallError([family, type, flags, &socket_fd] {
            //
            const int fd = ::socket(family, type | flags, 0);
            if (fd >= 0)
            {
                socket_fd = OwnFd{fd};
            }
            return fd;
        }))
    {
        getLogger("io")->error("Failed to create socket: {}.", std::strerror(err));
        return err;
    }

    if ((type == SOCK_STREAM) && isAnyInet())
    {
        // Nagle's algorithm stays on.
        constexpr int no_delay = 0;
        if (const auto err = platform::posixSyscallError([&socket_fd, &no_delay] {
                //
                return ::setsockopt(socket_fd.get(), IPPROTO_TCP, TCP_NODELAY, &no_delay, sizeof(no_delay));
            }))
        {
            getLogger("io")->warn("Failed to set TCP_NODELAY={} (fd={}): {}.",
                                  no_delay,
                                  socket_fd.get(),
                                  std::strerror(err));
        }
    }

    return socket_fd;
}

int SocketAddress::connect(const OwnFd& socket_fd) const
{
    CETL_DEBUG_ASSERT(socket_fd.get() >= 0, "");

    const auto err = platform::posixSyscallError([this, &socket_fd] {
        //
        return ::connect(socket_fd.get(), &asGenericAddr(), addr_len_);
    });
    if ((err == 0) || (err == EINPROGRESS))
    {
        return 0;
    }
    getLogger("io")->debug("Failed to connect (fd={}): {}.", socket_fd.get(), std::strerror(err));
    return err;
}

}  // namespace io
}  // namespace common
}  // namespace devctl
