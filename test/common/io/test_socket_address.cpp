//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io/socket_address.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>

namespace
{

using namespace devctl::common::io;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSocketAddress : public testing::Test
{
protected:
    using ParseResult = SocketAddress::ParseResult;

    /// Family and port of an endpoint, as they land in the raw socket address.
    ///
    struct Endpoint
    {
        int           family;
        std::uint16_t port;
    };

    static Endpoint endpointOf(const SocketAddress& socket_address)
    {
        const auto  raw  = socket_address.getRaw();
        const auto* addr = raw.first;
        if (addr->sa_family == AF_INET6)
        {
            return {AF_INET6, ntohs(reinterpret_cast<const sockaddr_in6*>(addr)->sin6_port)};  // NOLINT
        }
        if (addr->sa_family == AF_INET)
        {
            return {AF_INET, ntohs(reinterpret_cast<const sockaddr_in*>(addr)->sin_port)};  // NOLINT
        }
        return {addr->sa_family, 0};
    }
};

// MARK: - Tests:

TEST_F(TestSocketAddress, companion_endpoints)
{
    // Companion registries carry bare hosts, so the port always comes from the registry entry.
    {
        auto maybe_address = SocketAddress::parse(SocketAddress::makeConnectionString("192.168.1.20", 10882), 0);
        ASSERT_THAT(maybe_address, VariantWith<ParseResult::Success>(_));
        const auto& address = cetl::get<ParseResult::Success>(maybe_address);
        EXPECT_TRUE(address.isAnyInet());
        EXPECT_FALSE(address.isUnix());

        const auto endpoint = endpointOf(address);
        EXPECT_THAT(endpoint.family, AF_INET);
        EXPECT_THAT(endpoint.port, 10882);

        const auto* const addr_in = reinterpret_cast<const sockaddr_in*>(address.getRaw().first);  // NOLINT
        EXPECT_THAT(ntohl(addr_in->sin_addr.s_addr), 0xC0A80114);
    }
    {
        auto maybe_address = SocketAddress::parse(SocketAddress::makeConnectionString("fe80::1", 10883), 0);
        ASSERT_THAT(maybe_address, VariantWith<ParseResult::Success>(_));
        const auto endpoint = endpointOf(cetl::get<ParseResult::Success>(maybe_address));
        EXPECT_THAT(endpoint.family, AF_INET6);
        EXPECT_THAT(endpoint.port, 10883);
    }
}

TEST_F(TestSocketAddress, daemon_endpoint)
{
    auto maybe_address = SocketAddress::parse("localhost", 10880);
    ASSERT_THAT(maybe_address, VariantWith<ParseResult::Success>(_));
    const auto& address = cetl::get<ParseResult::Success>(maybe_address);
    EXPECT_TRUE(address.isAnyInet());
    EXPECT_THAT(endpointOf(address).port, 10880);

    // Explicit port wins over the hint.
    auto maybe_explicit = SocketAddress::parse("127.0.0.1:10990", 10880);
    ASSERT_THAT(maybe_explicit, VariantWith<ParseResult::Success>(_));
    EXPECT_THAT(endpointOf(cetl::get<ParseResult::Success>(maybe_explicit)).port, 10990);
}

TEST_F(TestSocketAddress, unix_domain_endpoints)
{
    {
        auto maybe_address = SocketAddress::parse("unix:/tmp/devctl/daemon.sock", 10880);
        ASSERT_THAT(maybe_address, VariantWith<ParseResult::Success>(_));
        const auto& address = cetl::get<ParseResult::Success>(maybe_address);
        EXPECT_TRUE(address.isUnix());
        EXPECT_FALSE(address.isAnyInet());

        const auto* const addr_un = reinterpret_cast<const sockaddr_un*>(address.getRaw().first);  // NOLINT
        EXPECT_THAT(addr_un->sun_family, AF_UNIX);
        EXPECT_THAT(addr_un->sun_path, "/tmp/devctl/daemon.sock");
    }
    {
        auto maybe_address = SocketAddress::parse("unix-abstract:devctl.daemon", 0);
        ASSERT_THAT(maybe_address, VariantWith<ParseResult::Success>(_));
        const auto* const addr_un =
            reinterpret_cast<const sockaddr_un*>(cetl::get<ParseResult::Success>(maybe_address).getRaw().first);  // NOLINT
        EXPECT_THAT(addr_un->sun_path[0], '\0');
        EXPECT_THAT(addr_un->sun_path + 1, "devctl.daemon");  // NOLINT
    }

    // Path has to fit `sun_path` together with its terminator.
    constexpr auto MaxPath = sizeof(sockaddr_un::sun_path);
    EXPECT_THAT(SocketAddress::parse("unix:" + std::string(MaxPath - 1, 'x'), 0),
                VariantWith<ParseResult::Success>(_));
    EXPECT_THAT(SocketAddress::parse("unix:" + std::string(MaxPath, 'x'), 0), VariantWith<ParseResult::Failure>(EINVAL));
}

TEST_F(TestSocketAddress, malformed_endpoints)
{
    EXPECT_THAT(SocketAddress::parse(":10880", 0), VariantWith<ParseResult::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:devctl", 0), VariantWith<ParseResult::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:70000", 0), VariantWith<ParseResult::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1", 0), VariantWith<ParseResult::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]10880", 0), VariantWith<ParseResult::Failure>(EINVAL));
}

TEST_F(TestSocketAddress, makeConnectionString)
{
    EXPECT_THAT(SocketAddress::makeConnectionString("localhost", 10880), "localhost:10880");
    EXPECT_THAT(SocketAddress::makeConnectionString("10.0.0.7", 10883), "10.0.0.7:10883");
    EXPECT_THAT(SocketAddress::makeConnectionString("::1", 10880), "[::1]:10880");

    // Unix domain addresses have no port.
    EXPECT_THAT(SocketAddress::makeConnectionString("unix:/tmp/devctl/daemon.sock", 10880),
                "unix:/tmp/devctl/daemon.sock");
    EXPECT_THAT(SocketAddress::makeConnectionString("unix-abstract:devctl", 10880), "unix-abstract:devctl");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
