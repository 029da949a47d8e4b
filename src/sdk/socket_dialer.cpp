//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "connection_manager.hpp"

#include "io/socket_address.hpp"
#include "ipc/client_router.hpp"
#include "ipc/pipe/client_pipe.hpp"
#include "ipc/pipe/socket_client.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{
namespace
{

class SocketDialer final : public Dialer
{
public:
    SocketDialer(cetl::pmr::memory_resource& memory, libcyphal::IExecutor& executor)
        : memory_{memory}
        , executor_{executor}
        , logger_{common::getLogger("sdk")}
    {
    }

    // Dialer

    Dial::Result dial(const std::string& host, const std::uint16_t port) override
    {
        using ParseResult = common::io::SocketAddress::ParseResult;

        const auto connection = common::io::SocketAddress::makeConnectionString(host, port);
        logger_->debug("Dialing IPC connection '{}'...", connection);

        auto maybe_socket_address = common::io::SocketAddress::parse(connection, port);
        if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
        {
            logger_->error("Failed to parse IPC connection string ('{}'): {}.", connection, std::strerror(*err));
            return *err;
        }
        const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);

        auto client_pipe = std::make_unique<common::ipc::pipe::SocketClient>(executor_, socket_address);
        auto ipc_router  = common::ipc::ClientRouter::make(memory_, std::move(client_pipe));
        if (const int err = ipc_router->start())
        {
            logger_->warn("Failed to start IPC router ('{}'): {}.", connection, std::strerror(err));
            return err;
        }

        logger_->debug("Started IPC connection '{}'.", connection);
        return ipc_router;
    }

private:
    cetl::pmr::memory_resource& memory_;
    libcyphal::IExecutor&       executor_;
    common::LoggerPtr           logger_;

};  // SocketDialer

}  // namespace

CETL_NODISCARD Dialer::Ptr Dialer::make(cetl::pmr::memory_resource& memory, libcyphal::IExecutor& executor)
{
    return std::make_shared<SocketDialer>(memory, executor);
}

}  // namespace sdk
}  // namespace devctl
