//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_CONNECTION_MANAGER_HPP_INCLUDED
#define DEVCTL_SDK_CONNECTION_MANAGER_HPP_INCLUDED

#include "ipc/client_router.hpp"

#include <devctl/sdk/daemon_spawner.hpp>
#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>
#include <devctl/sdk/peer_resolver.hpp>
#include <devctl/sdk/types.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace devctl
{
namespace sdk
{

/// Opens started IPC routes to peers.
///
class Dialer
{
public:
    using Ptr = std::shared_ptr<Dialer>;

    /// Makes dialer of socket based routes (see `common::io::SocketAddress` for the supported addresses).
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory, libcyphal::IExecutor& executor);

    Dialer(Dialer&&)                 = delete;
    Dialer(const Dialer&)            = delete;
    Dialer& operator=(Dialer&&)      = delete;
    Dialer& operator=(const Dialer&) = delete;

    virtual ~Dialer() = default;

    struct Dial final
    {
        using Success = common::ipc::ClientRouter::Ptr;
        using Failure = int;  // `errno`-like error code
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual Dial::Result dial(const std::string& host, const std::uint16_t port) = 0;

protected:
    Dialer() = default;

};  // Dialer

/// Connection to the daemon, together with the per request metadata of daemon routed calls.
///
struct DaemonConnection final
{
    common::ipc::ClientRouter::Ptr router;
    cetl::optional<std::string>    target_device_id;

};  // DaemonConnection

/// Direct connection to the resolved companion.
///
struct CompanionConnection final
{
    common::ipc::ClientRouter::Ptr router;
    PeerInfo                       peer;

};  // CompanionConnection

/// Owns connections to the daemon and to the companion.
///
/// The daemon connection is established lazily, on the first request. Concurrent requests share
/// one attempt (one spawn and one dial), and all of them receive its outcome. A successful outcome is
/// cached until explicit invalidation; a failed one is not cached, so the next request starts a new attempt.
///
class ConnectionManager
{
public:
    using Ptr = std::shared_ptr<ConnectionManager>;

    struct Params final
    {
        std::string                 host;
        std::uint16_t               port;
        cetl::optional<std::string> device_id;
        bool                        force_restart_daemon;
    };

    CETL_NODISCARD static Ptr make(const Params& params, DaemonSpawner::Ptr daemon_spawner, Dialer::Ptr dialer);

    ConnectionManager(ConnectionManager&&)                 = delete;
    ConnectionManager(const ConnectionManager&)            = delete;
    ConnectionManager& operator=(ConnectionManager&&)      = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    virtual ~ConnectionManager() = default;

    struct Provide final
    {
        using Success = DaemonConnection;
        using Failure = Error;  // `DaemonUnavailable` or `ConnectionError`
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Makes async sender of the daemon connection.
    ///
    /// Destroying the sender before its completion withdraws the request (but not the shared attempt).
    ///
    virtual SenderOf<Provide::Result>::Ptr provideDaemonConnection() = 0;

    /// Drops the cached daemon connection (if any).
    ///
    virtual void invalidateDaemonConnection() = 0;

    struct Companion final
    {
        using Success = CompanionConnection;
        using Failure = Error;  // `PeerNotFound` or `ConnectionError`
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Resolves and connects the companion. Supposed to be called once (at the facade creation).
    ///
    /// The outcome is stored (and logged), but not returned - see `companionConnection`.
    ///
    virtual void connectCompanion(PeerResolver& peer_resolver) = 0;

    virtual const Companion::Result& companionConnection() const = 0;

protected:
    ConnectionManager() = default;

};  // ConnectionManager

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_CONNECTION_MANAGER_HPP_INCLUDED
