//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_CLIENT_HPP_INCLUDED
#define DEVCTL_SDK_CLIENT_HPP_INCLUDED

#include "archive_generator.hpp"
#include "daemon_spawner.hpp"
#include "errors.hpp"
#include "execution.hpp"
#include "peer_resolver.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace devctl
{
namespace sdk
{

/// Client facade of the device control service.
///
/// Operations are routed either to the background daemon (which is spawned and connected lazily,
/// on the first such operation), or directly to the companion of the target device
/// (which is resolved and connected once, at the facade creation).
/// Every operation reports its failure as `Error` tagged with the operation name.
///
class Client
{
public:
    using Ptr = std::shared_ptr<Client>;

    static constexpr std::uint16_t DefaultPort = 9876;

    struct Params final
    {
        /// Address of the daemon. Could be also `unix:<path>` (then `port` is not used).
        std::string   host{"localhost"};
        std::uint16_t port{DefaultPort};

        /// Target device identifier. If empty, the one and only known companion is used.
        cetl::optional<std::string> device_id;

        /// Logger for the call boundary events. If `nullptr`, the "sdk" logger is used.
        std::shared_ptr<spdlog::logger> logger;

        /// Terminate an already running daemon, and spawn a new one (on the first daemon operation).
        bool force_restart_daemon{false};
    };

    /// Replaceable collaborators of the facade. Empty ones are substituted with the default implementations.
    ///
    struct Collaborators final
    {
        PeerResolver::Ptr     peer_resolver;
        DaemonSpawner::Ptr    daemon_spawner;
        ArchiveGenerator::Ptr archive_generator;
    };

    /// Creates a new instance of the facade.
    ///
    /// Failure to resolve (or connect) the companion does not fail the creation - it is logged,
    /// and then reported by every direct companion operation. Daemon operations stay usable.
    ///
    /// @param memory The memory resource to use for the IPC (de)serialization. Must outlive the facade.
    /// @param executor The executor to use for IPC. Must outlive the facade.
    ///                 Should support `IPosixExecutorExtension` interface (via `cetl::rtti`).
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory,
                                   libcyphal::IExecutor&       executor,
                                   const Params&               params,
                                   Collaborators               collaborators = {});

    /// Terminates all daemons ever spawned (and recorded in the default pid file).
    ///
    /// @return Zero on success, otherwise `errno`-like error code.
    ///
    static int killAllKnownDaemons();

    // No copy/move semantics.
    Client(Client&&)                 = delete;
    Client(const Client&)            = delete;
    Client& operator=(Client&&)      = delete;
    Client& operator=(const Client&) = delete;

    virtual ~Client() = default;

    /// Gets the resolved companion peer (if any).
    ///
    virtual const cetl::optional<PeerInfo>& companionInfo() const = 0;

    /// Gets names of the daemon routed operations, in the order of their registration.
    ///
    virtual std::vector<std::string> daemonCallNames() const = 0;

    /// Drops the cached daemon connection, so that the next daemon operation connects again.
    ///
    virtual void invalidateDaemonConnection() = 0;

    // MARK: Direct companion operations.

    struct ListApps final
    {
        using Success = std::vector<InstalledApp>;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Lists installed applications, in the order reported by the companion.
    ///
    virtual SenderOf<ListApps::Result>::Ptr listApps() = 0;

    struct GetAccessibilityInfo final
    {
        using Success = AccessibilityInfo;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Describes accessibility elements of the whole screen, or of the element at the given point.
    ///
    virtual SenderOf<GetAccessibilityInfo::Result>::Ptr accessibilityInfo(const cetl::optional<Point>& point) = 0;

    struct AddMedia final
    {
        using Success = cetl::monostate;  // like `void`
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Uploads media files to the device.
    ///
    /// A local companion gets the paths themselves; a remote one gets an archive of the files.
    /// Destroying the sender before its completion aborts the upload.
    ///
    virtual SenderOf<AddMedia::Result>::Ptr addMedia(const std::vector<std::string>& paths) = 0;

    struct Approve final
    {
        using Success = cetl::monostate;  // like `void`
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Grants permissions to an application.
    ///
    /// @param permissions Names of the permissions: `photos`, `camera` or `contacts`.
    ///                    Any other name fails the operation with `UnknownCapability`.
    ///
    virtual SenderOf<Approve::Result>::Ptr approve(const std::string&           bundle_id,
                                                   const std::set<std::string>& permissions) = 0;

    // MARK: Daemon operations.

    struct Describe final
    {
        using Success = TargetDescription;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual SenderOf<Describe::Result>::Ptr describe() = 0;

    struct ListTargets final
    {
        using Success = std::vector<TargetDescription>;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual SenderOf<ListTargets::Result>::Ptr listTargets() = 0;

    struct Terminate final
    {
        using Success = cetl::monostate;  // like `void`
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Terminates a running application on the target device.
    ///
    virtual SenderOf<Terminate::Result>::Ptr terminate(const std::string& bundle_id) = 0;

protected:
    Client() = default;

};  // Client

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_CLIENT_HPP_INCLUDED
