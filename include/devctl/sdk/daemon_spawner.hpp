//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_DAEMON_SPAWNER_HPP_INCLUDED
#define DEVCTL_SDK_DAEMON_SPAWNER_HPP_INCLUDED

#include "execution.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace devctl
{
namespace sdk
{

/// Ensures that the background daemon process is running.
///
class DaemonSpawner
{
public:
    using Ptr = std::shared_ptr<DaemonSpawner>;

    struct Params final
    {
        /// Executable of the daemon. Started with `--port <port>` (and `--host <host>` if not default) args.
        std::string daemon_exe;

        /// File where pids (and ports) of the spawned daemons are recorded.
        std::string pid_file_path;

        std::string   host;
        std::uint16_t port;

        /// A freshly spawned daemon is checked (by connecting to it) until it accepts connections.
        std::chrono::milliseconds readiness_interval{50};
        std::size_t               readiness_attempts{100};

        /// Makes parameters out of `DEVCTL_DAEMON_EXE` and `DEVCTL_PID_FILE` env vars
        /// (`devctl-daemon` and `/tmp/devctl/daemon.pid` by default).
        ///
        static Params fromEnvironment(std::string host, const std::uint16_t port);
    };

    /// Makes spawner which tracks spawned daemons in a pid file.
    ///
    /// @param executor Used to schedule readiness checks. Must outlive the spawner.
    ///
    CETL_NODISCARD static Ptr make(libcyphal::IExecutor& executor, Params params);

    /// Terminates (with SIGTERM) every still alive daemon recorded in the pid file, and removes the file.
    ///
    /// @return Zero on success, otherwise `errno`-like error code of the pid file removal.
    ///
    static int killAll(const std::string& pid_file_path);

    // No copy/move semantics.
    DaemonSpawner(DaemonSpawner&&)                 = delete;
    DaemonSpawner(const DaemonSpawner&)            = delete;
    DaemonSpawner& operator=(DaemonSpawner&&)      = delete;
    DaemonSpawner& operator=(const DaemonSpawner&) = delete;

    virtual ~DaemonSpawner() = default;

    struct Start final
    {
        using Success = cetl::monostate;  // like `void`
        using Failure = int;              // `errno`-like error code
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Makes async sender which starts the daemon if it's not running yet.
    ///
    /// @param force_restart If `true`, an already running daemon is terminated, and a new one is spawned.
    ///
    virtual SenderOf<Start::Result>::Ptr startIfNeeded(const bool force_restart) = 0;

protected:
    DaemonSpawner() = default;

};  // DaemonSpawner

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_DAEMON_SPAWNER_HPP_INCLUDED
