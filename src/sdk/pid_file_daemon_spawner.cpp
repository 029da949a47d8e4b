//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <devctl/sdk/daemon_spawner.hpp>

#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "logging.hpp"

#include <devctl/platform/posix_utils.hpp>
#include <devctl/sdk/execution.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <functional>
#include <memory>
#include <poll.h>
#include <signal.h>  // NOLINT
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace devctl
{
namespace sdk
{
namespace
{

/// Entry of the pid file - one line "<pid> <port>" per spawned daemon.
///
struct PidEntry final
{
    pid_t         pid;
    std::uint16_t port;
};

std::vector<PidEntry> readPidFile(const std::string& pid_file_path)
{
    std::vector<PidEntry> entries;

    std::ifstream file{pid_file_path};
    long          pid  = 0;
    unsigned      port = 0;
    while (file >> pid >> port)
    {
        entries.push_back({static_cast<pid_t>(pid), static_cast<std::uint16_t>(port)});
    }
    return entries;
}

int writePidFile(const std::string& pid_file_path, const std::vector<PidEntry>& entries)
{
    const auto slash_pos = pid_file_path.rfind('/');
    if ((slash_pos != std::string::npos) && (slash_pos > 0))
    {
        const auto dir_path = pid_file_path.substr(0, slash_pos);
        if (const auto err = platform::posixSyscallError([&dir_path] {
                //
                return ::mkdir(dir_path.c_str(), 0755);  // NOLINT(*-magic-numbers)
            }))
        {
            if (err != EEXIST)
            {
                return err;
            }
        }
    }

    std::ofstream file{pid_file_path, std::ios_base::out | std::ios_base::trunc};
    for (const auto& entry : entries)
    {
        file << entry.pid << ' ' << entry.port << '\n';
    }
    file.flush();
    return file ? 0 : EIO;
}

class PidFileDaemonSpawner final : public DaemonSpawner
{
public:
    PidFileDaemonSpawner(libcyphal::IExecutor& executor, Params&& params)
        : executor_{executor}
        , params_{std::move(params)}
    {
    }

    // DaemonSpawner

    SenderOf<Start::Result>::Ptr startIfNeeded(const bool force_restart) override
    {
        return std::make_unique<StartSender>(executor_, params_, force_restart);
    }

private:
    /// Single start operation: optional termination of the running daemon, spawn, and readiness probing.
    ///
    class StartSender final : public SenderOf<Start::Result>
    {
    public:
        StartSender(libcyphal::IExecutor& executor, const Params& params, const bool force_restart)
            : executor_{executor}
            , params_{params}
            , force_restart_{force_restart}
            , logger_{common::getLogger("sdk")}
            , phase_{Phase::Idle}
            , attempts_left_{params.readiness_attempts}
            , terminating_pid_{0}
            , spawned_pid_{0}
        {
        }

        StartSender(const StartSender&)                = delete;
        StartSender(StartSender&&) noexcept            = delete;
        StartSender& operator=(const StartSender&)     = delete;
        StartSender& operator=(StartSender&&) noexcept = delete;

        ~StartSender() override
        {
            if ((phase_ != Phase::Idle) && (phase_ != Phase::Done))
            {
                logger_->debug("Daemon start is canceled (pid={}).", spawned_pid_);
            }
        }

    protected:
        void submitImpl(std::function<void(Start::Result&&)>&& receiver) override
        {
            receiver_ = std::move(receiver);

            auto       entries = readPidFile(params_.pid_file_path);
            const auto running = findRunning(entries);
            if (running && !force_restart_)
            {
                logger_->debug("Daemon is already running (pid={}, port={}).", running->pid, running->port);
                finish(cetl::monostate{});
                return;
            }
            if (running)
            {
                logger_->info("Terminating running daemon (pid={}, port={})...", running->pid, running->port);
                if (const auto err = platform::posixSyscallError([pid = running->pid] {
                        //
                        return ::kill(pid, SIGTERM);
                    }))
                {
                    logger_->warn("Failed to terminate daemon (pid={}): {}.", running->pid, std::strerror(err));
                }
                terminating_pid_ = running->pid;
                phase_           = Phase::Terminating;
                startProbing();
                return;
            }

            if (!force_restart_ && (tryConnect() == 0))
            {
                // Not spawned by us, but something already serves the port.
                logger_->debug("Daemon port is already served (host='{}', port={}).", params_.host, params_.port);
                finish(cetl::monostate{});
                return;
            }

            spawnAndAwaitReady();
        }

    private:
        enum class Phase : std::uint8_t
        {
            Idle,
            Terminating,
            Spawned,
            Done,
        };

        cetl::optional<PidEntry> findRunning(const std::vector<PidEntry>& entries) const
        {
            for (const auto& entry : entries)
            {
                if ((entry.port == params_.port) && platform::isProcessAlive(entry.pid))
                {
                    return entry;
                }
            }
            return cetl::nullopt;
        }

        void spawnAndAwaitReady()
        {
            if (const auto err = spawn())
            {
                finish(err);
                return;
            }
            phase_ = Phase::Spawned;

            // Dead entries are dropped on the way.
            std::vector<PidEntry> entries;
            for (const auto& entry : readPidFile(params_.pid_file_path))
            {
                if ((entry.pid != terminating_pid_) && platform::isProcessAlive(entry.pid))
                {
                    entries.push_back(entry);
                }
            }
            entries.push_back({spawned_pid_, params_.port});
            if (const auto err = writePidFile(params_.pid_file_path, entries))
            {
                logger_->warn("Failed to record daemon pid in '{}': {}.", params_.pid_file_path, std::strerror(err));
            }

            startProbing();
        }

        int spawn()
        {
            const auto port_str = std::to_string(params_.port);
            logger_->info("Spawning daemon '{}' (port={})...", params_.daemon_exe, port_str);

            const pid_t pid = ::fork();
            if (pid < 0)
            {
                const int err = errno;
                logger_->error("Failed to fork daemon process: {}.", std::strerror(err));
                return err;
            }
            if (pid == 0)
            {
                // Child: detach from the terminal session, and become the daemon.
                (void) ::setsid();
                if (params_.host == "localhost")
                {
                    ::execlp(params_.daemon_exe.c_str(),
                             params_.daemon_exe.c_str(),
                             "--port",
                             port_str.c_str(),
                             static_cast<char*>(nullptr));
                }
                else
                {
                    ::execlp(params_.daemon_exe.c_str(),
                             params_.daemon_exe.c_str(),
                             "--host",
                             params_.host.c_str(),
                             "--port",
                             port_str.c_str(),
                             static_cast<char*>(nullptr));
                }
                ::_exit(127);  // NOLINT(*-magic-numbers)
            }

            spawned_pid_ = pid;
            logger_->debug("Spawned daemon (pid={}).", pid);
            return 0;
        }

        void startProbing()
        {
            // Already registered when probing continues from the termination phase.
            if (!readiness_callback_)
            {
                readiness_callback_ = executor_.registerCallback([this](const auto&) {
                    //
                    onReadinessCheckTime();
                });
            }
            scheduleReadinessCheck();
        }

        void scheduleReadinessCheck()
        {
            using Schedule = libcyphal::IExecutor::Callback::Schedule;

            readiness_callback_.schedule(Schedule::Once{executor_.now() + params_.readiness_interval});
        }

        void onReadinessCheckTime()
        {
            if (attempts_left_ == 0)
            {
                logger_->warn("Daemon did not become ready (attempts={}).", params_.readiness_attempts);
                finish(ETIMEDOUT);
                return;
            }
            --attempts_left_;

            if (phase_ == Phase::Terminating)
            {
                if (platform::isProcessAlive(terminating_pid_))
                {
                    scheduleReadinessCheck();
                    return;
                }
                logger_->debug("Daemon is terminated (pid={}).", terminating_pid_);
                spawnAndAwaitReady();
                return;
            }

            // The child is reaped here only if it has already exited (f.e. failed to exec).
            int        status = 0;
            const auto waited = ::waitpid(spawned_pid_, &status, WNOHANG);
            if (waited == spawned_pid_)
            {
                logger_->error("Daemon exited prematurely (pid={}, status={}).", spawned_pid_, status);
                finish(ECHILD);
                return;
            }

            const auto err = tryConnect();
            if (err == 0)
            {
                logger_->debug("Daemon is ready (pid={}).", spawned_pid_);
                finish(cetl::monostate{});
                return;
            }
            logger_->trace("Daemon is not ready yet (pid={}): {}.", spawned_pid_, std::strerror(err));
            scheduleReadinessCheck();
        }

        /// Checks whether the daemon port accepts connections.
        ///
        /// @return Zero if connected, otherwise `errno`-like error code.
        ///
        int tryConnect() const
        {
            using ParseResult  = common::io::SocketAddress::ParseResult;
            using SocketResult = common::io::SocketAddress::SocketResult;

            const auto connection = common::io::SocketAddress::makeConnectionString(params_.host, params_.port);
            const auto maybe_address = common::io::SocketAddress::parse(connection, params_.port);
            if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_address))
            {
                return *err;
            }
            const auto& address = cetl::get<ParseResult::Success>(maybe_address);

            auto maybe_socket = address.socket(SOCK_STREAM);
            if (const auto* const err = cetl::get_if<SocketResult::Failure>(&maybe_socket))
            {
                return *err;
            }
            const auto socket_fd = cetl::get<SocketResult::Success>(std::move(maybe_socket));
            if (const auto err = address.connect(socket_fd))
            {
                return err;
            }

            // Connection might be still in progress (non-blocking socket), so wait for its outcome a bit.
            pollfd     poll_fd{socket_fd.get(), POLLOUT, 0};
            const auto timeout_ms = static_cast<int>(params_.readiness_interval.count());
            if (const auto err = platform::posixSyscallError([&poll_fd, timeout_ms] {
                    //
                    return ::poll(&poll_fd, 1, timeout_ms);
                }))
            {
                return err;
            }
            if ((poll_fd.revents & POLLOUT) == 0)
            {
                return EINPROGRESS;
            }

            int       so_error = 0;
            socklen_t len      = sizeof(so_error);
            if (const auto err = platform::posixSyscallError([&socket_fd, &so_error, &len] {
                    //
                    return ::getsockopt(socket_fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
                }))
            {
                return err;
            }
            return so_error;
        }

        void finish(Start::Result&& result)
        {
            phase_ = Phase::Done;

            // The receiver is free to destroy this sender.
            auto receiver = std::move(receiver_);
            receiver(std::move(result));
        }

        libcyphal::IExecutor&                  executor_;
        const Params                           params_;
        const bool                             force_restart_;
        common::LoggerPtr                      logger_;
        Phase                                  phase_;
        std::size_t                            attempts_left_;
        pid_t                                  terminating_pid_;
        pid_t                                  spawned_pid_;
        libcyphal::IExecutor::Callback::Any    readiness_callback_;
        std::function<void(Start::Result&&)> receiver_;

    };  // StartSender

    libcyphal::IExecutor& executor_;
    const Params          params_;

};  // PidFileDaemonSpawner

}  // namespace

DaemonSpawner::Params DaemonSpawner::Params::fromEnvironment(std::string host, const std::uint16_t port)
{
    Params params;
    params.host = std::move(host);
    params.port = port;

    const char* const daemon_exe = std::getenv("DEVCTL_DAEMON_EXE");
    params.daemon_exe            = (daemon_exe != nullptr) ? daemon_exe : "devctl-daemon";

    const char* const pid_file_path = std::getenv("DEVCTL_PID_FILE");
    params.pid_file_path            = (pid_file_path != nullptr) ? pid_file_path : "/tmp/devctl/daemon.pid";

    return params;
}

CETL_NODISCARD DaemonSpawner::Ptr DaemonSpawner::make(libcyphal::IExecutor& executor, Params params)
{
    return std::make_shared<PidFileDaemonSpawner>(executor, std::move(params));
}

int DaemonSpawner::killAll(const std::string& pid_file_path)
{
    auto logger = common::getLogger("sdk");

    for (const auto& entry : readPidFile(pid_file_path))
    {
        if (!platform::isProcessAlive(entry.pid))
        {
            continue;
        }
        logger->info("Terminating daemon (pid={}, port={})...", entry.pid, entry.port);
        if (const auto err = platform::posixSyscallError([pid = entry.pid] {
                //
                return ::kill(pid, SIGTERM);
            }))
        {
            logger->warn("Failed to terminate daemon (pid={}): {}.", entry.pid, std::strerror(err));
        }
    }

    if (const auto err = platform::posixSyscallError([&pid_file_path] {
            //
            return ::unlink(pid_file_path.c_str());
        }))
    {
        if (err != ENOENT)
        {
            logger->error("Failed to remove pid file '{}': {}.", pid_file_path, std::strerror(err));
            return err;
        }
    }
    return 0;
}

}  // namespace sdk
}  // namespace devctl
