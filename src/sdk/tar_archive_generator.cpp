//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <devctl/sdk/archive_generator.hpp>

#include "io/io.hpp"
#include "logging.hpp"

#include <devctl/platform/posix_utils.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <signal.h>  // NOLINT
#include <string>
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

constexpr std::size_t ArchiveGenerator::MaxChunkSize;

namespace
{

std::pair<std::string, std::string> splitPath(const std::string& path)
{
    auto trimmed = path;
    while ((trimmed.size() > 1) && (trimmed.back() == '/'))
    {
        trimmed.pop_back();
    }
    const auto slash_pos = trimmed.rfind('/');
    if (slash_pos == std::string::npos)
    {
        return {".", trimmed};
    }
    return {(slash_pos == 0) ? "/" : trimmed.substr(0, slash_pos), trimmed.substr(slash_pos + 1)};
}

/// Temporary staging directory with one numbered subfolder per archived path.
///
/// Every subfolder contains a symlink to the original item, so `tar -h` archives the item itself.
///
class StagingDir final
{
public:
    StagingDir() = default;

    StagingDir(const StagingDir&)            = delete;
    StagingDir& operator=(const StagingDir&) = delete;
    StagingDir(StagingDir&&)                 = delete;
    StagingDir& operator=(StagingDir&&)      = delete;

    ~StagingDir()
    {
        for (const auto& link : links_)
        {
            (void) ::unlink(link.c_str());
        }
        for (auto it = subdirs_.rbegin(); it != subdirs_.rend(); ++it)
        {
            (void) ::rmdir(it->c_str());
        }
        if (!root_.empty())
        {
            (void) ::rmdir(root_.c_str());
        }
    }

    const std::string& root() const
    {
        return root_;
    }

    const std::vector<std::string>& entries() const
    {
        return entries_;
    }

    int stage(const std::vector<std::string>& paths)
    {
        std::string root_template{"/tmp/devctl-media-XXXXXX"};
        if (::mkdtemp(&root_template.front()) == nullptr)
        {
            return errno;
        }
        root_ = root_template;

        for (std::size_t index = 0; index < paths.size(); ++index)
        {
            char abs_path[PATH_MAX];
            if (::realpath(paths[index].c_str(), abs_path) == nullptr)
            {
                return errno;
            }

            const auto entry  = std::to_string(index);
            const auto subdir = root_ + "/" + entry;
            if (const auto err = platform::posixSyscallError([&subdir] {
                    //
                    return ::mkdir(subdir.c_str(), 0700);  // NOLINT(*-magic-numbers)
                }))
            {
                return err;
            }
            subdirs_.push_back(subdir);

            const auto link = subdir + "/" + splitPath(abs_path).second;
            if (const auto err = platform::posixSyscallError([target = &abs_path[0], &link] {
                    //
                    return ::symlink(target, link.c_str());
                }))
            {
                return err;
            }
            links_.push_back(link);
            entries_.push_back(entry);
        }
        return 0;
    }

private:
    std::string              root_;
    std::vector<std::string> subdirs_;
    std::vector<std::string> links_;
    std::vector<std::string> entries_;

};  // StagingDir

/// Streams stdout of a `tar -c` child process through a non-blocking pipe.
///
class TarChunkSource final : public ChunkSource
{
public:
    TarChunkSource()
        : logger_{common::getLogger("sdk")}
        , tar_pid_{0}
        , failure_{0}
        , exhausted_{false}
    {
    }

    TarChunkSource(const TarChunkSource&)            = delete;
    TarChunkSource& operator=(const TarChunkSource&) = delete;
    TarChunkSource(TarChunkSource&&)                 = delete;
    TarChunkSource& operator=(TarChunkSource&&)      = delete;

    ~TarChunkSource() override
    {
        tar_out_.reset();
        if (tar_pid_ > 0)
        {
            abort();
        }
    }

    void start(const std::vector<std::string>& paths, const bool place_in_subfolders)
    {
        std::vector<std::string> args{"tar", "-c", "-f", "-"};
        if (place_in_subfolders)
        {
            if (const auto err = staging_.stage(paths))
            {
                logger_->error("Failed to stage media for archiving: {}.", std::strerror(err));
                failure_ = err;
                return;
            }
            args.emplace_back("-h");
            args.emplace_back("-C");
            args.push_back(staging_.root());
            args.insert(args.end(), staging_.entries().begin(), staging_.entries().end());
        }
        else
        {
            for (const auto& path : paths)
            {
                auto dir_and_name = splitPath(path);
                args.emplace_back("-C");
                args.push_back(std::move(dir_and_name.first));
                args.push_back(std::move(dir_and_name.second));
            }
        }

        failure_ = spawn(args);
    }

    // ChunkSource

    Next::Result next() override
    {
        if (failure_ != 0)
        {
            exhausted_ = true;
            return std::exchange(failure_, 0);
        }
        if (exhausted_)
        {
            return Next::End{};
        }
        if (!tar_out_.valid())
        {
            return awaitExit();
        }

        Next::Chunk chunk(ArchiveGenerator::MaxChunkSize);
        std::size_t filled = 0;
        bool        is_eof = false;
        while ((filled < chunk.size()) && !is_eof)
        {
            ssize_t read_size = 0;
            if (const auto err = platform::posixSyscallError([this, &chunk, filled, &read_size] {
                    //
                    return read_size = ::read(tar_out_.get(), chunk.data() + filled, chunk.size() - filled);
                }))
            {
                if ((err == EAGAIN) || (err == EWOULDBLOCK))
                {
                    break;
                }
                logger_->error("Failed to read archive stream: {}.", std::strerror(err));
                exhausted_ = true;
                return err;
            }
            is_eof = (read_size == 0);
            filled += static_cast<std::size_t>(read_size);
        }

        if (is_eof)
        {
            // The archiver has closed its output, so it is about to exit.
            tar_out_.reset();
        }
        if (filled > 0)
        {
            chunk.resize(filled);
            return chunk;
        }
        if (!is_eof)
        {
            return Next::Pending{tar_out_.get()};
        }
        return awaitExit();
    }

private:
    int spawn(const std::vector<std::string>& args)
    {
        int pipe_fds[2]{-1, -1};
        if (const auto err = platform::posixSyscallError([&pipe_fds] {
                //
                return ::pipe2(pipe_fds, O_CLOEXEC);
            }))
        {
            logger_->error("Failed to create archive pipe: {}.", std::strerror(err));
            return err;
        }
        common::io::OwnFd read_end{pipe_fds[0]};
        common::io::OwnFd write_end{pipe_fds[1]};

        // Only our end is non-blocking - the archiver writes its stdout as usual.
        if (const auto err = platform::posixSyscallError([&read_end] {
                //
                return ::fcntl(read_end.get(), F_SETFL, O_NONBLOCK);
            }))
        {
            logger_->error("Failed to make archive pipe non-blocking: {}.", std::strerror(err));
            return err;
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
        }
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0)
        {
            const int err = errno;
            logger_->error("Failed to fork archiver: {}.", std::strerror(err));
            return err;
        }
        if (pid == 0)
        {
            (void) ::dup2(write_end.get(), STDOUT_FILENO);
            ::execvp(argv.front(), argv.data());
            ::_exit(127);  // NOLINT(*-magic-numbers)
        }

        logger_->debug("Started archiver (pid={}, items={}).", pid, args.size());
        tar_pid_ = pid;
        tar_out_ = std::move(read_end);
        return 0;
    }

    /// Checks (without waiting) whether the archiver has exited, and how.
    ///
    Next::Result awaitExit()
    {
        int        status = 0;
        const auto waited = ::waitpid(tar_pid_, &status, WNOHANG);
        if (waited == 0)
        {
            return Next::Pending{-1};
        }
        exhausted_ = true;
        tar_pid_   = 0;
        if (waited < 0)
        {
            const int err = errno;
            logger_->error("Failed to reap archiver: {}.", std::strerror(err));
            return err;
        }
        if (const auto err = exitError(status))
        {
            return err;
        }
        logger_->debug("Archiving is done.");
        return Next::End{};
    }

    /// Kills and reaps the archiver.
    ///
    void abort()
    {
        logger_->debug("Archiving is aborted (pid={}).", tar_pid_);
        (void) ::kill(tar_pid_, SIGTERM);

        int status = 0;
        if (const auto err = platform::posixSyscallError([this, &status] {
                //
                return ::waitpid(tar_pid_, &status, 0);
            }))
        {
            logger_->warn("Failed to reap aborted archiver (pid={}): {}.", tar_pid_, std::strerror(err));
        }
        tar_pid_ = 0;
    }

    int exitError(const int status) const
    {
        if (!WIFEXITED(status) || (WEXITSTATUS(status) != 0))
        {
            logger_->warn("Archiver has failed (status={}).", status);
            return EIO;
        }
        return 0;
    }

    common::LoggerPtr logger_;
    StagingDir        staging_;
    common::io::OwnFd tar_out_;
    pid_t             tar_pid_;
    int               failure_;
    bool              exhausted_;

};  // TarChunkSource

class TarArchiveGenerator final : public ArchiveGenerator
{
public:
    TarArchiveGenerator() = default;

    // ArchiveGenerator

    ChunkSource::Ptr generate(const std::vector<std::string>& paths, const bool place_in_subfolders) override
    {
        auto source = std::make_unique<TarChunkSource>();
        source->start(paths, place_in_subfolders);
        return source;
    }

};  // TarArchiveGenerator

}  // namespace

CETL_NODISCARD ArchiveGenerator::Ptr ArchiveGenerator::make()
{
    return std::make_shared<TarArchiveGenerator>();
}

}  // namespace sdk
}  // namespace devctl
