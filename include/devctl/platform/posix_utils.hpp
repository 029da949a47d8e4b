//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define DEVCTL_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <libcyphal/transport/errors.hpp>

#include <cerrno>
#include <cstdint>
#include <signal.h>  // NOLINT
#include <sys/types.h>

namespace devctl
{
namespace platform
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// Checks whether a process with the given pid exists (and is signalable by us).
///
inline bool isProcessAlive(const pid_t pid) noexcept
{
    if (pid <= 0)
    {
        return false;
    }
    const int err = posixSyscallError([pid] {
        //
        return ::kill(pid, 0);
    });
    // `EPERM` means that the process exists, but we are not allowed to signal it.
    return (err == 0) || (err == EPERM);
}

/// A failed syscall, reported through the libcyphal error variants.
///
class ErrnoPlatformError final : public libcyphal::transport::IPlatformError
{
public:
    explicit ErrnoPlatformError(const int error_num) noexcept
        : error_num_{error_num}
    {
    }

    /// The `errno` of the failed call.
    ///
    std::uint32_t code() const noexcept override
    {
        return static_cast<std::uint32_t>(error_num_);
    }

private:
    int error_num_;

};  // ErrnoPlatformError

}  // namespace platform
}  // namespace devctl

#endif  // DEVCTL_PLATFORM_POSIX_UTILS_HPP_INCLUDED
