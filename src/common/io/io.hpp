//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IO_HPP_INCLUDED
#define DEVCTL_COMMON_IO_HPP_INCLUDED

#include <cstddef>
#include <utility>

namespace devctl
{
namespace common
{
namespace io
{

/// RAII wrapper for a file descriptor.
///
/// Closes the owned descriptor (if any) on destruction or on reset.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        reset();
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    OwnFd& operator=(std::nullptr_t) noexcept
    {
        reset();
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    int get() const noexcept
    {
        return fd_;
    }

    bool valid() const noexcept
    {
        return fd_ >= 0;
    }

    /// Gives up ownership of the descriptor without closing it.
    ///
    int release() noexcept
    {
        return std::exchange(fd_, -1);
    }

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

}  // namespace io
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IO_HPP_INCLUDED
