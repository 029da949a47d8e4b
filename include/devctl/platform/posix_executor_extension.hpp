//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
#define DEVCTL_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

namespace devctl
{
namespace platform
{

/// Extension of the libcyphal executor with awaitable (file descriptor readiness) callbacks.
///
/// The IPC socket pipes query it from the user supplied executor via `cetl::rtti_cast`.
///
class IPosixExecutorExtension
{
    // 6B0E4F12-3C2A-4D71-9E85-1F7A2C64D0B3
    using TypeIdType = cetl::
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        type_id_type<0x6B, 0x0E, 0x4F, 0x12, 0x3C, 0x2A, 0x4D, 0x71, 0x9E, 0x85, 0x1F, 0x7A, 0x2C, 0x64, 0xD0, 0xB3>;

public:
    IPosixExecutorExtension(const IPosixExecutorExtension&)                = delete;
    IPosixExecutorExtension(IPosixExecutorExtension&&) noexcept            = delete;
    IPosixExecutorExtension& operator=(const IPosixExecutorExtension&)     = delete;
    IPosixExecutorExtension& operator=(IPosixExecutorExtension&&) noexcept = delete;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };
        /// Either direction of a duplex descriptor (which could be registered only once).
        struct ReadableOrWritable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable, ReadableOrWritable>;
    };

    CETL_NODISCARD virtual libcyphal::IExecutor::Callback::Any registerAwaitableCallback(
        libcyphal::IExecutor::Callback::Function&& function,
        const Trigger::Variant&                    trigger) = 0;

    // MARK: RTTI

    static constexpr cetl::type_id _get_type_id_() noexcept
    {
        return cetl::type_id_type_value<TypeIdType>();
    }

protected:
    IPosixExecutorExtension()  = default;
    ~IPosixExecutorExtension() = default;

};  // IPosixExecutorExtension

}  // namespace platform
}  // namespace devctl

#endif  // DEVCTL_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
