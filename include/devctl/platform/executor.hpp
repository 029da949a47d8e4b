//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_PLATFORM_EXECUTOR_HPP_INCLUDED
#define DEVCTL_PLATFORM_EXECUTOR_HPP_INCLUDED

#include "linux/epoll_single_threaded_executor.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace devctl
{
namespace platform
{

/// The executor of devctl tools and tests: callbacks and file descriptors, all on the calling thread.
///
using SingleThreadedExecutor = Linux::EpollSingleThreadedExecutor;

/// The longest time the executor sleeps on its file descriptors before the condition is checked again.
///
constexpr libcyphal::Duration MaxSpinNap = std::chrono::seconds{1};

/// Runs the executor (its due callbacks, then its ready file descriptors) until the condition holds.
///
template <typename Executor, typename Condition>
void spinUntil(Executor& executor, Condition condition)
{
    while (!condition())
    {
        const auto spin_result = executor.spinOnce();
        if (condition())
        {
            return;
        }

        auto nap = MaxSpinNap;
        if (spin_result.next_exec_time)
        {
            nap = std::min(nap, *spin_result.next_exec_time - executor.now());
        }
        if (executor.pollAwaitableResourcesFor(cetl::make_optional(nap)))
        {
            spdlog::warn("Executor failed to await its file descriptors.");
        }
    }
}

}  // namespace platform
}  // namespace devctl

#endif  // DEVCTL_PLATFORM_EXECUTOR_HPP_INCLUDED
