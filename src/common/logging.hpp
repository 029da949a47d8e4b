//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_LOGGING_HPP_INCLUDED
#define DEVCTL_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace devctl
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Gets the logger of a subsystem (like "ipc", "sdk" or "svc").
///
/// A subsystem seen for the first time gets a copy of the default logger (its sinks, pattern and level)
/// registered under its own name.
///
inline LoggerPtr getLogger(const std::string& subsystem) noexcept
{
    LoggerPtr logger = spdlog::get(subsystem);
    if (!logger)
    {
        logger = spdlog::default_logger()->clone(subsystem);
        CETL_DEBUG_ASSERT(logger, subsystem.c_str());

        performWithoutThrowing<spdlog::spdlog_ex>([&logger] {
            //
            spdlog::register_logger(logger);
        });
    }
    return logger;
}

}  // namespace common
}  // namespace devctl

#if (__cplusplus < CETL_CPP_STANDARD_17)

/// Lets `cetl::string_view` arguments be logged as they are with C++17 `std::string_view`.
///
template <>
struct fmt::formatter<cetl::string_view> : fmt::formatter<fmt::string_view>
{
    auto format(const cetl::string_view str, fmt::format_context& ctx) const
    {
        return fmt::formatter<fmt::string_view>::format(fmt::string_view{str.data(), str.size()}, ctx);
    }
};

#endif

#endif  // DEVCTL_COMMON_LOGGING_HPP_INCLUDED
