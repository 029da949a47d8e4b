//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_HELPERS_HPP_INCLUDED
#define DEVCTL_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace devctl
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Makes a string out of a DSDL byte array (like `uint8[<=N]`).
///
template <typename ByteArray>
std::string stringFrom(const ByteArray& bytes)
{
    return std::string{bytes.begin(), bytes.end()};
}

/// Copies the string into a DSDL byte array, truncated to the array capacity.
///
/// @return `false` if the string did not fit (and so was truncated).
///
template <typename ByteArray>
bool assignString(ByteArray& bytes, const std::string& str, const std::size_t capacity)
{
    const bool fits = str.size() <= capacity;
    const auto size = fits ? str.size() : capacity;
    bytes.clear();
    bytes.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
    {
        bytes.push_back(static_cast<std::uint8_t>(str[i]));
    }
    return fits;
}

}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_HELPERS_HPP_INCLUDED
