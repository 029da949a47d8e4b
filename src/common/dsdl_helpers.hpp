//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_DSDL_HELPERS_HPP_INCLUDED
#define DEVCTL_COMMON_DSDL_HELPERS_HPP_INCLUDED

#include <cetl/pf20/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

namespace devctl
{
namespace common
{

/// Messages which serialize into at most this number of bytes are serialized on stack; bigger ones - on heap.
///
constexpr std::size_t MsgSmallPayloadSize = 256;

template <typename Message>
auto tryDeserializePayload(const cetl::span<const std::uint8_t> payload, Message& out_message)
{
    return deserialize(out_message, {payload.data(), payload.size()});
}

namespace detail
{

template <typename Message, typename Buffer, typename Action>
int performOnSerializedInto(const Message& message, Buffer& buffer, Action&& action)
{
    const auto result_size = serialize(message, {buffer.data(), buffer.size()});
    if (!result_size)
    {
        return EINVAL;
    }

    const cetl::span<const std::uint8_t> bytes{buffer.data(), result_size.value()};
    return std::forward<Action>(action)(bytes);
}

template <typename Message, typename Action>
int performOnSerialized(const Message& message, Action&& action, std::true_type /* on stack */)
{
    // Next nolint b/c we use a buffer to serialize the message, so no need to zero it (and performance better).
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    std::array<std::uint8_t, Message::_traits_::SerializationBufferSizeBytes> buffer;
    return performOnSerializedInto(message, buffer, std::forward<Action>(action));
}

template <typename Message, typename Action>
int performOnSerialized(const Message& message, Action&& action, std::false_type /* on heap */)
{
    using ArrayOfBytes = std::array<std::uint8_t, Message::_traits_::SerializationBufferSizeBytes>;
    const std::unique_ptr<ArrayOfBytes> buffer{new ArrayOfBytes};
    return performOnSerializedInto(message, *buffer, std::forward<Action>(action));
}

}  // namespace detail

/// Serializes the message, and performs the action on the resulting bytes.
///
/// @return `EINVAL` if the message could not be serialized, otherwise the result of the action.
///
template <typename Message, typename Action>
int tryPerformOnSerialized(const Message& message, Action&& action)
{
    using IsOnStack = std::integral_constant<bool,  //
                                             Message::_traits_::SerializationBufferSizeBytes <= MsgSmallPayloadSize>;

    return detail::performOnSerialized(message, std::forward<Action>(action), IsOnStack{});
}

}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_DSDL_HELPERS_HPP_INCLUDED
