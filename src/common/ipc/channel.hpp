//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IPC_CHANNEL_HPP_INCLUDED
#define DEVCTL_COMMON_IPC_CHANNEL_HPP_INCLUDED

#include "dsdl_helpers.hpp"
#include "gateway.hpp"
#include "ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <functional>
#include <utility>

namespace devctl
{
namespace common
{
namespace ipc
{

/// The route to the peer is established, so requests could be sent now.
struct ChannelConnected final
{};

/// The stream is over, either by the peer or by the router (f.e. on disconnection).
struct ChannelCompleted final
{
    ErrorCode error_code;
};

/// Client end of a service stream: sends `Request_` messages, and receives `Response_` ones.
///
/// Destruction of the channel ends the stream (the channel is the only owner of its gateway).
///
template <typename Response_, typename Request_>
class Channel final
{
public:
    using Input     = Response_;
    using Output    = Request_;
    using Connected = ChannelConnected;
    using Completed = ChannelCompleted;

    using EventVar     = cetl::variant<Connected, Input, Completed>;
    using EventHandler = std::function<void(const EventVar&)>;

    Channel(cetl::pmr::memory_resource& memory, detail::Gateway::Ptr gateway, const detail::ServiceId service_id)
        : memory_{memory}
        , gateway_{std::move(gateway)}
        , service_id_{service_id}
    {
        CETL_DEBUG_ASSERT(gateway_, "");
    }

    ~Channel()                               = default;
    Channel(Channel&&) noexcept              = default;
    Channel& operator=(Channel&&) noexcept   = default;
    Channel(const Channel&)                  = delete;
    Channel& operator=(const Channel&)       = delete;

    /// Sends the request right away, or queues it (if the connection is busy).
    ///
    CETL_NODISCARD int send(const Output& request)
    {
        return tryPerformOnSerialized(request, [this](const Payload payload) {
            //
            return gateway_->send(service_id_, payload);
        });
    }

    /// Bulk (streaming) senders should hold off while the connection is backlogged.
    ///
    CETL_NODISCARD bool isBacklogged() const
    {
        return gateway_->isBacklogged();
    }

    /// Sets the code which the peer gets on the end of this stream.
    ///
    void complete(const int error_code)
    {
        gateway_->complete(error_code);
    }

    void subscribe(EventHandler event_handler)
    {
        if (!event_handler)
        {
            gateway_->subscribe(nullptr);
            return;
        }

        using GatewayEvent = detail::Gateway::Event;

        gateway_->subscribe([memory = memory_, handler = std::move(event_handler)](const GatewayEvent::Var& event) {
            //
            return cetl::visit(cetl::make_overloaded(
                                   [&handler](const GatewayEvent::Connected&) {
                                       //
                                       handler(Connected{});
                                       return 0;
                                   },
                                   [&handler, memory](const GatewayEvent::Message& message) {
                                       //
                                       Input response{&memory.get()};
                                       if (!tryDeserializePayload(message.payload, response))
                                       {
                                           return EINVAL;
                                       }
                                       handler(response);
                                       return 0;
                                   },
                                   [&handler](const GatewayEvent::Completed& completed) {
                                       //
                                       handler(Completed{completed.error_code});
                                       return 0;
                                   }),
                               event);
        });
    }

private:
    std::reference_wrapper<cetl::pmr::memory_resource> memory_;
    detail::Gateway::Ptr                               gateway_;
    detail::ServiceId                                  service_id_;

};  // Channel

}  // namespace ipc
}  // namespace common
}  // namespace devctl

// MARK: - Formatting

// NOLINTBEGIN
template <>
struct fmt::formatter<devctl::common::ipc::ChannelConnected> : formatter<string_view>
{
    auto format(devctl::common::ipc::ChannelConnected, format_context& ctx) const
    {
        return formatter<string_view>::format("Connected", ctx);
    }
};

template <>
struct fmt::formatter<devctl::common::ipc::ChannelCompleted> : formatter<string_view>
{
    auto format(const devctl::common::ipc::ChannelCompleted completed, format_context& ctx) const
    {
        return format_to(ctx.out(), "Completed(err={})", static_cast<int>(completed.error_code));
    }
};
// NOLINTEND

#endif  // DEVCTL_COMMON_IPC_CHANNEL_HPP_INCLUDED
