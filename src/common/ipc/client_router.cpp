//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "client_router.hpp"

#include "common_helpers.hpp"
#include "dsdl_helpers.hpp"
#include "gateway.hpp"
#include "ipc_types.hpp"
#include "logging.hpp"
#include "pipe/client_pipe.hpp"

#include "devctl/common/ipc/RouteChannelEnd_0_1.hpp"
#include "devctl/common/ipc/RouteChannelMsg_0_1.hpp"
#include "devctl/common/ipc/RouteConnect_0_1.hpp"
#include "devctl/common/ipc/Route_0_1.hpp"
#include "uavcan/primitive/Empty_1_0.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <array>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace devctl
{
namespace common
{
namespace ipc
{
namespace
{

using Tag = std::uint64_t;

class ClientRouterImpl final : public ClientRouter
{
public:
    ClientRouterImpl(cetl::pmr::memory_resource& memory, pipe::ClientPipe::Ptr client_pipe)
        : memory_{memory}
        , client_pipe_{std::move(client_pipe)}
        , logger_{getLogger("ipc")}
        , next_tag_{0}
        , state_{State::Connecting}
    {
        CETL_DEBUG_ASSERT(client_pipe_, "");
    }

    ClientRouterImpl(const ClientRouterImpl&)                = delete;
    ClientRouterImpl(ClientRouterImpl&&) noexcept            = delete;
    ClientRouterImpl& operator=(const ClientRouterImpl&)     = delete;
    ClientRouterImpl& operator=(ClientRouterImpl&&) noexcept = delete;

    ~ClientRouterImpl() override
    {
        // Channels own their gateways, and so may keep them longer than the router lives.
        for (const auto& gateway : liveGateways())
        {
            gateway->detach();
        }
    }

    // ClientRouter

    CETL_NODISCARD cetl::pmr::memory_resource& memory() override
    {
        return memory_;
    }

    CETL_NODISCARD int start() override
    {
        return client_pipe_->start([this](const pipe::ClientPipe::Event::Var& pipe_event) {
            //
            return cetl::visit(cetl::make_overloaded(
                                   [this](const pipe::ClientPipe::Event::Connected&) {
                                       //
                                       return onPipeConnected();
                                   },
                                   [this](const pipe::ClientPipe::Event::Message& message) {
                                       //
                                       return onPipeMessage(message.payload);
                                   },
                                   [this](const pipe::ClientPipe::Event::Disconnected& disconnected) {
                                       //
                                       return onPipeDisconnected(disconnected.reason);
                                   }),
                               pipe_event);
        });
    }

    CETL_NODISCARD detail::Gateway::Ptr makeGateway() override
    {
        const Tag tag = next_tag_++;

        auto gateway   = std::make_shared<ChannelGateway>(*this, tag);
        gateways_[tag] = gateway;
        return gateway;
    }

private:
    enum class State : std::uint8_t
    {
        Connecting,
        Connected,
        Disconnected,
    };

    /// Local end of a single channel.
    ///
    /// Every message it sends carries its own tag and the next sequence number.
    ///
    class ChannelGateway final : public detail::Gateway
    {
    public:
        ChannelGateway(ClientRouterImpl& router, const Tag tag)
            : router_{&router}
            , tag_{tag}
            , sent_count_{0}
            , completion_code_{0}
        {
            router.logger_->trace("Gateway(tag={}).", tag);
        }

        ChannelGateway(const ChannelGateway&)                = delete;
        ChannelGateway(ChannelGateway&&) noexcept            = delete;
        ChannelGateway& operator=(const ChannelGateway&)     = delete;
        ChannelGateway& operator=(ChannelGateway&&) noexcept = delete;

        ~ChannelGateway()
        {
            if (router_ == nullptr)
            {
                return;
            }
            router_->logger_->trace("~Gateway(tag={}, err={}).", tag_, completion_code_);

            // A gateway which has never sent anything is unknown to the server.
            const bool is_known_remotely = sent_count_ > 0;
            performWithoutThrowing([this, is_known_remotely] {
                //
                router_->releaseGateway(tag_, is_known_remotely, completion_code_);
            });
        }

        void detach() noexcept
        {
            router_ = nullptr;
        }

        // detail::Gateway

        CETL_NODISCARD int send(const detail::ServiceId service_id, const Payload payload) override
        {
            if (router_ == nullptr)
            {
                return static_cast<int>(ErrorCode::NotConnected);
            }
            return router_->sendChannelMsg(tag_, sent_count_, service_id, payload);
        }

        CETL_NODISCARD bool isBacklogged() const override
        {
            return (router_ != nullptr) && router_->client_pipe_->isBacklogged();
        }

        void complete(const int error_code) override
        {
            completion_code_ = error_code;
        }

        CETL_NODISCARD int event(const Event::Var& event) override
        {
            // Nobody may be subscribed yet.
            return event_handler_ ? event_handler_(event) : 0;
        }

        void subscribe(EventHandler event_handler) override
        {
            event_handler_ = std::move(event_handler);
            if (router_ != nullptr)
            {
                router_->onGatewaySubscribed(tag_);
            }
        }

    private:
        ClientRouterImpl* router_;
        const Tag         tag_;
        std::uint64_t     sent_count_;
        EventHandler      event_handler_;
        int               completion_code_;

    };  // ChannelGateway

    using GatewayPtr = std::shared_ptr<ChannelGateway>;

    /// Serializes the route message and sends it, followed by the optional tail bytes.
    ///
    CETL_NODISCARD int sendRoute(const Route_0_1& route, const Payload tail = {}) const
    {
        auto& client_pipe = *client_pipe_;
        return tryPerformOnSerialized(route, [&client_pipe, tail](const Payload head) {
            //
            if (tail.empty())
            {
                const std::array<Payload, 1> payloads{head};
                return client_pipe.send(payloads);
            }
            const std::array<Payload, 2> payloads{head, tail};
            return client_pipe.send(payloads);
        });
    }

    /// Sends the message on behalf of the channel, and advances the channel sequence.
    ///
    CETL_NODISCARD int sendChannelMsg(const Tag               tag,
                                      std::uint64_t&          sequence,
                                      const detail::ServiceId service_id,
                                      const Payload           payload) const
    {
        if (state_ != State::Connected)
        {
            return static_cast<int>(ErrorCode::NotConnected);
        }
        if (gateways_.count(tag) == 0)
        {
            // The channel has been completed already.
            return static_cast<int>(ErrorCode::Disconnected);
        }

        Route_0_1 route{&memory_};
        auto&     channel_msg    = route.set_channel_msg();
        channel_msg.tag          = tag;
        channel_msg.sequence     = sequence++;
        channel_msg.service_id   = service_id;
        channel_msg.payload_size = payload.size();
        return sendRoute(route, payload);
    }

    CETL_NODISCARD GatewayPtr findGateway(const Tag tag) const
    {
        const auto found = gateways_.find(tag);
        return (found != gateways_.end()) ? found->second.lock() : nullptr;
    }

    /// Unregisters the gateway, so no more events are routed to it.
    ///
    CETL_NODISCARD GatewayPtr takeGateway(const Tag tag)
    {
        auto gateway = findGateway(tag);
        gateways_.erase(tag);
        return gateway;
    }

    /// Strong references, so that gateways survive whatever their event handlers do to the registry.
    ///
    CETL_NODISCARD std::vector<GatewayPtr> liveGateways() const
    {
        std::vector<GatewayPtr> gateways;
        gateways.reserve(gateways_.size());
        for (const auto& tag_and_gateway : gateways_)
        {
            if (auto gateway = tag_and_gateway.second.lock())
            {
                gateways.push_back(std::move(gateway));
            }
        }
        return gateways;
    }

    static void notify(ChannelGateway& gateway, const detail::Gateway::Event::Var& event)
    {
        const int err = gateway.event(event);
        (void) err;  // Best efforts strategy.
    }

    void onGatewaySubscribed(const Tag tag)
    {
        if (state_ == State::Connected)
        {
            if (const auto gateway = findGateway(tag))
            {
                notify(*gateway, detail::Gateway::Event::Connected{});
            }
        }
        else if (state_ == State::Disconnected)
        {
            // The pipe won't come back, so the new channel is done right away.
            if (const auto gateway = takeGateway(tag))
            {
                notify(*gateway, detail::Gateway::Event::Completed{ErrorCode::NotConnected});
            }
        }
    }

    /// Called when a channel (and so its gateway) is destroyed.
    ///
    /// The server is told about the end of the channel only if it knows the channel,
    /// and only while the route is still connected.
    ///
    void releaseGateway(const Tag tag, const bool is_known_remotely, const int completion_code)
    {
        const bool was_registered = gateways_.erase(tag) > 0;
        if (!was_registered || !is_known_remotely || (state_ != State::Connected))
        {
            return;
        }

        Route_0_1 route{&memory_};
        auto&     channel_end  = route.set_channel_end();
        channel_end.tag        = tag;
        channel_end.error_code = completion_code;

        const int err = sendRoute(route);
        (void) err;  // Best efforts strategy - the gateway is gone, so nowhere to report.
    }

    CETL_NODISCARD int onPipeConnected() const
    {
        logger_->debug("Pipe is connected.");

        // The route is connected only after the server answers our `RouteConnect`.
        Route_0_1 route{&memory_};
        auto&     route_connect     = route.set_connect();
        route_connect.version.major = VERSION_MAJOR;
        route_connect.version.minor = VERSION_MINOR;
        return sendRoute(route);
    }

    CETL_NODISCARD int onPipeMessage(const Payload payload)
    {
        Route_0_1 route{&memory_};
        if (!tryDeserializePayload(payload, route).has_value())
        {
            return EINVAL;
        }

        return cetl::visit(cetl::make_overloaded(
                               [](const uavcan::primitive::Empty_1_0&) {
                                   //
                                   return EINVAL;
                               },
                               [this](const RouteConnect_0_1& route_connect) {
                                   //
                                   return onRouteConnect(route_connect);
                               },
                               [this, payload](const RouteChannelMsg_0_1& channel_msg) {
                                   //
                                   return onRouteChannelMsg(channel_msg, payload);
                               },
                               [this](const RouteChannelEnd_0_1& channel_end) {
                                   //
                                   return onRouteChannelEnd(channel_end);
                               }),
                           route.union_value);
    }

    CETL_NODISCARD int onPipeDisconnected(const int reason)
    {
        if (state_ == State::Disconnected)
        {
            return 0;
        }

        // Channels still waiting for `RouteConnect` have never been connected at all.
        const auto error_code = (state_ == State::Connected) ? ErrorCode::Disconnected : ErrorCode::NotConnected;
        logger_->debug("Pipe is disconnected (err={}, reason={}).", static_cast<int>(error_code), reason);
        state_ = State::Disconnected;

        const auto gateways = liveGateways();
        gateways_.clear();
        for (const auto& gateway : gateways)
        {
            notify(*gateway, detail::Gateway::Event::Completed{error_code});
        }
        return 0;
    }

    CETL_NODISCARD int onRouteConnect(const RouteConnect_0_1& route_connect)
    {
        const auto ver_major = static_cast<int>(route_connect.version.major);
        const auto ver_minor = static_cast<int>(route_connect.version.minor);
        logger_->debug("Route connect response (ver='{}.{}', err={}).",
                       ver_major,
                       ver_minor,
                       static_cast<int>(route_connect.error_code));

        if (ver_major != VERSION_MAJOR)
        {
            logger_->error("Incompatible server route (ver='{}.{}', expected major={}).",
                           ver_major,
                           ver_minor,
                           VERSION_MAJOR);
            return EPROTO;
        }

        // Repeated responses change nothing.
        if (state_ == State::Connecting)
        {
            state_ = State::Connected;
            for (const auto& gateway : liveGateways())
            {
                notify(*gateway, detail::Gateway::Event::Connected{});
            }
        }
        return 0;
    }

    CETL_NODISCARD int onRouteChannelMsg(const RouteChannelMsg_0_1& channel_msg, const Payload payload)
    {
        if (channel_msg.payload_size > payload.size())
        {
            logger_->warn("Route Ch Msg with invalid payload size (tag={}, size={}).",
                          channel_msg.tag,
                          channel_msg.payload_size);
            return EINVAL;
        }

        const auto gateway = findGateway(channel_msg.tag);
        if (!gateway)
        {
            logger_->debug("Route Ch Unsolicited Msg (tag={}, seq={}, srv=0x{:X}).",
                           channel_msg.tag,
                           channel_msg.sequence,
                           channel_msg.service_id);
            return 0;
        }
        logger_->trace("Route Ch Msg (tag={}, seq={}).", channel_msg.tag, channel_msg.sequence);

        // The channel message itself is the tail of the route payload.
        const auto msg_payload = payload.subspan(payload.size() - channel_msg.payload_size);

        const int err = gateway->event(detail::Gateway::Event::Message{channel_msg.sequence, msg_payload});
        if (err != 0)
        {
            // Only the channel is done; the route stays.
            logger_->warn("Route Ch Msg rejected - completing channel (tag={}, err={}).", channel_msg.tag, err);
            gateways_.erase(channel_msg.tag);
            notify(*gateway, detail::Gateway::Event::Completed{static_cast<ErrorCode>(err)});
        }
        return 0;
    }

    CETL_NODISCARD int onRouteChannelEnd(const RouteChannelEnd_0_1& channel_end)
    {
        logger_->debug("Route Ch End (tag={}, err={}).", channel_end.tag, channel_end.error_code);

        if (const auto gateway = takeGateway(channel_end.tag))
        {
            return gateway->event(detail::Gateway::Event::Completed{static_cast<ErrorCode>(channel_end.error_code)});
        }
        return 0;
    }

    cetl::pmr::memory_resource&                            memory_;
    pipe::ClientPipe::Ptr                                  client_pipe_;
    LoggerPtr                                              logger_;
    Tag                                                    next_tag_;
    State                                                  state_;
    std::unordered_map<Tag, std::weak_ptr<ChannelGateway>> gateways_;

};  // ClientRouterImpl

}  // namespace

CETL_NODISCARD ClientRouter::Ptr ClientRouter::make(cetl::pmr::memory_resource& memory,
                                                    pipe::ClientPipe::Ptr       client_pipe)
{
    return std::make_shared<ClientRouterImpl>(memory, std::move(client_pipe));
}

}  // namespace ipc
}  // namespace common
}  // namespace devctl
