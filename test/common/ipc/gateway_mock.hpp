//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_COMMON_IPC_GATEWAY_MOCK_HPP_INCLUDED
#define DEVCTL_COMMON_IPC_GATEWAY_MOCK_HPP_INCLUDED

#include "dsdl_helpers.hpp"
#include "ipc/gateway.hpp"
#include "ipc/ipc_types.hpp"
#include "ref_wrapper.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>

namespace devctl
{
namespace common
{
namespace ipc
{
namespace detail
{

class GatewayMock : public Gateway
{
public:
    struct Wrapper final : RefWrapper<Gateway, GatewayMock>
    {
        using RefWrapper::RefWrapper;

        // MARK: Gateway

        CETL_NODISCARD int send(const ServiceId service_id, const Payload payload) override
        {
            return reference().send(service_id, payload);
        }

        CETL_NODISCARD bool isBacklogged() const override
        {
            return reference().isBacklogged();
        }

        void complete(const int error_code) override
        {
            reference().complete(error_code);
        }

        CETL_NODISCARD int event(const Event::Var& event) override
        {
            return reference().event(event);
        }

        void subscribe(EventHandler event_handler) override
        {
            reference().event_handler_ = event_handler;
            reference().subscribe(event_handler);
        }

    };  // Wrapper

    MOCK_METHOD(void, deinit, (), (const));
    MOCK_METHOD(int, send, (const ServiceId service_id, const Payload payload), (override));
    MOCK_METHOD(bool, isBacklogged, (), (const, override));
    MOCK_METHOD(void, complete, (const int error_code), (override));
    MOCK_METHOD(int, event, (const Event::Var& event), (override));
    MOCK_METHOD(void, subscribe, (EventHandler event_handler), (override));

    // MARK: Emulation of the router side:

    void emulateConnected()
    {
        ASSERT_TRUE(event_handler_) << "Gateway is not subscribed.";
        EXPECT_THAT(event_handler_(Event::Connected{}), 0);
    }

    template <typename Msg>
    void emulateMessage(const Msg& msg)
    {
        ASSERT_TRUE(event_handler_) << "Gateway is not subscribed.";
        const int result = tryPerformOnSerialized(msg, [this](const Payload payload) {
            //
            return event_handler_(Event::Message{next_sequence_++, payload});
        });
        EXPECT_THAT(result, 0);
    }

    void emulateCompleted(const ErrorCode error_code = ErrorCode::Success)
    {
        ASSERT_TRUE(event_handler_) << "Gateway is not subscribed.";
        EXPECT_THAT(event_handler_(Event::Completed{error_code}), 0);
    }

    // NOLINTBEGIN
    EventHandler  event_handler_;
    std::uint64_t next_sequence_{0};
    // NOLINTEND

};  // GatewayMock

}  // namespace detail
}  // namespace ipc
}  // namespace common
}  // namespace devctl

#endif  // DEVCTL_COMMON_IPC_GATEWAY_MOCK_HPP_INCLUDED
