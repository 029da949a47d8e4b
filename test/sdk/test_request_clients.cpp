//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "svc/companion/companion_clients.hpp"
#include "svc/request_client.hpp"

#include "common/ipc/client_router_mock.hpp"
#include "common/ipc/gateway_mock.hpp"
#include "common/ipc/ipc_gtest_helpers.hpp"
#include "common_helpers.hpp"
#include "ipc/channel.hpp"
#include "ipc/ipc_types.hpp"
#include "sdk_gtest_helpers.hpp"
#include "svc/svc_types.hpp"
#include "tracking_memory_resource.hpp"

#include "devctl/common/svc/companion/Point_0_1.hpp"

#include <devctl/sdk/types.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <memory>
#include <string>

namespace
{

using namespace devctl::sdk::svc;  // NOLINT This our main concern here in the unit tests.

using devctl::sdk::AppProcessState;
using devctl::sdk::InstalledApp;
using devctl::sdk::submitTo;
using devctl::common::assignString;
using devctl::common::ipc::ErrorCode;
using devctl::common::ipc::PayloadWith;
using devctl::common::ipc::ClientRouterMock;
using devctl::common::ipc::detail::Gateway;
using devctl::common::ipc::detail::GatewayMock;

using testing::_;
using testing::Field;
using testing::Return;
using testing::AllOf;
using testing::IsEmpty;
using testing::StrictMock;
using testing::ElementsAre;
using testing::VariantWith;
using testing::MockFunction;
using testing::InvokeWithoutArgs;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestRequestClients : public testing::Test
{
protected:
    using ListAppsSpec          = companion::ListAppsSpec;
    using AccessibilityInfoSpec = companion::AccessibilityInfoSpec;
    using ApproveSpec           = companion::ApproveSpec;

    void TearDown() override
    {
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    void expectChannel()
    {
        EXPECT_CALL(*router_mock_, makeGateway())  //
            .WillOnce(InvokeWithoutArgs([this]() -> Gateway::Ptr {
                //
                return std::make_shared<GatewayMock::Wrapper>(gateway_mock_);
            }));
    }

    template <typename Spec>
    void expectConnectedAndSent()
    {
        const auto svc_id = devctl::common::ipc::detail::serviceIdOf(Spec::svc_full_name());
        EXPECT_CALL(gateway_mock_, send(svc_id, _)).WillOnce(Return(0));
        gateway_mock_.emulateConnected();
    }

    template <typename Success>
    static testing::Matcher<const ResultOf<Success>&> ChannelFaultWith(const int error_code)
    {
        return VariantWith<Failure>(VariantWith<ChannelFault>(Field(&ChannelFault::error_code, error_code)));
    }

    // NOLINTBEGIN
    devctl::TrackingMemoryResource                mr_;
    std::shared_ptr<StrictMock<ClientRouterMock>> router_mock_{std::make_shared<StrictMock<ClientRouterMock>>(mr_)};
    StrictMock<GatewayMock>                       gateway_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestRequestClients, list_apps)
{
    using Success = companion::ListAppsCollector::Success;

    expectChannel();
    auto client = companion::ListAppsClient::make(router_mock_, ListAppsSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    expectConnectedAndSent<ListAppsSpec>();
    {
        ListAppsSpec::Response response{&mr_};
        auto&                  app = response.set_app();
        assignString(app.bundle_id, "com.example.maps", 255);
        assignString(app.name, "Maps", 255);
        assignString(app.install_type, "system", 32);
        app.process_state = 2;
        app.debuggable    = false;
        for (const auto* const arch_name : {"arm64", "arm64e"})
        {
            devctl::common::svc::companion::Architecture_0_1 arch{&mr_};
            assignString(arch.name, arch_name, 32);
            app.architectures.push_back(arch);
        }
        gateway_mock_.emulateMessage(response);
    }
    {
        ListAppsSpec::Response response{&mr_};
        auto&                  app = response.set_app();
        assignString(app.bundle_id, "com.example.debug", 255);
        app.process_state = 1;
        app.debuggable    = true;
        gateway_mock_.emulateMessage(response);
    }

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver,
                Call(VariantWith<Success>(ElementsAre(AllOf(Field(&InstalledApp::bundle_id, "com.example.maps"),
                                                            Field(&InstalledApp::name, "Maps"),
                                                            Field(&InstalledApp::install_type, "system"),
                                                            Field(&InstalledApp::architectures,
                                                                  ElementsAre("arm64", "arm64e")),
                                                            Field(&InstalledApp::process_state,
                                                                  AppProcessState::Running)),
                                                      AllOf(Field(&InstalledApp::bundle_id, "com.example.debug"),
                                                            Field(&InstalledApp::process_state,
                                                                  AppProcessState::NotRunning),
                                                            Field(&InstalledApp::debuggable, true))))))
        .Times(1);
    gateway_mock_.emulateCompleted();
}

TEST_F(TestRequestClients, list_apps_empty)
{
    using Success = companion::ListAppsCollector::Success;

    expectChannel();
    auto client = companion::ListAppsClient::make(router_mock_, ListAppsSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    expectConnectedAndSent<ListAppsSpec>();

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(VariantWith<Success>(IsEmpty()))).Times(1);
    gateway_mock_.emulateCompleted();
}

TEST_F(TestRequestClients, list_apps_remote_fault)
{
    using Success = companion::ListAppsCollector::Success;

    expectChannel();
    auto client = companion::ListAppsClient::make(router_mock_, ListAppsSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    expectConnectedAndSent<ListAppsSpec>();

    ListAppsSpec::Response response{&mr_};
    auto&                  fault = response.set_fault();
    fault.code                   = 5;
    assignString(fault.message, "Springboard is busy.", 256);

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver,
                Call(VariantWith<Failure>(VariantWith<RemoteFault>(
                    AllOf(Field(&RemoteFault::code, 5), Field(&RemoteFault::message, "Springboard is busy."))))))
        .Times(1);
    gateway_mock_.emulateMessage(response);
}

TEST_F(TestRequestClients, list_apps_disconnected)
{
    using Success = companion::ListAppsCollector::Success;

    expectChannel();
    auto client = companion::ListAppsClient::make(router_mock_, ListAppsSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(ChannelFaultWith<Success>(ENOTCONN))).Times(1);
    gateway_mock_.emulateCompleted(ErrorCode::NotConnected);
}

TEST_F(TestRequestClients, accessibility_info)
{
    using Success = companion::AccessibilityInfoCollector::Success;

    AccessibilityInfoSpec::Request request{&mr_};
    {
        devctl::common::svc::companion::Point_0_1 point{&mr_};
        point.x = 10;
        point.y = -20;
        request.point.push_back(point);
    }

    expectChannel();
    auto client = companion::AccessibilityInfoClient::make(router_mock_, request);

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    EXPECT_CALL(gateway_mock_,
                send(_,
                     PayloadWith<AccessibilityInfoSpec::Request>(  //
                         mr_,
                         Field(&AccessibilityInfoSpec::Request::point,
                               ElementsAre(AllOf(Field(&devctl::common::svc::companion::Point_0_1::x, 10),
                                                 Field(&devctl::common::svc::companion::Point_0_1::y, -20)))))))
        .WillOnce(Return(0));
    gateway_mock_.emulateConnected();

    AccessibilityInfoSpec::Response response{&mr_};
    assignString(response.set_json(), R"({"role":"button"})", 65535);

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(VariantWith<Success>(Field(&devctl::sdk::AccessibilityInfo::json, R"({"role":"button"})"))))
        .Times(1);
    gateway_mock_.emulateMessage(response);
}

TEST_F(TestRequestClients, accessibility_info_zero_fault)
{
    using Success = companion::AccessibilityInfoCollector::Success;

    expectChannel();
    auto client = companion::AccessibilityInfoClient::make(router_mock_, AccessibilityInfoSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    expectConnectedAndSent<AccessibilityInfoSpec>();

    AccessibilityInfoSpec::Response response{&mr_};
    response.set_fault().code = 0;

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(ChannelFaultWith<Success>(EBADMSG))).Times(1);
    gateway_mock_.emulateMessage(response);
}

TEST_F(TestRequestClients, completed_without_response)
{
    using Success = companion::AccessibilityInfoCollector::Success;

    expectChannel();
    auto client = companion::AccessibilityInfoClient::make(router_mock_, AccessibilityInfoSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    expectConnectedAndSent<AccessibilityInfoSpec>();

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(ChannelFaultWith<Success>(ENODATA))).Times(1);
    gateway_mock_.emulateCompleted();
}

TEST_F(TestRequestClients, approve)
{
    using Success = FaultOnlyCollector::Success;

    ApproveSpec::Request request{&mr_};
    assignString(request.bundle_id, "com.example.app", 255);
    request.permissions.push_back(+ApproveSpec::Request::PERMISSION_CAMERA);

    expectChannel();
    auto client = companion::ApproveClient::make(router_mock_, request);

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    EXPECT_CALL(gateway_mock_,
                send(_,
                     PayloadWith<ApproveSpec::Request>(mr_,
                                                       Field(&ApproveSpec::Request::permissions,
                                                             ElementsAre(+ApproveSpec::Request::PERMISSION_CAMERA)))))
        .WillOnce(Return(0));
    gateway_mock_.emulateConnected();

    // Zero code fault means success.
    ApproveSpec::Response response{&mr_};

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(VariantWith<Success>(_))).Times(1);
    gateway_mock_.emulateMessage(response);
}

TEST_F(TestRequestClients, send_failure)
{
    using Success = FaultOnlyCollector::Success;

    expectChannel();
    auto client = companion::ApproveClient::make(router_mock_, ApproveSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    EXPECT_CALL(gateway_mock_, send(_, _)).WillOnce(Return(EPIPE));
    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(ChannelFaultWith<Success>(EPIPE))).Times(1);
    gateway_mock_.emulateConnected();
}

TEST_F(TestRequestClients, cancel)
{
    using Success = companion::ListAppsCollector::Success;

    expectChannel();
    auto client = companion::ListAppsClient::make(router_mock_, ListAppsSpec::Request{&mr_});

    StrictMock<MockFunction<void(const ResultOf<Success>&)>> receiver;

    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    submitTo(client, receiver);

    expectConnectedAndSent<ListAppsSpec>();

    // The receiver is never called.
    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    client.reset();
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
