//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "sdk_factory.hpp"

#include "archive_generator_mock.hpp"
#include "common/ipc/client_router_mock.hpp"
#include "common/ipc/gateway_mock.hpp"
#include "common/ipc/ipc_gtest_helpers.hpp"
#include "common_helpers.hpp"
#include "daemon_spawner_mock.hpp"
#include "dialer_mock.hpp"
#include "peer_resolver_mock.hpp"
#include "sdk_gtest_helpers.hpp"
#include "svc/companion/add_media_spec.hpp"
#include "svc/companion/approve_spec.hpp"
#include "tracking_memory_resource.hpp"

#include <devctl/platform/executor.hpp>
#include <devctl/sdk/client.hpp>
#include <devctl/sdk/daemon_spawner.hpp>
#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>
#include <devctl/sdk/peer_resolver.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <memory>
#include <set>
#include <string>

namespace
{

using namespace devctl::sdk;  // NOLINT This our main concern here in the unit tests.

using devctl::common::stringFrom;
using devctl::common::ipc::PayloadWith;
using devctl::common::ipc::ClientRouter;
using devctl::common::ipc::ClientRouterMock;
using devctl::common::ipc::detail::Gateway;
using devctl::common::ipc::detail::GatewayMock;

using testing::_;
using testing::Field;
using testing::Return;
using testing::AllOf;
using testing::IsEmpty;
using testing::Optional;
using testing::ResultOf;
using testing::HasSubstr;
using testing::StrictMock;
using testing::ElementsAre;
using testing::VariantWith;
using testing::MockFunction;
using testing::InvokeWithoutArgs;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestClient : public testing::Test
{
protected:
    using ApproveSpec  = devctl::common::svc::companion::ApproveSpec;
    using AddMediaSpec = devctl::common::svc::companion::AddMediaSpec;

    void TearDown() override
    {
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    Client::Ptr makeClient()
    {
        Client::Params params;
        params.device_id = std::string{"udid-1"};

        return Factory::makeClient(mr_,
                                   executor_,
                                   params,
                                   {resolver_mock_, spawner_mock_, generator_mock_},
                                   dialer_mock_);
    }

    void expectCompanion(const bool is_local)
    {
        EXPECT_CALL(*resolver_mock_, resolve(Optional(std::string{"udid-1"})))
            .WillOnce(Return(PeerResolver::Resolve::Result{PeerInfo{"10.0.0.7", 10882, std::string{"udid-1"}, is_local}}));
        EXPECT_CALL(*dialer_mock_, dial("10.0.0.7", 10882))
            .WillOnce(Return(Dialer::Dial::Result{ClientRouter::Ptr{companion_router_mock_}}));
    }

    /// Gives the executor a few turns (enough for a short upload to get through).
    ///
    void spin()
    {
        for (int turn = 0; turn < 8; ++turn)
        {
            (void) executor_.spinOnce();
        }
    }

    void expectChannel(StrictMock<ClientRouterMock>& router_mock)
    {
        EXPECT_CALL(router_mock, makeGateway())  //
            .WillOnce(InvokeWithoutArgs([this]() -> Gateway::Ptr {
                //
                return std::make_shared<GatewayMock::Wrapper>(gateway_mock_);
            }));
        EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    }

    // NOLINTBEGIN
    devctl::TrackingMemoryResource                    mr_;
    devctl::platform::SingleThreadedExecutor          executor_;
    std::shared_ptr<StrictMock<PeerResolverMock>>     resolver_mock_{std::make_shared<StrictMock<PeerResolverMock>>()};
    std::shared_ptr<StrictMock<DaemonSpawnerMock>>    spawner_mock_{std::make_shared<StrictMock<DaemonSpawnerMock>>()};
    std::shared_ptr<StrictMock<ArchiveGeneratorMock>> generator_mock_{
        std::make_shared<StrictMock<ArchiveGeneratorMock>>()};
    std::shared_ptr<StrictMock<DialerMock>>       dialer_mock_{std::make_shared<StrictMock<DialerMock>>()};
    std::shared_ptr<StrictMock<ClientRouterMock>> companion_router_mock_{
        std::make_shared<StrictMock<ClientRouterMock>>(mr_)};
    std::shared_ptr<StrictMock<ClientRouterMock>> daemon_router_mock_{
        std::make_shared<StrictMock<ClientRouterMock>>(mr_)};
    StrictMock<GatewayMock> gateway_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestClient, make_without_companion)
{
    EXPECT_CALL(*resolver_mock_, resolve(_))
        .WillOnce(Return(PeerResolver::Resolve::Result{
            Error{ErrorKind::PeerNotFound, "Expected exactly one registered companion, found 0."}}));

    // Creation does not fail, and nothing is dialed.
    const auto client = makeClient();
    ASSERT_TRUE(client);
    EXPECT_FALSE(client->companionInfo());

    auto sender = client->listApps();

    StrictMock<MockFunction<void(const Client::ListApps::Result&)>> receiver;
    EXPECT_CALL(receiver,
                Call(VariantWith<Error>(ErrorWith(ErrorKind::PeerNotFound,
                                                  "list_apps",
                                                  "Expected exactly one registered companion, found 0."))))
        .Times(1);
    submitTo(sender, receiver);
}

TEST_F(TestClient, companion_dial_failure)
{
    EXPECT_CALL(*resolver_mock_, resolve(_))
        .WillOnce(Return(PeerResolver::Resolve::Result{PeerInfo{"10.0.0.7", 10882, cetl::nullopt, false}}));
    EXPECT_CALL(*dialer_mock_, dial("10.0.0.7", 10882)).WillOnce(Return(Dialer::Dial::Result{ECONNREFUSED}));

    const auto client = makeClient();
    EXPECT_FALSE(client->companionInfo());

    auto sender = client->accessibilityInfo(cetl::nullopt);

    StrictMock<MockFunction<void(const Client::GetAccessibilityInfo::Result&)>> receiver;
    EXPECT_CALL(receiver, Call(VariantWith<Error>(ErrorWith(ErrorKind::ConnectionError, "accessibility_info"))))
        .Times(1);
    submitTo(sender, receiver);
}

TEST_F(TestClient, companion_info)
{
    expectCompanion(true);

    const auto client = makeClient();
    EXPECT_THAT(client->companionInfo(),
                Optional(AllOf(Field(&PeerInfo::host, "10.0.0.7"),
                               Field(&PeerInfo::port, 10882),
                               Field(&PeerInfo::is_local, true))));
}

TEST_F(TestClient, approve_unknown_permission)
{
    expectCompanion(false);

    const auto client = makeClient();

    // Rejected before any channel is opened.
    auto sender = client->approve("com.example.app", {"camera", "microphone"});

    StrictMock<MockFunction<void(const Client::Approve::Result&)>> receiver;
    EXPECT_CALL(receiver,
                Call(VariantWith<Error>(
                    ErrorWith(ErrorKind::UnknownCapability, "approve", "Unknown permission 'microphone'."))))
        .Times(1);
    submitTo(sender, receiver);
}

TEST_F(TestClient, approve_unknown_permission_without_companion)
{
    EXPECT_CALL(*resolver_mock_, resolve(_))
        .WillOnce(Return(PeerResolver::Resolve::Result{Error{ErrorKind::PeerNotFound, "No companion."}}));

    const auto client = makeClient();

    auto sender = client->approve("com.example.app", {"location"});

    StrictMock<MockFunction<void(const Client::Approve::Result&)>> receiver;
    EXPECT_CALL(receiver, Call(VariantWith<Error>(ErrorWith(ErrorKind::UnknownCapability, "approve")))).Times(1);
    submitTo(sender, receiver);
}

TEST_F(TestClient, approve_too_long_bundle_id)
{
    expectCompanion(false);

    const auto client = makeClient();

    auto sender = client->approve(std::string(300, 'x'), {"photos"});

    // Rejected locally, before any stream is opened.
    StrictMock<MockFunction<void(const Client::Approve::Result&)>> receiver;
    EXPECT_CALL(receiver,
                Call(VariantWith<Error>(ErrorWith(ErrorKind::InvalidArgument, "approve", HasSubstr("too long")))))
        .Times(1);
    submitTo(sender, receiver);
}

TEST_F(TestClient, approve)
{
    expectCompanion(false);

    const auto client = makeClient();

    auto sender = client->approve("com.example.app", {"photos", "camera", "contacts"});

    StrictMock<MockFunction<void(const Client::Approve::Result&)>> receiver;

    expectChannel(*companion_router_mock_);
    submitTo(sender, receiver);

    // Permissions are sent in the order of their names.
    EXPECT_CALL(gateway_mock_,
                send(_,
                     PayloadWith<ApproveSpec::Request>(
                         mr_,
                         AllOf(ResultOf(
                                   [](const ApproveSpec::Request& request) {
                                       //
                                       return stringFrom(request.bundle_id);
                                   },
                                   "com.example.app"),
                               Field(&ApproveSpec::Request::permissions,
                                     ElementsAre(+ApproveSpec::Request::PERMISSION_CAMERA,
                                                 +ApproveSpec::Request::PERMISSION_CONTACTS,
                                                 +ApproveSpec::Request::PERMISSION_PHOTOS))))))
        .WillOnce(Return(0));
    gateway_mock_.emulateConnected();

    ApproveSpec::Response response{&mr_};
    response.fault.code = 1;
    devctl::common::assignString(response.fault.message, "App is not installed.", 256);

    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver,
                Call(VariantWith<Error>(ErrorWith(ErrorKind::TransportFault, "approve", "App is not installed."))))
        .Times(1);
    gateway_mock_.emulateMessage(response);
}

TEST_F(TestClient, add_media_remote)
{
    expectCompanion(false);

    const auto client = makeClient();

    auto sender = client->addMedia({"/tmp/a.jpg"});

    StrictMock<MockFunction<void(const Client::AddMedia::Result&)>> receiver;

    expectChannel(*companion_router_mock_);
    submitTo(sender, receiver);

    // Remote companion gets an archive of the files.
    StrictMock<ChunkSourceMock> chunk_source_mock;
    EXPECT_CALL(*generator_mock_, generate(ElementsAre("/tmp/a.jpg"), true))  //
        .WillOnce(InvokeWithoutArgs([&chunk_source_mock]() -> ChunkSource::Ptr {
            //
            return std::make_unique<ChunkSourceMock::Wrapper>(chunk_source_mock);
        }));
    gateway_mock_.emulateConnected();

    // Archive is pulled on the next executor turn.
    EXPECT_CALL(gateway_mock_, isBacklogged()).WillOnce(Return(false));
    EXPECT_CALL(chunk_source_mock, next()).WillOnce(Return(ChunkSource::Next::Failure{EACCES}));
    EXPECT_CALL(chunk_source_mock, deinit()).Times(1);
    EXPECT_CALL(gateway_mock_, complete(EIO)).Times(1);
    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    EXPECT_CALL(receiver, Call(VariantWith<Error>(ErrorWith(ErrorKind::UploadFailed, "add_media")))).Times(1);
    spin();
}

TEST_F(TestClient, add_media_concurrent_uploads)
{
    expectCompanion(true);

    const auto client = makeClient();

    // Every upload opens its own stream, even though both go over the same companion connection.
    StrictMock<GatewayMock> other_gateway_mock;
    EXPECT_CALL(*companion_router_mock_, makeGateway())
        .WillOnce(InvokeWithoutArgs([this]() -> Gateway::Ptr {
            //
            return std::make_shared<GatewayMock::Wrapper>(gateway_mock_);
        }))
        .WillOnce(InvokeWithoutArgs([&other_gateway_mock]() -> Gateway::Ptr {
            //
            return std::make_shared<GatewayMock::Wrapper>(other_gateway_mock);
        }));
    EXPECT_CALL(gateway_mock_, subscribe(_)).Times(1);
    EXPECT_CALL(other_gateway_mock, subscribe(_)).Times(1);

    auto photos_sender = client->addMedia({"/tmp/a.jpg"});
    auto movies_sender = client->addMedia({"/tmp/b.mov"});

    StrictMock<MockFunction<void(const Client::AddMedia::Result&)>> photos_receiver;
    StrictMock<MockFunction<void(const Client::AddMedia::Result&)>> movies_receiver;
    submitTo(photos_sender, photos_receiver);
    submitTo(movies_sender, movies_receiver);

    // Path and end of input on each stream.
    EXPECT_CALL(gateway_mock_, isBacklogged()).WillRepeatedly(Return(false));
    EXPECT_CALL(other_gateway_mock, isBacklogged()).WillRepeatedly(Return(false));
    EXPECT_CALL(gateway_mock_, send(_, _)).Times(2).WillRepeatedly(Return(0));
    EXPECT_CALL(other_gateway_mock, send(_, _)).Times(2).WillRepeatedly(Return(0));
    gateway_mock_.emulateConnected();
    other_gateway_mock.emulateConnected();
    spin();

    // Cancellation of one upload releases its own stream only.
    EXPECT_CALL(gateway_mock_, complete(ECANCELED)).Times(1);
    EXPECT_CALL(gateway_mock_, deinit()).Times(1);
    photos_sender.reset();

    const AddMediaSpec::Response ack{&mr_};
    EXPECT_CALL(other_gateway_mock, complete(0)).Times(1);
    EXPECT_CALL(other_gateway_mock, deinit()).Times(1);
    EXPECT_CALL(movies_receiver, Call(VariantWith<Client::AddMedia::Success>(_))).Times(1);
    other_gateway_mock.emulateMessage(ack);
}

TEST_F(TestClient, daemonCallNames)
{
    expectCompanion(true);

    const auto client = makeClient();
    EXPECT_THAT(client->daemonCallNames(), ElementsAre("describe", "list_targets", "terminate"));
}

TEST_F(TestClient, daemon_calls_share_connection)
{
    expectCompanion(true);

    const auto client = makeClient();

    // The daemon is started (and dialed) lazily, and only once.
    EXPECT_CALL(*spawner_mock_, startIfNeeded(false))  //
        .WillOnce(InvokeWithoutArgs([]() -> SenderOf<DaemonSpawner::Start::Result>::Ptr {
            //
            return just<DaemonSpawner::Start::Result>(cetl::monostate{});
        }));
    EXPECT_CALL(*dialer_mock_, dial("localhost", Client::DefaultPort))
        .WillOnce(Return(Dialer::Dial::Result{ClientRouter::Ptr{daemon_router_mock_}}));

    for (int i = 0; i < 2; ++i)
    {
        auto sender = client->listTargets();

        StrictMock<MockFunction<void(const Client::ListTargets::Result&)>> receiver;

        expectChannel(*daemon_router_mock_);
        submitTo(sender, receiver);

        EXPECT_CALL(gateway_mock_, send(_, _)).WillOnce(Return(0));
        gateway_mock_.emulateConnected();

        EXPECT_CALL(gateway_mock_, deinit()).Times(1);
        EXPECT_CALL(receiver, Call(VariantWith<Client::ListTargets::Success>(IsEmpty()))).Times(1);
        gateway_mock_.emulateCompleted();

        testing::Mock::VerifyAndClearExpectations(&gateway_mock_);
    }
}

TEST_F(TestClient, daemon_unavailable)
{
    expectCompanion(true);

    const auto client = makeClient();

    EXPECT_CALL(*spawner_mock_, startIfNeeded(false))  //
        .WillOnce(InvokeWithoutArgs([]() -> SenderOf<DaemonSpawner::Start::Result>::Ptr {
            //
            return just<DaemonSpawner::Start::Result>(ENOENT);
        }));

    auto sender = client->terminate("com.example.app");

    StrictMock<MockFunction<void(const Client::Terminate::Result&)>> receiver;
    EXPECT_CALL(receiver,
                Call(VariantWith<Error>(
                    ErrorWith(ErrorKind::DaemonUnavailable, "terminate", HasSubstr("Failed to start daemon")))))
        .Times(1);
    submitTo(sender, receiver);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
