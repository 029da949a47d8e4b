//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <devctl/sdk/client.hpp>

#include "call_boundary.hpp"
#include "common_helpers.hpp"
#include "connection_manager.hpp"
#include "daemon_calls.hpp"
#include "logging.hpp"
#include "sdk_factory.hpp"
#include "svc/companion/add_media_client.hpp"
#include "svc/companion/companion_clients.hpp"
#include "svc/svc_types.hpp"

#include "devctl/common/svc/companion/Point_0_1.hpp"

#include <devctl/sdk/archive_generator.hpp>
#include <devctl/sdk/daemon_spawner.hpp>
#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>
#include <devctl/sdk/peer_resolver.hpp>
#include <devctl/sdk/types.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace devctl
{
namespace sdk
{

constexpr std::uint16_t Client::DefaultPort;

namespace
{

using svc::companion::AccessibilityInfoClient;
using svc::companion::AccessibilityInfoSpec;
using svc::companion::AddMediaClient;
using svc::companion::ApproveClient;
using svc::companion::ApproveSpec;
using svc::companion::ListAppsClient;
using svc::companion::ListAppsSpec;

struct PermissionEntry
{
    const char*  name;
    std::uint8_t code;
};

constexpr std::array<PermissionEntry, 3> Permissions{{
    {"photos", ApproveSpec::Request::PERMISSION_PHOTOS},
    {"camera", ApproveSpec::Request::PERMISSION_CAMERA},
    {"contacts", ApproveSpec::Request::PERMISSION_CONTACTS},
}};

cetl::optional<std::uint8_t> findPermission(const std::string& name)
{
    for (const auto& entry : Permissions)
    {
        if (name == entry.name)
        {
            return entry.code;
        }
    }
    return cetl::nullopt;
}

class ClientImpl final : public Client
{
public:
    ClientImpl(cetl::pmr::memory_resource& memory,
               libcyphal::IExecutor&       executor,
               const Params&               params,
               Collaborators&&             collaborators,
               Dialer::Ptr                 dialer)
        : memory_{memory}
        , executor_{executor}
        , logger_{params.logger ? params.logger : common::getLogger("sdk")}
        , collaborators_{std::move(collaborators)}
    {
        if (!collaborators_.peer_resolver)
        {
            collaborators_.peer_resolver = PeerResolver::make(PeerResolver::defaultRegistryFilePath());
        }
        if (!collaborators_.daemon_spawner)
        {
            collaborators_.daemon_spawner =
                DaemonSpawner::make(executor, DaemonSpawner::Params::fromEnvironment(params.host, params.port));
        }
        if (!collaborators_.archive_generator)
        {
            collaborators_.archive_generator = ArchiveGenerator::make();
        }

        const ConnectionManager::Params connection_params{params.host,
                                                          params.port,
                                                          params.device_id,
                                                          params.force_restart_daemon};
        connections_ = ConnectionManager::make(connection_params, collaborators_.daemon_spawner, std::move(dialer));

        connections_->connectCompanion(*collaborators_.peer_resolver);
        if (const auto* const companion =
                cetl::get_if<ConnectionManager::Companion::Success>(&connections_->companionConnection()))
        {
            companion_info_ = companion->peer;
        }

        daemon_calls_ = bindDaemonCalls({memory_, connections_, logger_});
    }

    ClientImpl(ClientImpl&&)                 = delete;
    ClientImpl(const ClientImpl&)            = delete;
    ClientImpl& operator=(ClientImpl&&)      = delete;
    ClientImpl& operator=(const ClientImpl&) = delete;

    ~ClientImpl() override = default;

    // Client

    const cetl::optional<PeerInfo>& companionInfo() const override
    {
        return companion_info_;
    }

    std::vector<std::string> daemonCallNames() const override
    {
        std::vector<std::string> names;
        for (const auto& descriptor : daemonCallRegistry())
        {
            names.emplace_back(descriptor.name);
        }
        return names;
    }

    void invalidateDaemonConnection() override
    {
        connections_->invalidateDaemonConnection();
    }

    SenderOf<ListApps::Result>::Ptr listApps() override
    {
        return viaCompanion<ListApps>("list_apps", [this](const CompanionConnection& companion) {
            //
            return ListAppsClient::make(companion.router, ListAppsSpec::Request{&memory_});
        });
    }

    SenderOf<GetAccessibilityInfo::Result>::Ptr accessibilityInfo(const cetl::optional<Point>& point) override
    {
        return viaCompanion<GetAccessibilityInfo>("accessibility_info", [this, point](const CompanionConnection& companion) {
            //
            AccessibilityInfoSpec::Request request{&memory_};
            if (point)
            {
                common::svc::companion::Point_0_1 dsdl_point{&memory_};
                dsdl_point.x = point->x;
                dsdl_point.y = point->y;
                request.point.push_back(dsdl_point);
            }
            return AccessibilityInfoClient::make(companion.router, request);
        });
    }

    SenderOf<AddMedia::Result>::Ptr addMedia(const std::vector<std::string>& paths) override
    {
        return viaCompanion<AddMedia>("add_media", [this, &paths](const CompanionConnection& companion) {
            //
            return AddMediaClient::make(memory_,
                                        executor_,
                                        companion.router,
                                        paths,
                                        companion.peer.is_local,
                                        collaborators_.archive_generator);
        });
    }

    SenderOf<Approve::Result>::Ptr approve(const std::string&           bundle_id,
                                           const std::set<std::string>& permissions) override
    {
        ApproveSpec::Request request{&memory_};
        for (const auto& name : permissions)
        {
            const auto code = findPermission(name);
            if (!code)
            {
                return failed<Approve>("approve",
                                       Error{ErrorKind::UnknownCapability,
                                             fmt::format("Unknown permission '{}'.", name)});
            }
            request.permissions.push_back(*code);
        }
        if (!common::assignString(request.bundle_id,
                                  bundle_id,
                                  ApproveSpec::Request::_traits_::ArrayCapacity::bundle_id))
        {
            return failed<Approve>("approve",
                                   Error{ErrorKind::InvalidArgument,
                                         fmt::format("Bundle id is too long ({} bytes).", bundle_id.size())});
        }

        return viaCompanion<Approve>("approve", [request](const CompanionConnection& companion) {
            //
            return ApproveClient::make(companion.router, request);
        });
    }

    SenderOf<Describe::Result>::Ptr describe() override
    {
        return daemon_calls_.describe();
    }

    SenderOf<ListTargets::Result>::Ptr listTargets() override
    {
        return daemon_calls_.list_targets();
    }

    SenderOf<Terminate::Result>::Ptr terminate(const std::string& bundle_id) override
    {
        return daemon_calls_.terminate(bundle_id);
    }

private:
    template <typename Op>
    typename SenderOf<typename Op::Result>::Ptr failed(const char* const op_name, Error&& error)
    {
        using SvcResult = svc::ResultOf<typename Op::Success>;
        return withCallBoundary<Op>(op_name, logger_, just<SvcResult>(svc::Failure{std::move(error)}));
    }

    /// Performs a direct companion operation, or fails it (with the stored failure) if there is no companion.
    ///
    template <typename Op, typename MakeSvcOp>
    typename SenderOf<typename Op::Result>::Ptr viaCompanion(const char* const op_name, MakeSvcOp&& make_svc_op)
    {
        const auto& companion = connections_->companionConnection();
        if (const auto* const error = cetl::get_if<ConnectionManager::Companion::Failure>(&companion))
        {
            return failed<Op>(op_name, Error{*error});
        }
        return withCallBoundary<Op>(op_name,
                                    logger_,
                                    std::forward<MakeSvcOp>(make_svc_op)(
                                        cetl::get<ConnectionManager::Companion::Success>(companion)));
    }

    cetl::pmr::memory_resource& memory_;
    libcyphal::IExecutor&       executor_;
    common::LoggerPtr           logger_;
    Collaborators               collaborators_;
    ConnectionManager::Ptr      connections_;
    cetl::optional<PeerInfo>    companion_info_;
    DaemonCalls                 daemon_calls_;

};  // ClientImpl

}  // namespace

CETL_NODISCARD Client::Ptr Factory::makeClient(cetl::pmr::memory_resource& memory,
                                               libcyphal::IExecutor&       executor,
                                               const Client::Params&       params,
                                               Client::Collaborators       collaborators,
                                               Dialer::Ptr                 dialer)
{
    return std::make_shared<ClientImpl>(memory, executor, params, std::move(collaborators), std::move(dialer));
}

CETL_NODISCARD Client::Ptr Client::make(cetl::pmr::memory_resource& memory,
                                        libcyphal::IExecutor&       executor,
                                        const Params&               params,
                                        Collaborators               collaborators)
{
    return Factory::makeClient(memory, executor, params, std::move(collaborators), Dialer::make(memory, executor));
}

int Client::killAllKnownDaemons()
{
    const auto params = DaemonSpawner::Params::fromEnvironment("localhost", DefaultPort);
    return DaemonSpawner::killAll(params.pid_file_path);
}

}  // namespace sdk
}  // namespace devctl
