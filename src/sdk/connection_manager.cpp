//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "connection_manager.hpp"

#include "logging.hpp"

#include <devctl/sdk/daemon_spawner.hpp>
#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>
#include <devctl/sdk/peer_resolver.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace devctl
{
namespace sdk
{
namespace
{

class ConnectionManagerImpl final : public ConnectionManager,
                                    public std::enable_shared_from_this<ConnectionManagerImpl>
{
public:
    ConnectionManagerImpl(const Params& params, DaemonSpawner::Ptr daemon_spawner, Dialer::Ptr dialer)
        : params_{params}
        , daemon_spawner_{std::move(daemon_spawner)}
        , dialer_{std::move(dialer)}
        , logger_{common::getLogger("sdk")}
        , state_{State::Idle}
        , force_restart_pending_{params.force_restart_daemon}
        , companion_{Error{ErrorKind::PeerNotFound, "Companion is not resolved."}}
    {
        CETL_DEBUG_ASSERT(daemon_spawner_, "");
        CETL_DEBUG_ASSERT(dialer_, "");
    }

    ConnectionManagerImpl(ConnectionManagerImpl&&)                 = delete;
    ConnectionManagerImpl(const ConnectionManagerImpl&)            = delete;
    ConnectionManagerImpl& operator=(ConnectionManagerImpl&&)      = delete;
    ConnectionManagerImpl& operator=(const ConnectionManagerImpl&) = delete;

    ~ConnectionManagerImpl() override = default;

    // ConnectionManager

    SenderOf<Provide::Result>::Ptr provideDaemonConnection() override
    {
        return std::make_unique<ProvideSender>(shared_from_this());
    }

    void invalidateDaemonConnection() override
    {
        if (connection_)
        {
            logger_->info("Daemon connection is invalidated.");
            connection_.reset();
        }
    }

    void connectCompanion(PeerResolver& peer_resolver) override
    {
        auto resolved = peer_resolver.resolve(params_.device_id);
        if (auto* const error = cetl::get_if<PeerResolver::Resolve::Failure>(&resolved))
        {
            // Not fatal - daemon operations are still usable without companion.
            logger_->info("No companion: {}", *error);
            companion_ = std::move(*error);
            return;
        }
        auto peer = cetl::get<PeerResolver::Resolve::Success>(std::move(resolved));
        logger_->info("Using companion at '{}:{}' (local={}).", peer.host, peer.port, peer.is_local);

        auto dialed = dialer_->dial(peer.host, peer.port);
        if (const auto* const err = cetl::get_if<Dialer::Dial::Failure>(&dialed))
        {
            auto message = fmt::format("Failed to connect companion at '{}:{}': {}.",  //
                                       peer.host,
                                       peer.port,
                                       std::strerror(*err));
            logger_->warn("{}", message);
            companion_ = Error{ErrorKind::ConnectionError, std::move(message)};
            return;
        }
        companion_ = CompanionConnection{cetl::get<Dialer::Dial::Success>(std::move(dialed)), std::move(peer)};
    }

    const Companion::Result& companionConnection() const override
    {
        return companion_;
    }

private:
    enum class State : std::uint8_t
    {
        Idle,
        Starting,
    };

    struct Waiter final
    {
        std::function<void(Provide::Result&&)> receiver;
    };

    class ProvideSender final : public SenderOf<Provide::Result>
    {
    public:
        explicit ProvideSender(std::shared_ptr<ConnectionManagerImpl> manager)
            : manager_{std::move(manager)}
        {
        }

    protected:
        void submitImpl(std::function<void(Provide::Result&&)>&& receiver) override
        {
            waiter_ = std::make_shared<Waiter>(Waiter{std::move(receiver)});
            manager_->enqueue(waiter_);
        }

    private:
        std::shared_ptr<ConnectionManagerImpl> manager_;
        std::shared_ptr<Waiter>                waiter_;

    };  // ProvideSender

    static void deliver(Waiter& waiter, Provide::Result&& result)
    {
        auto receiver = std::move(waiter.receiver);
        if (receiver)
        {
            receiver(std::move(result));
        }
    }

    void enqueue(const std::shared_ptr<Waiter>& waiter)
    {
        if (connection_)
        {
            logger_->trace("Providing cached daemon connection.");
            deliver(*waiter, *connection_);
            return;
        }

        waiters_.push_back(waiter);
        if (state_ == State::Idle)
        {
            beginAttempt();
        }
        else
        {
            logger_->trace("Joining daemon connection attempt in flight (waiters={}).", waiters_.size());
        }
    }

    void beginAttempt()
    {
        state_ = State::Starting;

        logger_->debug("Ensuring daemon is running (force_restart={})...", force_restart_pending_);

        start_op_ = daemon_spawner_->startIfNeeded(force_restart_pending_);
        start_op_->submit([this](DaemonSpawner::Start::Result&& result) {
            //
            onDaemonStarted(std::move(result));
        });
    }

    void onDaemonStarted(DaemonSpawner::Start::Result&& result)
    {
        // Receivers may start a new attempt, so the finished one is released before them.
        start_op_.reset();

        if (const auto* const err = cetl::get_if<DaemonSpawner::Start::Failure>(&result))
        {
            complete(Error{ErrorKind::DaemonUnavailable, fmt::format("Failed to start daemon: {}.", std::strerror(*err))});
            return;
        }
        // Restart is forced only once per facade; next attempts reuse a running daemon.
        force_restart_pending_ = false;

        auto dialed = dialer_->dial(params_.host, params_.port);
        if (const auto* const err = cetl::get_if<Dialer::Dial::Failure>(&dialed))
        {
            complete(Error{ErrorKind::ConnectionError,
                           fmt::format("Failed to connect daemon at '{}:{}': {}.",
                                       params_.host,
                                       params_.port,
                                       std::strerror(*err))});
            return;
        }

        logger_->debug("Connected daemon at '{}:{}'.", params_.host, params_.port);
        connection_ = DaemonConnection{cetl::get<Dialer::Dial::Success>(std::move(dialed)), params_.device_id};
        complete(*connection_);
    }

    void complete(Provide::Result&& result)
    {
        state_ = State::Idle;

        if (const auto* const error = cetl::get_if<Provide::Failure>(&result))
        {
            logger_->warn("Daemon connection attempt failed (waiters={}): {}", waiters_.size(), *error);
        }

        // Receivers may issue new requests, so the current list of waiters is detached first.
        std::vector<std::weak_ptr<Waiter>> waiters;
        std::swap(waiters, waiters_);
        for (const auto& weak_waiter : waiters)
        {
            if (const auto waiter = weak_waiter.lock())
            {
                deliver(*waiter, Provide::Result{result});
            }
        }
    }

    const Params                                params_;
    DaemonSpawner::Ptr                          daemon_spawner_;
    Dialer::Ptr                                 dialer_;
    common::LoggerPtr                           logger_;
    State                                       state_;
    bool                                        force_restart_pending_;
    cetl::optional<DaemonConnection>            connection_;
    std::vector<std::weak_ptr<Waiter>>          waiters_;
    SenderOf<DaemonSpawner::Start::Result>::Ptr start_op_;
    Companion::Result                           companion_;

};  // ConnectionManagerImpl

}  // namespace

CETL_NODISCARD ConnectionManager::Ptr ConnectionManager::make(const Params&      params,
                                                              DaemonSpawner::Ptr daemon_spawner,
                                                              Dialer::Ptr        dialer)
{
    return std::make_shared<ConnectionManagerImpl>(params, std::move(daemon_spawner), std::move(dialer));
}

}  // namespace sdk
}  // namespace devctl
