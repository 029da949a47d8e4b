//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "add_media_client.hpp"

#include "common_helpers.hpp"
#include "ipc/channel.hpp"
#include "ipc/client_router.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"
#include "svc/companion/add_media_spec.hpp"
#include "svc/svc_types.hpp"

#include "devctl/common/svc/companion/MediaChunk_0_1.hpp"
#include "devctl/common/svc/companion/MediaFilePath_0_1.hpp"

#include <devctl/platform/posix_executor_extension.hpp>
#include <devctl/sdk/archive_generator.hpp>
#include <devctl/sdk/errors.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
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
namespace svc
{
namespace companion
{
namespace
{

class AddMediaClientImpl final : public AddMediaClient
{
public:
    AddMediaClientImpl(cetl::pmr::memory_resource&    memory,
                       libcyphal::IExecutor&          executor,
                       common::ipc::ClientRouter::Ptr ipc_router,
                       std::vector<std::string>       paths,
                       const bool                     is_local,
                       ArchiveGenerator::Ptr          archive_generator)
        : memory_{memory}
        , executor_{executor}
        , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
        , logger_{common::getLogger("svc")}
        , ipc_router_{std::move(ipc_router)}
        , paths_{std::move(paths)}
        , is_local_{is_local}
        , archive_generator_{std::move(archive_generator)}
        , state_{State::Idle}
        , sent_items_{0}
    {
        CETL_DEBUG_ASSERT(ipc_router_, "");
    }

    AddMediaClientImpl(AddMediaClientImpl&&)                 = delete;
    AddMediaClientImpl(const AddMediaClientImpl&)            = delete;
    AddMediaClientImpl& operator=(AddMediaClientImpl&&)      = delete;
    AddMediaClientImpl& operator=(const AddMediaClientImpl&) = delete;

    ~AddMediaClientImpl() override
    {
        if (channel_)
        {
            logger_->debug("AddMediaClient: upload is canceled (state={}, sent={}).",
                           static_cast<int>(state_),
                           sent_items_);
            channel_->complete(static_cast<int>(common::ipc::ErrorCode::Canceled));
        }
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        CETL_DEBUG_ASSERT(state_ == State::Idle, "Upload could be submitted only once.");

        receiver_ = std::move(receiver);

        channel_.emplace(ipc_router_->makeChannel<Channel>(Spec::svc_full_name()));
        state_ = State::StreamOpen;

        channel_->subscribe([this](const auto& event_var) {
            //
            cetl::visit([this](const auto& event) { handleEvent(event); }, event_var);
        });
    }

private:
    using Channel  = common::ipc::Channel<Spec::Response, Spec::Request>;
    using Schedule = libcyphal::IExecutor::Callback::Schedule;

    enum class State : std::uint8_t
    {
        Idle,
        StreamOpen,
        Sending,
        AwaitingAck,
        Ended,
    };

    /// Delay of the next attempt when either the connection is backlogged,
    /// or the archive is not ready (and there is nothing to await).
    static constexpr std::chrono::milliseconds RetryPeriod{10};

    static Failure uploadFailed(std::string message)
    {
        return Error{ErrorKind::UploadFailed, std::move(message)};
    }

    void handleEvent(const Channel::Connected& connected)
    {
        logger_->trace("AddMediaClient::handleEvent({}).", connected);

        if (state_ != State::StreamOpen)
        {
            return;
        }
        state_ = State::Sending;

        if (!is_local_)
        {
            if (!archive_generator_)
            {
                finish(uploadFailed("No archive generator."), EIO);
                return;
            }
            chunk_source_ = archive_generator_->generate(paths_, true);
            if (!chunk_source_)
            {
                finish(uploadFailed("Failed to start media archiving."), EIO);
                return;
            }
        }

        step_callback_ = executor_.registerCallback([this](const auto&) {
            //
            sendNextItem();
        });
        scheduleNextItem(executor_.now());
    }

    void handleEvent(const Channel::Input& input)
    {
        logger_->trace("AddMediaClient::handleEvent(Input).");

        if (state_ != State::AwaitingAck)
        {
            if (state_ != State::Ended)
            {
                finish(uploadFailed("Unexpected response before the end of input."), EPROTO);
            }
            return;
        }

        if (auto failure = remoteFaultOf(input.fault))
        {
            finish(std::move(*failure), 0);
            return;
        }
        finish(Success{}, 0);
    }

    void handleEvent(const Channel::Completed& completed)
    {
        logger_->debug("AddMediaClient::handleEvent({}).", completed);

        if (state_ == State::Ended)
        {
            return;
        }
        const auto err = static_cast<int>(completed.error_code);
        finish(uploadFailed(fmt::format("Upload stream is completed before acknowledgment (err={}).", err)), 0);
    }

    void scheduleNextItem(const libcyphal::TimePoint exec_time)
    {
        step_callback_.schedule(Schedule::Once{exec_time});
    }

    void sendNextItem()
    {
        if (channel_->isBacklogged())
        {
            logger_->trace("AddMediaClient: connection is backlogged (sent={}).", sent_items_);
            scheduleNextItem(executor_.now() + RetryPeriod);
            return;
        }

        if (is_local_)
        {
            sendNextPath();
        }
        else
        {
            sendNextChunk();
        }
    }

    void sendNextPath()
    {
        using MediaFilePath = common::svc::companion::MediaFilePath_0_1;

        if (sent_items_ == paths_.size())
        {
            sendEndOfInput();
            return;
        }
        const auto& path = paths_[sent_items_];

        Spec::Request request{&memory_};
        auto&         file_path = request.set_file_path();
        if (!common::assignString(file_path.value, path, MediaFilePath::_traits_::ArrayCapacity::value))
        {
            finish(uploadFailed(fmt::format("Too long media path '{}'.", path)), EIO);
            return;
        }
        if (const int err = channel_->send(request))
        {
            finish(uploadFailed(fmt::format("Failed to send media path '{}': {}.", path, std::strerror(err))), EIO);
            return;
        }
        ++sent_items_;
        scheduleNextItem(executor_.now());
    }

    void sendNextChunk()
    {
        using Next = ChunkSource::Next;

        auto next = chunk_source_->next();
        cetl::visit(cetl::make_overloaded(
                        [this](const Next::Chunk& chunk) {
                            //
                            sendChunk(chunk);
                        },
                        [this](const Next::Pending& pending) {
                            //
                            awaitChunk(pending.fd);
                        },
                        [this](const Next::End&) {
                            //
                            chunk_source_.reset();
                            sendEndOfInput();
                        },
                        [this](const Next::Failure err) {
                            //
                            finish(uploadFailed(fmt::format("Failed to archive media: {}.", std::strerror(err))), EIO);
                        }),
                    next);
    }

    void sendChunk(const ChunkSource::Next::Chunk& chunk)
    {
        using MediaChunk = common::svc::companion::MediaChunk_0_1;

        if (chunk.size() > MediaChunk::_traits_::ArrayCapacity::data)
        {
            finish(uploadFailed(fmt::format("Too big media chunk (size={}).", chunk.size())), EIO);
            return;
        }

        Spec::Request request{&memory_};
        auto&         data = request.set_chunk().data;
        data.reserve(chunk.size());
        for (const auto byte : chunk)
        {
            data.push_back(byte);
        }
        if (const int err = channel_->send(request))
        {
            finish(uploadFailed(fmt::format("Failed to send media chunk #{}: {}.", sent_items_, std::strerror(err))),
                   EIO);
            return;
        }
        ++sent_items_;
        scheduleNextItem(executor_.now());
    }

    void awaitChunk(const int fd)
    {
        if ((fd < 0) || (posix_executor_ext_ == nullptr))
        {
            scheduleNextItem(executor_.now() + RetryPeriod);
            return;
        }

        ready_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
            [this](const auto&) {
                //
                ready_callback_.reset();
                sendNextItem();
            },
            platform::IPosixExecutorExtension::Trigger::Readable{fd});
    }

    void sendEndOfInput()
    {
        step_callback_.reset();

        Spec::Request request{&memory_};
        request.set_end_of_input();
        if (const int err = channel_->send(request))
        {
            finish(uploadFailed(fmt::format("Failed to send end of input: {}.", std::strerror(err))), err);
            return;
        }

        logger_->debug("AddMediaClient: sent {} item(s), awaiting acknowledgment.", sent_items_);
        state_ = State::AwaitingAck;
    }

    void finish(Result&& result, const int completion_err)
    {
        CETL_DEBUG_ASSERT(receiver_, "");

        state_ = State::Ended;
        ready_callback_.reset();
        step_callback_.reset();
        chunk_source_.reset();
        if (channel_)
        {
            channel_->complete(completion_err);
            channel_.reset();
        }

        // The receiver is free to destroy this client, so nothing should be touched after the call.
        auto receiver = std::move(receiver_);
        receiver(std::move(result));
    }

    cetl::pmr::memory_resource&              memory_;
    libcyphal::IExecutor&                    executor_;
    platform::IPosixExecutorExtension* const posix_executor_ext_;
    common::LoggerPtr                        logger_;
    common::ipc::ClientRouter::Ptr           ipc_router_;
    std::vector<std::string>                 paths_;
    const bool                               is_local_;
    ArchiveGenerator::Ptr                    archive_generator_;
    State                                    state_;
    std::size_t                              sent_items_;
    cetl::optional<Channel>                  channel_;
    ChunkSource::Ptr                         chunk_source_;
    libcyphal::IExecutor::Callback::Any      step_callback_;
    libcyphal::IExecutor::Callback::Any      ready_callback_;
    std::function<void(Result&&)>            receiver_;

};  // AddMediaClientImpl

constexpr std::chrono::milliseconds AddMediaClientImpl::RetryPeriod;

}  // namespace

CETL_NODISCARD AddMediaClient::Ptr AddMediaClient::make(cetl::pmr::memory_resource&    memory,
                                                        libcyphal::IExecutor&          executor,
                                                        common::ipc::ClientRouter::Ptr ipc_router,
                                                        std::vector<std::string>       paths,
                                                        const bool                     is_local,
                                                        ArchiveGenerator::Ptr          archive_generator)
{
    return std::make_unique<AddMediaClientImpl>(memory,
                                                executor,
                                                std::move(ipc_router),
                                                std::move(paths),
                                                is_local,
                                                std::move(archive_generator));
}

}  // namespace companion
}  // namespace svc
}  // namespace sdk
}  // namespace devctl
