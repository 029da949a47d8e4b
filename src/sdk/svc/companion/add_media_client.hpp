//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_SVC_COMPANION_ADD_MEDIA_CLIENT_HPP_INCLUDED
#define DEVCTL_SDK_SVC_COMPANION_ADD_MEDIA_CLIENT_HPP_INCLUDED

#include "ipc/client_router.hpp"
#include "svc/companion/add_media_spec.hpp"
#include "svc/svc_types.hpp"

#include <devctl/sdk/archive_generator.hpp>
#include <devctl/sdk/execution.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <string>
#include <vector>

namespace devctl
{
namespace sdk
{
namespace svc
{
namespace companion
{

/// Defines interface of the 'Companion: Add Media' streaming upload client.
///
/// The upload stream (an IPC channel) is opened on submit, and is owned by the client:
/// it's released on completion, failure, or destruction of the client (which aborts the upload).
/// Items are sent one per executor turn, so the upload never holds up other work of the executor.
///
class AddMediaClient : public SenderOf<ResultOf<cetl::monostate>>
{
public:
    using Spec    = common::svc::companion::AddMediaSpec;
    using Success = cetl::monostate;
    using Result  = ResultOf<Success>;
    using Ptr     = SenderOf<Result>::Ptr;

    /// @param is_local If `true`, the paths are sent as is (the companion reads the files itself),
    ///                 otherwise an archive of the files is streamed in chunks.
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&    memory,
                                   libcyphal::IExecutor&          executor,
                                   common::ipc::ClientRouter::Ptr ipc_router,
                                   std::vector<std::string>       paths,
                                   const bool                     is_local,
                                   ArchiveGenerator::Ptr          archive_generator);

    AddMediaClient(AddMediaClient&&)                 = delete;
    AddMediaClient(const AddMediaClient&)            = delete;
    AddMediaClient& operator=(AddMediaClient&&)      = delete;
    AddMediaClient& operator=(const AddMediaClient&) = delete;

    ~AddMediaClient() override = default;

protected:
    AddMediaClient() = default;

};  // AddMediaClient

}  // namespace companion
}  // namespace svc
}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_SVC_COMPANION_ADD_MEDIA_CLIENT_HPP_INCLUDED
