//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "call_boundary.hpp"

#include "ipc/ipc_types.hpp"
#include "svc/svc_types.hpp"

#include <devctl/sdk/errors.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstring>
#include <string>
#include <utility>

namespace devctl
{
namespace sdk
{

Error translateFailure(const std::string& op_name, svc::Failure&& failure)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [&op_name](svc::RemoteFault& remote) {
                //
                auto message = !remote.message.empty()  //
                                   ? std::move(remote.message)
                                   : fmt::format("Remote fault (code={}).", remote.code);
                return Error{ErrorKind::TransportFault, std::move(message), op_name};
            },
            [&op_name](const svc::ChannelFault& channel) {
                //
                const auto err = channel.error_code;
                if (err == static_cast<int>(common::ipc::ErrorCode::NotConnected))
                {
                    return Error{ErrorKind::ConnectionError, "Peer is not connected.", op_name};
                }
                return Error{ErrorKind::ProtocolFault,
                             fmt::format("Channel fault (err={}): {}.", err, std::strerror(err)),
                             op_name};
            },
            [&op_name](Error& error) {
                //
                if (error.op_name.empty())
                {
                    error.op_name = op_name;
                }
                return std::move(error);
            }),
        failure);
}

}  // namespace sdk
}  // namespace devctl
