//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_SDK_PEER_RESOLVER_HPP_INCLUDED
#define DEVCTL_SDK_PEER_RESOLVER_HPP_INCLUDED

#include "errors.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>

namespace devctl
{
namespace sdk
{

/// Resolves a device identifier to its companion peer.
///
class PeerResolver
{
public:
    using Ptr = std::shared_ptr<PeerResolver>;

    /// Makes resolver which looks up companions in a TOML registry file.
    ///
    /// The file is (re)read on every `resolve` call. Its format:
    /// ```toml
    /// [[companion]]
    /// udid     = "00008030-001A"
    /// host     = "127.0.0.1"
    /// port     = 10882
    /// is_local = true
    /// ```
    ///
    CETL_NODISCARD static Ptr make(std::string registry_file_path);

    /// Gets path of the companion registry file - `DEVCTL_COMPANIONS_FILE` env var,
    /// or `/tmp/devctl/companions.toml` by default.
    ///
    static std::string defaultRegistryFilePath();

    // No copy/move semantics.
    PeerResolver(PeerResolver&&)                 = delete;
    PeerResolver(const PeerResolver&)            = delete;
    PeerResolver& operator=(PeerResolver&&)      = delete;
    PeerResolver& operator=(const PeerResolver&) = delete;

    virtual ~PeerResolver() = default;

    struct Resolve final
    {
        using Success = PeerInfo;
        using Failure = Error;  // always `ErrorKind::PeerNotFound`
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Resolves the companion of the given device.
    ///
    /// @param device_id Identifier of the device. If empty, the one and only known companion is resolved.
    ///
    virtual Resolve::Result resolve(const cetl::optional<std::string>& device_id) = 0;

protected:
    PeerResolver() = default;

};  // PeerResolver

}  // namespace sdk
}  // namespace devctl

#endif  // DEVCTL_SDK_PEER_RESOLVER_HPP_INCLUDED
