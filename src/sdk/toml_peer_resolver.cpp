//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <devctl/sdk/peer_resolver.hpp>

#include "logging.hpp"

#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/types.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
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

class TomlPeerResolver final : public PeerResolver
{
public:
    explicit TomlPeerResolver(std::string registry_file_path)
        : registry_file_path_{std::move(registry_file_path)}
        , logger_{common::getLogger("sdk")}
    {
    }

    // PeerResolver

    Resolve::Result resolve(const cetl::optional<std::string>& device_id) override
    {
        std::vector<PeerInfo> companions;
        try
        {
            companions = readRegistry();

        } catch (const std::exception& ex)
        {
            return Error{ErrorKind::PeerNotFound,
                         fmt::format("Failed to read companion registry '{}': {}", registry_file_path_, ex.what())};
        }
        logger_->debug("Read {} companion(s) from '{}'.", companions.size(), registry_file_path_);

        if (!device_id)
        {
            if (companions.size() != 1)
            {
                return Error{ErrorKind::PeerNotFound,
                             fmt::format("Expected exactly one registered companion, found {}.", companions.size())};
            }
            return std::move(companions.front());
        }

        for (auto& companion : companions)
        {
            if (companion.device_id && (*companion.device_id == *device_id))
            {
                return std::move(companion);
            }
        }
        return Error{ErrorKind::PeerNotFound, fmt::format("No companion for device '{}'.", *device_id)};
    }

private:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    /// Throws on unreadable or malformed registry (including missing or mistyped entry fields).
    ///
    std::vector<PeerInfo> readRegistry() const
    {
        const auto root = toml::parse<TomlConf>(registry_file_path_);

        std::vector<PeerInfo> companions;
        if (!root.contains("companion"))
        {
            return companions;
        }
        for (const auto& entry : toml::find(root, "companion").as_array())
        {
            PeerInfo peer;
            peer.device_id = toml::find<std::string>(entry, "udid");
            peer.host      = toml::find<std::string>(entry, "host");
            peer.port      = toml::find<std::uint16_t>(entry, "port");
            peer.is_local  = toml::find_or<bool>(entry, "is_local", false);
            companions.push_back(std::move(peer));
        }
        return companions;
    }

    const std::string registry_file_path_;
    common::LoggerPtr logger_;

};  // TomlPeerResolver

}  // namespace

CETL_NODISCARD PeerResolver::Ptr PeerResolver::make(std::string registry_file_path)
{
    return std::make_shared<TomlPeerResolver>(std::move(registry_file_path));
}

std::string PeerResolver::defaultRegistryFilePath()
{
    if (const char* const file_path = std::getenv("DEVCTL_COMPANIONS_FILE"))
    {
        return file_path;
    }
    return "/tmp/devctl/companions.toml";
}

}  // namespace sdk
}  // namespace devctl
