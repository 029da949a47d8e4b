//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "setup_logging.hpp"

#include <devctl/platform/executor.hpp>
#include <devctl/sdk/client.hpp>
#include <devctl/sdk/errors.hpp>
#include <devctl/sdk/execution.hpp>
#include <devctl/sdk/types.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace
{

using devctl::sdk::Client;
using Executor = devctl::platform::SingleThreadedExecutor;

struct CliArgs
{
    Client::Params           params;
    std::string              command;
    std::vector<std::string> operands;
};

void printUsage()
{
    std::cerr << "Usage: devctl [options] <command> [operands...]\n"
                 "\n"
                 "Options:\n"
                 "  --host <host>             Daemon host (default 'localhost'), or 'unix:<path>'.\n"
                 "  --port <port>             Daemon port (default "
              << Client::DefaultPort
              << ").\n"
                 "  --udid <device-id>        Target device (default is the only registered companion).\n"
                 "  --force-restart-daemon    Restart the daemon before the first daemon command.\n"
                 "\n"
                 "Commands:\n"
                 "  list-apps\n"
                 "  accessibility-info [<x> <y>]\n"
                 "  add-media <path>...\n"
                 "  approve <bundle-id> <photos|camera|contacts>...\n"
                 "  describe\n"
                 "  list-targets\n"
                 "  terminate <bundle-id>\n"
                 "  kill\n";
}

bool parsePort(const std::string& str, std::uint16_t& port)
{
    char*      end   = nullptr;
    const auto value = std::strtoul(str.c_str(), &end, 10);  // NOLINT(*-magic-numbers)
    if (str.empty() || (*end != '\0') || (value == 0) || (value > UINT16_MAX))
    {
        return false;
    }
    port = static_cast<std::uint16_t>(value);
    return true;
}

bool parseCoordinate(const std::string& str, std::int32_t& coordinate)
{
    char*      end   = nullptr;
    const auto value = std::strtol(str.c_str(), &end, 10);  // NOLINT(*-magic-numbers)
    if (str.empty() || (*end != '\0') || (value < INT32_MIN) || (value > INT32_MAX))
    {
        return false;
    }
    coordinate = static_cast<std::int32_t>(value);
    return true;
}

/// Parses the command line. `SPDLOG_...=` arguments are skipped (see `setupLogging`).
///
cetl::optional<CliArgs> parseArgs(const int argc, const char** const argv)
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, 7, "SPDLOG_") == 0)
        {
            continue;
        }

        const bool has_value = (i + 1) < argc;
        if (arg == "--host" && has_value)
        {
            args.params.host = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        else if (arg == "--port" && has_value)
        {
            if (!parsePort(argv[++i], args.params.port))  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            {
                std::cerr << "Invalid port.\n";
                return cetl::nullopt;
            }
        }
        else if (arg == "--udid" && has_value)
        {
            args.params.device_id = std::string{argv[++i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        else if (arg == "--force-restart-daemon")
        {
            args.params.force_restart_daemon = true;
        }
        else if (arg.compare(0, 2, "--") == 0)
        {
            std::cerr << "Unknown option '" << arg << "'.\n";
            return cetl::nullopt;
        }
        else if (args.command.empty())
        {
            args.command = arg;
        }
        else
        {
            args.operands.push_back(arg);
        }
    }

    if (args.command.empty())
    {
        return cetl::nullopt;
    }
    return args;
}

const char* toDisplayString(const devctl::sdk::AppProcessState state)
{
    using devctl::sdk::AppProcessState;

    switch (state)
    {
    case AppProcessState::NotRunning:
        return "not running";
    case AppProcessState::Running:
        return "running";
    default:
        return "unknown";
    }
}

/// Waits for the operation result, and reports its failure (if any).
///
/// @return Exit code of the tool.
///
template <typename Op, typename Sender, typename OnSuccess>
int await(Executor& executor, Sender&& sender, OnSuccess&& on_success)
{
    auto result = devctl::sdk::sync_wait<typename Op::Result>(executor, std::forward<Sender>(sender));
    if (const auto* const error = cetl::get_if<typename Op::Failure>(&result))
    {
        spdlog::get("cli")->error("Command failed: {}", *error);
        std::cerr << fmt::format("{}\n", *error);
        return EXIT_FAILURE;
    }
    std::forward<OnSuccess>(on_success)(cetl::get<typename Op::Success>(std::move(result)));
    return EXIT_SUCCESS;
}

int runCommand(Client& client, Executor& executor, const CliArgs& args)
{
    const auto& command  = args.command;
    const auto& operands = args.operands;

    if (command == "list-apps")
    {
        return await<Client::ListApps>(executor, client.listApps(), [](const Client::ListApps::Success& apps) {
            //
            for (const auto& app : apps)
            {
                std::cout << fmt::format("{} | {} | {} | {} | debuggable={} | {}\n",
                                         app.bundle_id,
                                         app.name,
                                         app.install_type,
                                         toDisplayString(app.process_state),
                                         app.debuggable,
                                         fmt::join(app.architectures, ","));
            }
        });
    }
    if (command == "accessibility-info")
    {
        cetl::optional<devctl::sdk::Point> point;
        if (operands.size() == 2)
        {
            devctl::sdk::Point pt{0, 0};
            if (!parseCoordinate(operands[0], pt.x) || !parseCoordinate(operands[1], pt.y))
            {
                std::cerr << "Invalid point.\n";
                return EXIT_FAILURE;
            }
            point = pt;
        }
        else if (!operands.empty())
        {
            printUsage();
            return EXIT_FAILURE;
        }
        return await<Client::GetAccessibilityInfo>(executor,
                                                   client.accessibilityInfo(point),
                                                   [](const Client::GetAccessibilityInfo::Success& info) {
                                                       //
                                                       std::cout << info.json << '\n';
                                                   });
    }
    if (command == "add-media")
    {
        if (operands.empty())
        {
            printUsage();
            return EXIT_FAILURE;
        }
        return await<Client::AddMedia>(executor, client.addMedia(operands), [](const auto&) {});
    }
    if (command == "approve")
    {
        if (operands.size() < 2)
        {
            printUsage();
            return EXIT_FAILURE;
        }
        const std::set<std::string> permissions(operands.begin() + 1, operands.end());
        return await<Client::Approve>(executor, client.approve(operands.front(), permissions), [](const auto&) {});
    }
    if (command == "describe")
    {
        return await<Client::Describe>(executor, client.describe(), [](const Client::Describe::Success& target) {
            //
            std::cout << fmt::format("{} | {} | {} | {}\n", target.udid, target.name, target.state, target.os_version);
        });
    }
    if (command == "list-targets")
    {
        return await<Client::ListTargets>(executor,
                                          client.listTargets(),
                                          [](const Client::ListTargets::Success& targets) {
                                              //
                                              for (const auto& target : targets)
                                              {
                                                  std::cout << fmt::format("{} | {} | {} | {}\n",
                                                                           target.udid,
                                                                           target.name,
                                                                           target.state,
                                                                           target.os_version);
                                              }
                                          });
    }
    if (command == "terminate")
    {
        if (operands.size() != 1)
        {
            printUsage();
            return EXIT_FAILURE;
        }
        return await<Client::Terminate>(executor, client.terminate(operands.front()), [](const auto&) {});
    }

    std::cerr << "Unknown command '" << command << "'.\n";
    printUsage();
    return EXIT_FAILURE;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    setupLogging(argc, argv);

    const auto args = parseArgs(argc, argv);
    if (!args)
    {
        printUsage();
        return EXIT_FAILURE;
    }

    auto logger = spdlog::get("cli");
    logger->info("devctl started (ver='{}.{}', cmd='{}').", VERSION_MAJOR, VERSION_MINOR, args->command);

    int result = EXIT_SUCCESS;
    try
    {
        if (args->command == "kill")
        {
            if (const int err = Client::killAllKnownDaemons())
            {
                std::cerr << "Failed to kill daemons: " << std::strerror(err) << '\n';
                result = EXIT_FAILURE;
            }
        }
        else
        {
            auto&    memory = *cetl::pmr::new_delete_resource();
            Executor executor;

            const auto client = Client::make(memory, executor, args->params);
            result            = runCommand(*client, executor, *args);
        }

    } catch (const std::exception& ex)
    {
        logger->critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    logger->info("devctl terminated (result={}).", result);

    return result;
}
