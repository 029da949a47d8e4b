//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_CLI_SETUP_LOGGING_HPP_INCLUDED
#define DEVCTL_CLI_SETUP_LOGGING_HPP_INCLUDED

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace detail
{

/// Applies `SPDLOG_FLUSH_LEVEL=[<level>,]<logger>=<level>...` items in order; a bare level is for every logger.
///
inline void applyFlushLevels(const std::string& spec)
{
    std::istringstream items{spec};
    std::string        item;
    while (std::getline(items, item, ','))
    {
        const auto        equal_pos  = item.find('=');
        const std::string name       = (equal_pos == std::string::npos) ? "" : item.substr(0, equal_pos);
        const std::string level_name = item.substr((equal_pos == std::string::npos) ? 0 : equal_pos + 1);

        const auto level = spdlog::level::from_str(level_name);
        if ((level == spdlog::level::off) && (level_name != "off"))
        {
            std::cerr << "Unknown flush level ignored: '" << level_name << "'.\n";
            continue;
        }

        if (name.empty())
        {
            spdlog::flush_on(level);
        }
        else if (const auto logger = spdlog::get(name))
        {
            logger->flush_on(level);
        }
    }
}

}  // namespace detail

/// Sets up the logging of the tool.
///
/// Every logger writes to one rotating file: `DEVCTL_LOG_FILE`, or `./devctl-cli.log` by default.
/// `SPDLOG_LEVEL=` and `SPDLOG_FLUSH_LEVEL=` arguments (f.e. `SPDLOG_LEVEL=debug,ipc=trace`) adjust levels;
/// they are not commands of the tool.
///
inline void setupLogging(const int argc, const char** const argv)
{
    constexpr std::size_t MaxFiles    = 4;
    constexpr std::size_t MaxFileSize = 16UL * 1024UL * 1024UL;

    const char* const log_file_env  = std::getenv("DEVCTL_LOG_FILE");
    const std::string log_file_path = (log_file_env != nullptr) ? log_file_env : "./devctl-cli.log";

    try
    {
        spdlog::drop_all();

        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_st>(log_file_path, MaxFileSize, MaxFiles);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        spdlog::set_default_logger(std::make_shared<spdlog::logger>("", sink));
        for (const char* const subsystem : {"cli", "io", "ipc", "sdk", "svc"})
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(subsystem, sink));
        }

        spdlog::cfg::load_argv_levels(argc, argv);

        const std::string flush_prefix = "SPDLOG_FLUSH_LEVEL=";
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg{argv[i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            if (arg.compare(0, flush_prefix.size(), flush_prefix) == 0)
            {
                detail::applyFlushLevels(arg.substr(flush_prefix.size()));
            }
        }

        spdlog::info("==================== devctl-cli");

    } catch (const spdlog::spdlog_ex& ex)
    {
        std::cerr << "Can't set up logging ('" << log_file_path << "'): " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // DEVCTL_CLI_SETUP_LOGGING_HPP_INCLUDED
