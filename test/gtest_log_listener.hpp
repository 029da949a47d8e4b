//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DEVCTL_GTEST_LOG_LISTENER_HPP_INCLUDED
#define DEVCTL_GTEST_LOG_LISTENER_HPP_INCLUDED

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace devctl
{

/// Marks test boundaries and failures in the log file of a test binary.
///
class GtestLogListener final : public testing::EmptyTestEventListener
{
public:
    /// Directs all logging of the test binary into the `<binary_name>.log` file.
    ///
    /// Subsystem loggers are registered upfront, so the code under test finds them configured.
    /// Levels are `trace` unless the command line says otherwise (f.e. `SPDLOG_LEVEL=off,ipc=debug`).
    ///
    static void setupLogging(const int argc, char** const argv, const std::string& binary_name)
    {
        try
        {
            spdlog::drop_all();

            auto sink   = std::make_shared<spdlog::sinks::basic_file_sink_st>(binary_name + ".log", true);
            auto logger = std::make_shared<spdlog::logger>("", std::move(sink));
            logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
            logger->flush_on(spdlog::level::warn);
            spdlog::set_default_logger(logger);

            for (const std::string subsystem : {"io", "ipc", "sdk", "svc"})
            {
                spdlog::register_logger(logger->clone(subsystem));
            }

            spdlog::set_level(spdlog::level::trace);
            spdlog::cfg::load_argv_levels(argc, argv);

        } catch (const spdlog::spdlog_ex& ex)
        {
            std::cerr << "Can't set up test logging: " << ex.what() << '\n';
            std::exit(EXIT_FAILURE);
        }
    }

private:
    void OnTestStart(const testing::TestInfo& test_info) override
    {
        spdlog::info(">>> {}.{}", test_info.test_suite_name(), test_info.name());
    }

    void OnTestPartResult(const testing::TestPartResult& result) override
    {
        if (result.failed())
        {
            spdlog::error("FAILED at {}:{}\n{}", result.file_name(), result.line_number(), result.summary());
        }
    }

    void OnTestEnd(const testing::TestInfo& test_info) override
    {
        spdlog::info("<<< {}.{} ({}, {} ms)",
                     test_info.test_suite_name(),
                     test_info.name(),
                     test_info.result()->Passed() ? "passed" : "FAILED",
                     test_info.result()->elapsed_time());

        // Each test leaves its complete record, even if the next one crashes.
        spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
    }

};  // GtestLogListener

}  // namespace devctl

#endif  // DEVCTL_GTEST_LOG_LISTENER_HPP_INCLUDED
