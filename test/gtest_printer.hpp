//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef TREECONV_GTEST_PRINTER_HPP_INCLUDED
#define TREECONV_GTEST_PRINTER_HPP_INCLUDED

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace treeconv
{

/// Mirrors the test progress into the log file, so that the engine's own log records
/// (resolution, proxies, union fast path) can be told apart per test.
///
class GtestPrinter final : public testing::EmptyTestEventListener
{
public:
    /// Sets up the logging system.
    ///
    /// All loggers go to the `<log_prefix>.log` file, at the Trace level by default.
    /// Accepts `SPDLOG_LEVEL` argument (like `SPDLOG_LEVEL=treeconv=debug`).
    ///
    static void setupLogging(const int argc, char** const argv, const std::string& log_prefix)
    {
        try
        {
            spdlog::drop_all();

            const auto file_sink      = std::make_shared<spdlog::sinks::basic_file_sink_st>(log_prefix + ".log", true);
            const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
            default_logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
            spdlog::register_logger(default_logger);
            spdlog::set_default_logger(default_logger);

            spdlog::set_level(spdlog::level::trace);
            spdlog::cfg::load_argv_levels(argc, argv);

        } catch (const std::exception& ex)
        {
            std::cerr << "Failed to setup logging: " << ex.what() << '\n';
            std::exit(EXIT_FAILURE);
        }
    }

private:
    void OnTestSuiteStart(const testing::TestSuite& test_suite) override
    {
        spdlog::info("==== {}", test_suite.name());
    }

    void OnTestStart(const testing::TestInfo& test_info) override
    {
        spdlog::info("---- {}.{}", test_info.test_suite_name(), test_info.name());
    }

    void OnTestPartResult(const testing::TestPartResult& test_part_result) override
    {
        if (test_part_result.failed())
        {
            spdlog::error("Failure at {}:{}\n{}",
                          test_part_result.file_name(),
                          test_part_result.line_number(),
                          test_part_result.summary());
        }
    }

    void OnTestEnd(const testing::TestInfo& test_info) override
    {
        const auto* const result = test_info.result();
        spdlog::info("---- {}.{} {}",
                     test_info.test_suite_name(),
                     test_info.name(),
                     ((result != nullptr) && result->Failed()) ? "FAILED" : "passed");
    }

};  // GtestPrinter

}  // namespace treeconv

#endif  // TREECONV_GTEST_PRINTER_HPP_INCLUDED
