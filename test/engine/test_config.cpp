//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "treeconv/config.hpp"

#include "config_mock.hpp"
#include "logging.hpp"
#include "treeconv/context.hpp"
#include "treeconv/treeconv.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{

using namespace treeconv;  // NOLINT This our main concern here in the unit tests.

using testing::Eq;
using testing::Return;
using testing::NotNull;
using testing::NiceMock;
using testing::StrictMock;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestConfig : public testing::Test
{
protected:
    void SetUp() override
    {
        const auto* const test_info = testing::UnitTest::GetInstance()->current_test_info();
        file_path_ = std::filesystem::temp_directory_path() / (std::string{"treeconv_"} + test_info->name() + ".toml");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove(file_path_, ec);
    }

    void writeFile(const std::string& content) const
    {
        std::ofstream file{file_path_};
        file << content;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    std::filesystem::path file_path_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestConfig, make_reads_settings)
{
    writeFile(R"(
[conversion]
any_load_policy = "raise_error"
any_dump_policy = "dump_as_is"
missing_type_policy = "use_any"
dump_null_values = false

[logging]
level = "treeconv=info"
)");

    const auto config = Config::make(file_path_.string());
    ASSERT_THAT(config, NotNull());
    EXPECT_THAT(config->getAnyLoadPolicy(), Eq(cetl::optional<std::string>{"raise_error"}));
    EXPECT_THAT(config->getAnyDumpPolicy(), Eq(cetl::optional<std::string>{"dump_as_is"}));
    EXPECT_THAT(config->getMissingTypePolicy(), Eq(cetl::optional<std::string>{"use_any"}));
    EXPECT_THAT(config->getDumpNullValues(), Eq(cetl::optional<bool>{false}));
    EXPECT_THAT(config->getLoggingLevel(), Eq(cetl::optional<std::string>{"treeconv=info"}));
}

TEST_F(TestConfig, absent_and_mistyped_settings)
{
    writeFile(R"(
[conversion]
dump_null_values = "no"
any_load_policy = 1
)");

    const auto config = Config::make(file_path_.string());
    EXPECT_THAT(config->getDumpNullValues(), Eq(cetl::nullopt));
    EXPECT_THAT(config->getAnyLoadPolicy(), Eq(cetl::nullopt));
    EXPECT_THAT(config->getAnyDumpPolicy(), Eq(cetl::nullopt));
    EXPECT_THAT(config->getLoggingLevel(), Eq(cetl::nullopt));
}

TEST_F(TestConfig, make_fails_on_bad_file)
{
    EXPECT_THROW((void) Config::make((file_path_.parent_path() / "treeconv_no_such_file.toml").string()),
                 std::exception);

    writeFile("[conversion\nany_load_policy = ");
    EXPECT_THROW((void) Config::make(file_path_.string()), std::exception);
}

TEST_F(TestConfig, options_from_config)
{
    StrictMock<ConfigMock> config;
    EXPECT_CALL(config, getAnyLoadPolicy()).WillOnce(Return("raise_error"));
    EXPECT_CALL(config, getAnyDumpPolicy()).WillOnce(Return("raise_error"));
    EXPECT_CALL(config, getMissingTypePolicy()).WillOnce(Return("from_default"));
    EXPECT_CALL(config, getDumpNullValues()).WillOnce(Return(false));

    const auto options = Context::Options::from(config);
    EXPECT_THAT(options.any_load_policy, AnyLoadPolicy::RaiseError);
    EXPECT_THAT(options.any_dump_policy, AnyDumpPolicy::RaiseError);
    EXPECT_THAT(options.missing_type_policy, MissingTypePolicy::FromDefault);
    EXPECT_THAT(options.dump_null_values, Eq(false));
}

TEST_F(TestConfig, options_ignore_unknown_values)
{
    StrictMock<ConfigMock> config;
    EXPECT_CALL(config, getAnyLoadPolicy()).WillOnce(Return("whatever"));
    EXPECT_CALL(config, getAnyDumpPolicy()).WillOnce(Return(cetl::nullopt));
    EXPECT_CALL(config, getMissingTypePolicy()).WillOnce(Return("USE_ANY"));
    EXPECT_CALL(config, getDumpNullValues()).WillOnce(Return(cetl::nullopt));

    const auto options = Context::Options::from(config);
    EXPECT_THAT(options.any_load_policy, AnyLoadPolicy::LoadAsIs);
    EXPECT_THAT(options.any_dump_policy, AnyDumpPolicy::DumpAsIs);
    EXPECT_THAT(options.missing_type_policy, MissingTypePolicy::RaiseError);
    EXPECT_THAT(options.dump_null_values, Eq(true));
}

TEST_F(TestConfig, makeContext_applies_settings)
{
    const auto logger         = common::getLogger("treeconv");
    const auto original_level = logger->level();

    NiceMock<ConfigMock> config;
    EXPECT_CALL(config, getLoggingLevel()).WillOnce(Return("treeconv=critical"));
    EXPECT_CALL(config, getAnyDumpPolicy()).WillOnce(Return("raise_error"));

    const auto context = makeContext(config);
    ASSERT_THAT(context, NotNull());
    EXPECT_THAT(context->options().any_dump_policy, AnyDumpPolicy::RaiseError);
    EXPECT_THAT(context->options().any_load_policy, AnyLoadPolicy::LoadAsIs);
    EXPECT_THAT(spdlog::get("treeconv")->level(), spdlog::level::critical);

    logger->set_level(original_level);
}

TEST_F(TestConfig, makeContext_from_file)
{
    writeFile(R"(
[conversion]
dump_null_values = false
)");

    const auto context = makeContext(*Config::make(file_path_.string()));
    EXPECT_THAT(context->options().dump_null_values, Eq(false));
    EXPECT_THAT(context->options().missing_type_policy, MissingTypePolicy::RaiseError);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
