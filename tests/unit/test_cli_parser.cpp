#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/tandem_errors.hpp"

namespace {

using tandem::app::cli::parse_and_validate;
using tandem::core::config::ServerConfig;
using tandem::core::errors::ErrorCategory;
using tandem::core::errors::get_error;
using tandem::core::errors::get_value;
using tandem::core::errors::is_error;
using tandem::core::logging::LogLevel;

tandem::core::errors::Result<ServerConfig> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("tandemd");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

std::filesystem::path scratch_path(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           (name + "_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ServeWithDefaults) {
    auto result = parse_tokens({"serve"});
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8765);
    EXPECT_EQ(config.worker_threads, 32u);
    EXPECT_TRUE(config.store_dir.empty());
}

TEST(CliParserTest, FlagsOverrideDefaults) {
    auto result = parse_tokens({"serve", "--host", "0.0.0.0", "--port", "9000", "--workers",
                                "4", "--queue", "8", "--tool-timeout-ms", "1500",
                                "--log-level", "warn"});
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.worker_queue_capacity, 8u);
    EXPECT_EQ(config.tool_timeout_ms, 1500u);
    EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST(CliParserTest, VerboseWinsOverLogLevel) {
    auto result = parse_tokens({"serve", "--log-level", "error", "--verbose"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).log_level, LogLevel::DEBUG);
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"serve", "--port"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"serve", "--turbo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenPortNotNumeric) {
    auto result = parse_tokens({"serve", "--port", "80x"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenNumbersOutOfBounds) {
    EXPECT_EQ(get_error(parse_tokens({"serve", "--port", "0"})).code, "bounds_error");
    EXPECT_EQ(get_error(parse_tokens({"serve", "--port", "70000"})).code, "bounds_error");
    EXPECT_EQ(get_error(parse_tokens({"serve", "--workers", "0"})).code, "bounds_error");
    EXPECT_EQ(get_error(parse_tokens({"serve", "--tool-timeout-ms", "0"})).code, "bounds_error");
}

TEST(CliParserTest, FailsOnUnknownLogLevel) {
    auto result = parse_tokens({"serve", "--log-level", "chatty"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, FailsWhenKnowledgeDirMissing) {
    const auto missing_dir = scratch_path("tandem_missing_knowledge");
    auto result = parse_tokens({"serve", "--knowledge-dir", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenStoreDirIsAFile) {
    const auto file = scratch_path("tandem_store_file");
    std::ofstream(file) << "x";
    auto result = parse_tokens({"serve", "--store-dir", file.string()});
    std::error_code ec;
    std::filesystem::remove(file, ec);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FlagsOverrideConfigFile) {
    const auto file = scratch_path("tandem_cli_config");
    std::ofstream(file) << R"({"port": 7000, "worker_threads": 2, "host": "10.1.1.1"})";

    auto result = parse_tokens({"serve", "--config", file.string(), "--port", "7001"});
    std::error_code ec;
    std::filesystem::remove(file, ec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).port, 7001);
    EXPECT_EQ(get_value(result).worker_threads, 2u);
    EXPECT_EQ(get_value(result).host, "10.1.1.1");
}

}  // namespace
