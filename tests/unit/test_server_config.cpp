#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/server_config.hpp"

namespace {

namespace fs = std::filesystem;
using tandem::core::config::ServerConfig;
using tandem::core::config::load_config_file;
using tandem::core::config::validate_config;
using tandem::core::errors::get_error;
using tandem::core::errors::get_value;
using tandem::core::errors::is_error;
using tandem::core::logging::LogLevel;

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("tandem_config_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& body) { std::ofstream(path_) << body; }

    fs::path path_;
};

TEST_F(ServerConfigTest, LoadsEveryKnownField) {
    write(R"({
        "host": "0.0.0.0",
        "port": 9100,
        "worker_threads": 8,
        "worker_queue_capacity": 2,
        "tool_timeout_ms": 5000,
        "shutdown_grace_ms": 100,
        "store_dir": "/var/lib/tandem",
        "knowledge_dir": "/srv/notes",
        "forwarded_tools": ["read_file"],
        "log_level": "debug"
    })");

    auto result = load_config_file(path_);
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.worker_threads, 8u);
    EXPECT_EQ(config.worker_queue_capacity, 2u);
    EXPECT_EQ(config.tool_timeout_ms, 5000u);
    EXPECT_EQ(config.shutdown_grace_ms, 100u);
    EXPECT_EQ(config.store_dir, fs::path("/var/lib/tandem"));
    EXPECT_EQ(config.knowledge_dir, fs::path("/srv/notes"));
    ASSERT_EQ(config.forwarded_tools.size(), 1u);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST_F(ServerConfigTest, MissingFieldsKeepBase) {
    write(R"({"port": 9200})");
    ServerConfig base;
    base.worker_threads = 3;

    auto result = load_config_file(path_, base);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).port, 9200);
    EXPECT_EQ(get_value(result).worker_threads, 3u);
}

TEST_F(ServerConfigTest, RejectsInvalidJson) {
    write("{ port: ");
    auto result = load_config_file(path_);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_failed");
}

TEST_F(ServerConfigTest, RejectsWrongTypes) {
    write(R"({"host": 42})");
    auto result = load_config_file(path_);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_failed");
}

TEST_F(ServerConfigTest, RejectsUnknownLogLevel) {
    write(R"({"log_level": "loud"})");
    EXPECT_TRUE(is_error(load_config_file(path_)));
}

TEST_F(ServerConfigTest, MissingFileIsInvalidPath) {
    auto result = load_config_file(path_);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(ServerConfigValidationTest, Bounds) {
    ServerConfig config;
    EXPECT_FALSE(is_error(validate_config(config)));

    config.worker_threads = 0;
    EXPECT_EQ(get_error(validate_config(config)).code, "bounds_error");

    config = ServerConfig{};
    config.tool_timeout_ms = 0;
    EXPECT_TRUE(is_error(validate_config(config)));

    config = ServerConfig{};
    config.host.clear();
    EXPECT_TRUE(is_error(validate_config(config)));
}

}  // namespace
