#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/tandem_errors.hpp"
#include "core/logging/logger.hpp"

namespace tandem::core::config {

struct ServerConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8765;

    // Rounds run on a bounded pool; 0 queue capacity rejects as soon as every
    // worker is busy.
    std::size_t worker_threads = 32;
    std::size_t worker_queue_capacity = 0;

    std::uint32_t tool_timeout_ms = 30000;
    std::uint32_t shutdown_grace_ms = 10000;

    // Empty keeps conversations in memory only.
    std::filesystem::path store_dir;

    // Root served by the local knowledge_search tool; empty disables it.
    std::filesystem::path knowledge_dir;

    std::vector<std::string> forwarded_tools = {
        "find_file", "read_file", "grep_file",
        "call_chain", "extract_xml", "apply_change"};

    logging::LogLevel log_level = logging::LogLevel::INFO;
};

// Overlays the fields present in a JSON config file onto `base`.
errors::Result<ServerConfig> load_config_file(const std::filesystem::path& path,
                                              ServerConfig base = {});

errors::Status validate_config(const ServerConfig& config);

}  // namespace tandem::core::config
