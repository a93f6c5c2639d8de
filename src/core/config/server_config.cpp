#include "core/config/server_config.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace tandem::core::config {

using errors::ErrorCategory;
using errors::TandemError;
using nlohmann::json;

namespace {

TandemError config_error(const std::string& message) {
    return TandemError{ErrorCategory::Input, message, "config_parse_failed"};
}

}  // namespace

errors::Result<ServerConfig> load_config_file(const std::filesystem::path& path,
                                              ServerConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return TandemError{ErrorCategory::Input,
                           "Unable to open config file: " + path.string(),
                           "invalid_path"};
    }

    const json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return config_error("Config file is not a JSON object: " + path.string());
    }

    try {
        if (doc.contains("host")) base.host = doc.at("host").get<std::string>();
        if (doc.contains("port")) base.port = doc.at("port").get<std::uint16_t>();
        if (doc.contains("worker_threads")) {
            base.worker_threads = doc.at("worker_threads").get<std::size_t>();
        }
        if (doc.contains("worker_queue_capacity")) {
            base.worker_queue_capacity =
                doc.at("worker_queue_capacity").get<std::size_t>();
        }
        if (doc.contains("tool_timeout_ms")) {
            base.tool_timeout_ms = doc.at("tool_timeout_ms").get<std::uint32_t>();
        }
        if (doc.contains("shutdown_grace_ms")) {
            base.shutdown_grace_ms = doc.at("shutdown_grace_ms").get<std::uint32_t>();
        }
        if (doc.contains("store_dir")) {
            base.store_dir = doc.at("store_dir").get<std::string>();
        }
        if (doc.contains("knowledge_dir")) {
            base.knowledge_dir = doc.at("knowledge_dir").get<std::string>();
        }
        if (doc.contains("forwarded_tools")) {
            base.forwarded_tools =
                doc.at("forwarded_tools").get<std::vector<std::string>>();
        }
        if (doc.contains("log_level")) {
            const auto level =
                logging::parse_log_level(doc.at("log_level").get<std::string>());
            if (!level.has_value()) {
                return config_error("Unknown log_level in " + path.string());
            }
            base.log_level = level.value();
        }
    } catch (const json::exception& e) {
        return config_error("Invalid config value: " + std::string(e.what()));
    }

    auto valid = validate_config(base);
    if (errors::is_error(valid)) {
        return errors::get_error(valid);
    }
    return base;
}

errors::Status validate_config(const ServerConfig& config) {
    if (config.host.empty()) {
        return TandemError{ErrorCategory::Input, "Host cannot be empty.",
                           "bounds_error"};
    }
    if (config.worker_threads == 0 || config.worker_threads > 1024) {
        return TandemError{ErrorCategory::Input, "worker_threads out of bounds",
                           "bounds_error", "Must be between 1 and 1024."};
    }
    if (config.tool_timeout_ms == 0) {
        return TandemError{ErrorCategory::Input, "tool_timeout_ms must be positive",
                           "bounds_error"};
    }
    return errors::ok();
}

}  // namespace tandem::core::config
