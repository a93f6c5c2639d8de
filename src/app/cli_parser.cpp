#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tandem::app::cli {

    using namespace tandem::core::errors;
    using tandem::core::config::ServerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> workers;
        std::optional<std::string> queue;
        std::optional<std::string> tool_timeout_ms;
        std::optional<std::string> store_dir;
        std::optional<std::string> knowledge_dir;
        std::optional<std::string> log_level;
        bool verbose = false;
    };

    namespace {

        // Exception-free integer parsing with inclusive bounds
        Result<std::uint64_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint64_t min, std::uint64_t max) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return TandemError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value < min || value > max) {
                return TandemError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                   "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_directory(const std::string& flag, const std::string& text) {
            std::filesystem::path p(text);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return TandemError{ErrorCategory::Input, flag + " does not exist or is not a directory", "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return TandemError{ErrorCategory::Input, "Failed to canonicalize " + flag, "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return TandemError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: tandemd serve [--config PATH] [--port N]"};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return TandemError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--config", &raw.config},
            {"--host", &raw.host},
            {"--port", &raw.port},
            {"--workers", &raw.workers},
            {"--queue", &raw.queue},
            {"--tool-timeout-ms", &raw.tool_timeout_ms},
            {"--store-dir", &raw.store_dir},
            {"--knowledge-dir", &raw.knowledge_dir},
            {"--log-level", &raw.log_level}};

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            bool matched = false;
            for (const auto& [flag, slot] : valued) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return TandemError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return TandemError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: config file first, then flag overrides
        ServerConfig config;
        if (raw.config) {
            auto loaded = tandem::core::config::load_config_file(raw.config.value());
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            config = take_value(std::move(loaded));
        }

        if (raw.host) {
            if (raw.host->empty()) {
                return TandemError{ErrorCategory::Input, "--host cannot be empty", "bounds_error"};
            }
            config.host = raw.host.value();
        }
        if (raw.port) {
            auto port = parse_bounded("--port", raw.port.value(), 1, std::numeric_limits<std::uint16_t>::max());
            if (is_error(port)) return get_error(port);
            config.port = static_cast<std::uint16_t>(get_value(port));
        }
        if (raw.workers) {
            auto workers = parse_bounded("--workers", raw.workers.value(), 1, 1024);
            if (is_error(workers)) return get_error(workers);
            config.worker_threads = static_cast<std::size_t>(get_value(workers));
        }
        if (raw.queue) {
            auto queue = parse_bounded("--queue", raw.queue.value(), 0, 65536);
            if (is_error(queue)) return get_error(queue);
            config.worker_queue_capacity = static_cast<std::size_t>(get_value(queue));
        }
        if (raw.tool_timeout_ms) {
            auto timeout = parse_bounded("--tool-timeout-ms", raw.tool_timeout_ms.value(), 1, 3600000);
            if (is_error(timeout)) return get_error(timeout);
            config.tool_timeout_ms = static_cast<std::uint32_t>(get_value(timeout));
        }

        // Path validation: the store directory may not exist yet, but must not be a file
        if (raw.store_dir) {
            std::filesystem::path p(raw.store_dir.value());
            std::error_code path_ec;
            if (std::filesystem::exists(p, path_ec) && !std::filesystem::is_directory(p, path_ec)) {
                return TandemError{ErrorCategory::Input, "--store-dir exists and is not a directory", "invalid_path"};
            }
            config.store_dir = std::move(p);
        }
        if (raw.knowledge_dir) {
            auto dir = existing_directory("--knowledge-dir", raw.knowledge_dir.value());
            if (is_error(dir)) return get_error(dir);
            config.knowledge_dir = get_value(dir);
        }

        if (raw.log_level) {
            auto level = tandem::core::logging::parse_log_level(raw.log_level.value());
            if (!level.has_value()) {
                return TandemError{ErrorCategory::Input, "Unknown log level: " + raw.log_level.value(), "invalid_log_level", "Use debug, info, warn or error."};
            }
            config.log_level = level.value();
        }
        if (raw.verbose) {
            config.log_level = tandem::core::logging::LogLevel::DEBUG;
        }

        auto valid = tandem::core::config::validate_config(config);
        if (is_error(valid)) {
            return get_error(valid);
        }
        return config;
    }

} // namespace tandem::app::cli
