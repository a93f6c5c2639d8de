#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace tandem::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Trace id of the round running on the current thread, empty outside a round.
    inline std::string& current_trace_id() {
        thread_local std::string trace_id;
        return trace_id;
    }

    // Installs a trace id for the current thread and restores the previous one on exit.
    class ScopedTraceId {
    public:
        explicit ScopedTraceId(std::string trace_id)
            : previous_(std::exchange(current_trace_id(), std::move(trace_id))) {}

        ~ScopedTraceId() { current_trace_id() = std::move(previous_); }

        ScopedTraceId(const ScopedTraceId&) = delete;
        ScopedTraceId& operator=(const ScopedTraceId&) = delete;

    private:
        std::string previous_;
    };

    // <conversation_id>_<HHMMSS>, the trace id format used for a round
    inline std::string make_trace_id(const std::string& conversation_id) {
        const std::time_t now = std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::now());
        std::tm local_tm{};
        localtime_r(&now, &local_tm);
        std::ostringstream oss;
        oss << conversation_id << "_" << std::put_time(&local_tm, "%H%M%S");
        return oss.str();
    }

    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            const std::string& trace_id = current_trace_id();
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (trace_id.empty() ? "" : "[" + trace_id + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define TANDEM_LOG_DEBUG(msg) tandem::core::logging::Logger::get().log(tandem::core::logging::LogLevel::DEBUG, msg)
    #define TANDEM_LOG_INFO(msg)  tandem::core::logging::Logger::get().log(tandem::core::logging::LogLevel::INFO, msg)
    #define TANDEM_LOG_WARN(msg)  tandem::core::logging::Logger::get().log(tandem::core::logging::LogLevel::WARN, msg)
    #define TANDEM_LOG_ERROR(msg) tandem::core::logging::Logger::get().log(tandem::core::logging::LogLevel::ERROR, msg)

} // namespace tandem::core::logging
