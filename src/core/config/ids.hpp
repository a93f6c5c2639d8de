#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace tandem::core::config {

    // Random lowercase hex string of `length` characters
    inline std::string random_hex(int length) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // "<prefix>-<16 hex>", used for message, part and connection ids
    inline std::string generate_id(const std::string& prefix) {
        return prefix + "-" + random_hex(16);
    }

    // Correlation id for a remote tool call: unique within the process via the
    // counter, distinct across restarts via the timestamp and random tail.
    inline std::string generate_tool_call_id(const std::string& tool_name) {
        static std::atomic<std::uint64_t> counter{0};
        const auto sequence = counter.fetch_add(1, std::memory_order_relaxed) + 1;
        const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();

        std::stringstream ss;
        ss << tool_name << "-" << std::hex << now_ms << "-" << sequence << "-"
           << random_hex(8);
        return ss.str();
    }

} // namespace tandem::core::config
