#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace tandem::protocol {

    // How the reasoning loop asks for a tool
    struct ToolCall {
        std::string name;       // e.g., "read_file", "grep_file"
        nlohmann::json params = nlohmann::json::object();
    };

    // What comes back, whether the tool ran locally or on the IDE
    struct ToolResult {
        std::string tool_call_id;
        bool success = false;
        std::string output;         // displayable result text
        std::string error_message;  // failure reason
        double duration_ms = 0.0;
        nlohmann::json raw = nlohmann::json::object();  // full payload from the client
    };

} // namespace tandem::protocol
