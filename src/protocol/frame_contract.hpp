#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"
#include "protocol/part_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace tandem::protocol {

// Inbound frames (client -> server)

enum class RequestKind {
    Chat,
    Analyze
};

struct ConversationRequest {
    RequestKind kind = RequestKind::Chat;
    std::string conversation_id;
    std::optional<std::string> project_key;
    std::string input;
    std::optional<std::string> user_name;
    std::optional<std::string> user_ip;
};

struct PingFrame {};

struct PongFrame {};

struct ToolResultFrame {
    std::string tool_call_id;
    nlohmann::json payload;
};

struct UnknownFrame {
    std::string type;
};

using InboundFrame = std::variant<ConversationRequest, PingFrame, PongFrame,
                                  ToolResultFrame, UnknownFrame>;

core::errors::Result<InboundFrame> decode_inbound(const std::string& text);

// Interprets a TOOL_RESULT payload: {success, result, error, ...}
ToolResult tool_result_from_payload(const std::string& tool_call_id,
                                    const nlohmann::json& payload);

// Outbound frames (server -> client)

nlohmann::json connected_frame();
nlohmann::json ping_frame(std::int64_t timestamp_ms);
nlohmann::json pong_frame(std::int64_t timestamp_ms);
nlohmann::json part_frame(const std::string& conversation_id, const Part& part);
nlohmann::json complete_frame(const std::string& conversation_id);
nlohmann::json error_frame(const std::string& message);
nlohmann::json tool_call_frame(const std::string& tool_call_id,
                               const std::string& tool_name,
                               const nlohmann::json& params);
nlohmann::json shutdown_frame(const std::string& message, std::int64_t timestamp_ms);

// Part <-> JSON. `part_to_json` is the wire shape {id, messageId, sessionId,
// type, createdTime, updatedTime, data}; `part_from_json` reads it back for
// persistence.
nlohmann::json part_to_json(const Part& part);
core::errors::Result<Part> part_from_json(const nlohmann::json& value);

std::int64_t now_unix_ms();

}  // namespace tandem::protocol
