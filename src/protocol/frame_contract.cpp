#include "protocol/frame_contract.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <utility>

namespace tandem::protocol {

using core::errors::ErrorCategory;
using core::errors::TandemError;
using nlohmann::json;

namespace {

TandemError protocol_error(const std::string& message, const std::string& code) {
    return TandemError{ErrorCategory::Protocol, message, code};
}

std::optional<std::string> optional_string(const json& frame, const char* key) {
    auto it = frame.find(key);
    if (it == frame.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    const int matched = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ", &year,
                                    &month, &day, &hour, &minute, &second, &millis);
    if (matched < 6) {
        return std::nullopt;
    }
    std::tm utc_tm{};
    utc_tm.tm_year = year - 1900;
    utc_tm.tm_mon = month - 1;
    utc_tm.tm_mday = day;
    utc_tm.tm_hour = hour;
    utc_tm.tm_min = minute;
    utc_tm.tm_sec = second;
    const std::time_t seconds = timegm(&utc_tm);
    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::milliseconds(matched == 7 ? millis : 0);
}

template <typename Enum>
std::optional<Enum> parse_enum(const std::string& text, std::initializer_list<Enum> values) {
    for (const Enum value : values) {
        if (to_string(value) == text) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<ToolStatus> parse_tool_status(const std::string& text) {
    return parse_enum<ToolStatus>(text, {ToolStatus::Pending, ToolStatus::Running,
                                         ToolStatus::Completed, ToolStatus::Error});
}

std::optional<GoalStatus> parse_goal_status(const std::string& text) {
    return parse_enum<GoalStatus>(text, {GoalStatus::Pending, GoalStatus::InProgress,
                                         GoalStatus::Completed, GoalStatus::Cancelled});
}

std::optional<TodoStatus> parse_todo_status(const std::string& text) {
    return parse_enum<TodoStatus>(text, {TodoStatus::Pending, TodoStatus::InProgress,
                                         TodoStatus::Completed, TodoStatus::Cancelled});
}

std::optional<SubTaskStatus> parse_subtask_status(const std::string& text) {
    return parse_enum<SubTaskStatus>(
        text, {SubTaskStatus::Pending, SubTaskStatus::InProgress,
               SubTaskStatus::Completed, SubTaskStatus::Blocked,
               SubTaskStatus::Cancelled});
}

// Variant payload of the "data" field. Every alternative must be handled here.
struct DataEncoder {
    json operator()(const TextData& text) const { return {{"text", text.text}}; }

    json operator()(const ReasoningData& reasoning) const {
        return {{"text", reasoning.text}};
    }

    json operator()(const ToolData& tool) const {
        json data;
        data["toolName"] = tool.tool_name;
        data["state"] = to_string(tool.state);
        data["title"] = tool.title;
        data["content"] = tool.content;
        if (tool.error.has_value()) {
            data["error"] = tool.error.value();
        }
        data["input"] = tool.input;
        if (!tool.output.is_null()) {
            data["output"] = tool.output;
        }
        if (tool.start_time.has_value()) {
            data["startTime"] = format_timestamp(tool.start_time.value());
        }
        if (tool.end_time.has_value()) {
            data["endTime"] = format_timestamp(tool.end_time.value());
        }
        return data;
    }

    json operator()(const GoalData& goal) const {
        return {{"title", goal.title},
                {"description", goal.description},
                {"status", to_string(goal.status)}};
    }

    json operator()(const ProgressData& progress) const {
        return {{"currentStep", progress.current_step},
                {"totalSteps", progress.total_steps},
                {"stepName", progress.step_name}};
    }

    json operator()(const TodoData& todo) const {
        json items = json::array();
        for (const auto& item : todo.items) {
            items.push_back({{"id", item.id},
                             {"content", item.content},
                             {"status", to_string(item.status)}});
        }
        return {{"items", items}};
    }

    json operator()(const SubTaskData& subtask) const {
        return {{"target", subtask.target},
                {"question", subtask.question},
                {"reason", subtask.reason},
                {"requiredTools", subtask.required_tools},
                {"status", to_string(subtask.status)},
                {"conclusion", subtask.conclusion},
                {"blockReason", subtask.block_reason},
                {"dependsOn", subtask.depends_on}};
    }
};

core::errors::Result<PartData> decode_data(const std::string& type, const json& data) {
    if (type == "TEXT") {
        return PartData{TextData{data.value("text", "")}};
    }
    if (type == "REASONING") {
        return PartData{ReasoningData{data.value("text", "")}};
    }
    if (type == "TOOL") {
        ToolData tool;
        tool.tool_name = data.value("toolName", "");
        const auto state = parse_tool_status(data.value("state", "PENDING"));
        if (!state.has_value()) {
            return protocol_error("Unknown tool state", "malformed_part");
        }
        tool.state = state.value();
        tool.title = data.value("title", "");
        tool.content = data.value("content", "");
        if (auto error = optional_string(data, "error")) {
            tool.error = std::move(error);
        }
        if (data.contains("input")) {
            tool.input = data.at("input");
        }
        if (data.contains("output")) {
            tool.output = data.at("output");
        }
        if (auto start = optional_string(data, "startTime")) {
            tool.start_time = parse_timestamp(start.value());
        }
        if (auto end = optional_string(data, "endTime")) {
            tool.end_time = parse_timestamp(end.value());
        }
        return PartData{std::move(tool)};
    }
    if (type == "GOAL") {
        GoalData goal;
        goal.title = data.value("title", "");
        goal.description = data.value("description", "");
        goal.status = parse_goal_status(data.value("status", "PENDING"))
                          .value_or(GoalStatus::Pending);
        return PartData{std::move(goal)};
    }
    if (type == "PROGRESS") {
        ProgressData progress;
        progress.current_step = data.value("currentStep", 0);
        progress.total_steps = data.value("totalSteps", 0);
        progress.step_name = data.value("stepName", "");
        return PartData{std::move(progress)};
    }
    if (type == "TODO") {
        TodoData todo;
        if (data.contains("items") && data.at("items").is_array()) {
            for (const auto& entry : data.at("items")) {
                TodoItem item;
                item.id = entry.value("id", "");
                item.content = entry.value("content", "");
                item.status = parse_todo_status(entry.value("status", "PENDING"))
                                  .value_or(TodoStatus::Pending);
                todo.items.push_back(std::move(item));
            }
        }
        return PartData{std::move(todo)};
    }
    if (type == "SUBTASK") {
        SubTaskData subtask;
        subtask.target = data.value("target", "");
        subtask.question = data.value("question", "");
        subtask.reason = data.value("reason", "");
        subtask.required_tools =
            data.value("requiredTools", std::vector<std::string>{});
        subtask.status = parse_subtask_status(data.value("status", "PENDING"))
                             .value_or(SubTaskStatus::Pending);
        subtask.conclusion = data.value("conclusion", "");
        subtask.block_reason = data.value("blockReason", "");
        subtask.depends_on = data.value("dependsOn", std::vector<std::string>{});
        return PartData{std::move(subtask)};
    }
    return protocol_error("Unknown part type: " + type, "malformed_part");
}

}  // namespace

std::int64_t now_unix_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

core::errors::Result<InboundFrame> decode_inbound(const std::string& text) {
    const json frame = json::parse(text, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        return protocol_error("Frame is not a JSON object", "malformed_frame");
    }

    const auto type = optional_string(frame, "type");
    if (!type.has_value()) {
        return protocol_error("Frame has no type", "missing_frame_type");
    }

    if (type.value() == "chat" || type.value() == "analyze") {
        ConversationRequest request;
        request.kind = type.value() == "chat" ? RequestKind::Chat : RequestKind::Analyze;
        auto conversation_id = optional_string(frame, "sessionId");
        if (!conversation_id.has_value() || conversation_id->empty()) {
            return protocol_error("Request has no sessionId", "missing_session_id");
        }
        auto input = optional_string(frame, "input");
        if (!input.has_value()) {
            return protocol_error("Request has no input", "missing_input");
        }
        request.conversation_id = std::move(conversation_id.value());
        request.input = std::move(input.value());
        request.project_key = optional_string(frame, "projectKey");
        request.user_name = optional_string(frame, "userName");
        request.user_ip = optional_string(frame, "userIp");
        return InboundFrame{std::move(request)};
    }

    if (type.value() == "ping") {
        return InboundFrame{PingFrame{}};
    }
    if (type.value() == "pong") {
        return InboundFrame{PongFrame{}};
    }

    if (type.value() == "tool_result" || type.value() == "TOOL_RESULT") {
        auto tool_call_id = optional_string(frame, "toolCallId");
        if (!tool_call_id.has_value() || tool_call_id->empty()) {
            return protocol_error("TOOL_RESULT has no toolCallId",
                                  "missing_tool_call_id");
        }
        return InboundFrame{ToolResultFrame{std::move(tool_call_id.value()), frame}};
    }

    return InboundFrame{UnknownFrame{type.value()}};
}

ToolResult tool_result_from_payload(const std::string& tool_call_id,
                                    const json& payload) {
    ToolResult result;
    result.tool_call_id = tool_call_id;
    result.raw = payload;

    const auto error = optional_string(payload, "error");
    if (payload.contains("success") && payload.at("success").is_boolean()) {
        result.success = payload.at("success").get<bool>();
    } else {
        result.success = !error.has_value();
    }

    if (payload.contains("result")) {
        const auto& value = payload.at("result");
        result.output = value.is_string() ? value.get<std::string>() : value.dump();
    }
    if (error.has_value()) {
        result.error_message = error.value();
    } else if (!result.success) {
        result.error_message = "Tool reported failure without an error message.";
    }
    return result;
}

json connected_frame() {
    return {{"type", "connected"}, {"message", "connection established"}};
}

json ping_frame(const std::int64_t timestamp_ms) {
    return {{"type", "ping"}, {"timestamp", timestamp_ms}};
}

json pong_frame(const std::int64_t timestamp_ms) {
    return {{"type", "pong"}, {"timestamp", timestamp_ms}};
}

json part_frame(const std::string& conversation_id, const Part& part) {
    return {{"type", "part"}, {"sessionId", conversation_id}, {"part", part_to_json(part)}};
}

json complete_frame(const std::string& conversation_id) {
    return {{"type", "complete"}, {"sessionId", conversation_id}};
}

json error_frame(const std::string& message) {
    return {{"type", "error"}, {"message", message}};
}

json tool_call_frame(const std::string& tool_call_id, const std::string& tool_name,
                     const json& params) {
    return {{"type", "TOOL_CALL"},
            {"toolCallId", tool_call_id},
            {"toolName", tool_name},
            {"params", params}};
}

json shutdown_frame(const std::string& message, const std::int64_t timestamp_ms) {
    return {{"type", "shutdown"}, {"message", message}, {"timestamp", timestamp_ms}};
}

json part_to_json(const Part& part) {
    json value;
    value["id"] = part.id;
    value["messageId"] = part.message_id;
    value["sessionId"] = part.conversation_id;
    value["type"] = to_string(part.type());
    value["createdTime"] = format_timestamp(part.created_time);
    value["updatedTime"] = format_timestamp(part.updated_time);
    value["data"] = std::visit(DataEncoder{}, part.data);
    return value;
}

core::errors::Result<Part> part_from_json(const json& value) {
    if (!value.is_object()) {
        return protocol_error("Part is not a JSON object", "malformed_part");
    }
    const auto type = optional_string(value, "type");
    if (!type.has_value()) {
        return protocol_error("Part has no type", "malformed_part");
    }

    const json empty = json::object();
    const json& data = value.contains("data") && value.at("data").is_object()
                           ? value.at("data")
                           : empty;
    auto decoded = decode_data(type.value(), data);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }

    Part part;
    part.id = value.value("id", "");
    part.message_id = value.value("messageId", "");
    part.conversation_id = value.value("sessionId", "");
    part.data = core::errors::take_value(std::move(decoded));
    const auto now = std::chrono::system_clock::now();
    part.created_time = parse_timestamp(value.value("createdTime", "")).value_or(now);
    part.updated_time = parse_timestamp(value.value("updatedTime", "")).value_or(now);
    return part;
}

}  // namespace tandem::protocol
