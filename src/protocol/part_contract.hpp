#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"

namespace tandem::protocol {

using Timestamp = std::chrono::system_clock::time_point;

enum class PartType {
    Text,
    Reasoning,
    Tool,
    Goal,
    Progress,
    Todo,
    SubTask
};

enum class ToolStatus {
    Pending,
    Running,
    Completed,
    Error
};

enum class GoalStatus {
    Pending,
    InProgress,
    Completed,
    Cancelled
};

enum class TodoStatus {
    Pending,
    InProgress,
    Completed,
    Cancelled
};

enum class SubTaskStatus {
    Pending,
    InProgress,
    Completed,
    Blocked,
    Cancelled
};

struct TextData {
    std::string text;
};

struct ReasoningData {
    std::string text;
};

// Once `state` is Completed or Error the tool part is frozen.
struct ToolData {
    std::string tool_name;
    ToolStatus state = ToolStatus::Pending;
    nlohmann::json input = nlohmann::json::object();
    nlohmann::json output;
    std::string title;
    std::string content;
    std::optional<std::string> error;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;
};

struct GoalData {
    std::string title;
    std::string description;
    GoalStatus status = GoalStatus::Pending;
};

struct ProgressData {
    int current_step = 0;
    int total_steps = 0;
    std::string step_name;
};

struct TodoItem {
    std::string id;
    std::string content;
    TodoStatus status = TodoStatus::Pending;
};

struct TodoData {
    std::vector<TodoItem> items;
};

struct SubTaskData {
    std::string target;
    std::string question;
    std::string reason;
    std::vector<std::string> required_tools;
    SubTaskStatus status = SubTaskStatus::Pending;
    std::string conclusion;
    std::string block_reason;
    std::vector<std::string> depends_on;
};

using PartData = std::variant<TextData, ReasoningData, ToolData, GoalData,
                              ProgressData, TodoData, SubTaskData>;

// One structured unit of output inside a message. The conversation id always
// matches the owning message's conversation id.
struct Part {
    std::string id;
    std::string message_id;
    std::string conversation_id;
    Timestamp created_time;
    Timestamp updated_time;
    PartData data;

    PartType type() const;
    void touch();
};

Part make_part(const std::string& message_id, const std::string& conversation_id,
               PartData data);

// Tool state machine: Pending -> Running -> Completed, Pending|Running -> Error.
core::errors::Status start_tool(Part& part);
core::errors::Status complete_tool(Part& part, nlohmann::json output,
                                   const std::string& title,
                                   const std::string& content);
core::errors::Status fail_tool(Part& part, const std::string& error);
bool is_terminal(ToolStatus state);

// SubTask lifecycle
core::errors::Status start_subtask(Part& part);
core::errors::Status complete_subtask(Part& part, const std::string& conclusion);
core::errors::Status block_subtask(Part& part, const std::string& reason);
core::errors::Status cancel_subtask(Part& part);

// Todo helpers
TodoItem& add_todo_item(TodoData& todo, const std::string& content);
bool update_todo_status(TodoData& todo, const std::string& item_id, TodoStatus status);
std::size_t completed_count(const TodoData& todo);
double progress(const TodoData& todo);

// Wire names (upper case, as the IDE client expects)
std::string to_string(PartType type);
std::string to_string(ToolStatus status);
std::string to_string(GoalStatus status);
std::string to_string(TodoStatus status);
std::string to_string(SubTaskStatus status);

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string format_timestamp(Timestamp ts);

}  // namespace tandem::protocol
