#include "protocol/part_contract.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"

namespace tandem::protocol {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::TandemError;

namespace {

struct TypeOf {
    PartType operator()(const TextData&) const { return PartType::Text; }
    PartType operator()(const ReasoningData&) const { return PartType::Reasoning; }
    PartType operator()(const ToolData&) const { return PartType::Tool; }
    PartType operator()(const GoalData&) const { return PartType::Goal; }
    PartType operator()(const ProgressData&) const { return PartType::Progress; }
    PartType operator()(const TodoData&) const { return PartType::Todo; }
    PartType operator()(const SubTaskData&) const { return PartType::SubTask; }
};

TandemError wrong_variant(const Part& part, const std::string& expected) {
    return TandemError{ErrorCategory::State,
                       "Part " + part.id + " is " + to_string(part.type()) +
                           ", expected " + expected,
                       "wrong_part_type"};
}

TandemError illegal_tool_transition(const Part& part, const ToolStatus from,
                                    const ToolStatus to) {
    return TandemError{ErrorCategory::State,
                       "Tool part " + part.id + " cannot move from " +
                           to_string(from) + " to " + to_string(to),
                       "invalid_state_transition"};
}

bool is_subtask_final(const SubTaskStatus status) {
    return status == SubTaskStatus::Completed || status == SubTaskStatus::Cancelled;
}

}  // namespace

PartType Part::type() const {
    return std::visit(TypeOf{}, data);
}

void Part::touch() {
    updated_time = std::chrono::system_clock::now();
}

Part make_part(const std::string& message_id, const std::string& conversation_id,
               PartData data) {
    Part part;
    part.id = core::config::generate_id("part");
    part.message_id = message_id;
    part.conversation_id = conversation_id;
    part.created_time = std::chrono::system_clock::now();
    part.updated_time = part.created_time;
    part.data = std::move(data);
    return part;
}

bool is_terminal(const ToolStatus state) {
    return state == ToolStatus::Completed || state == ToolStatus::Error;
}

Status start_tool(Part& part) {
    auto* tool = std::get_if<ToolData>(&part.data);
    if (tool == nullptr) {
        return wrong_variant(part, "TOOL");
    }
    if (tool->state != ToolStatus::Pending) {
        return illegal_tool_transition(part, tool->state, ToolStatus::Running);
    }
    tool->state = ToolStatus::Running;
    tool->start_time = std::chrono::system_clock::now();
    part.touch();
    return core::errors::ok();
}

Status complete_tool(Part& part, nlohmann::json output, const std::string& title,
                     const std::string& content) {
    auto* tool = std::get_if<ToolData>(&part.data);
    if (tool == nullptr) {
        return wrong_variant(part, "TOOL");
    }
    if (tool->state != ToolStatus::Running) {
        return illegal_tool_transition(part, tool->state, ToolStatus::Completed);
    }
    tool->state = ToolStatus::Completed;
    tool->output = std::move(output);
    tool->title = title;
    tool->content = content;
    tool->end_time = std::chrono::system_clock::now();
    part.touch();
    return core::errors::ok();
}

Status fail_tool(Part& part, const std::string& error) {
    auto* tool = std::get_if<ToolData>(&part.data);
    if (tool == nullptr) {
        return wrong_variant(part, "TOOL");
    }
    if (is_terminal(tool->state)) {
        return illegal_tool_transition(part, tool->state, ToolStatus::Error);
    }
    tool->state = ToolStatus::Error;
    tool->error = error;
    tool->end_time = std::chrono::system_clock::now();
    part.touch();
    return core::errors::ok();
}

Status start_subtask(Part& part) {
    auto* subtask = std::get_if<SubTaskData>(&part.data);
    if (subtask == nullptr) {
        return wrong_variant(part, "SUBTASK");
    }
    if (subtask->status != SubTaskStatus::Pending) {
        return TandemError{ErrorCategory::State,
                           "SubTask " + part.id + " is already " +
                               to_string(subtask->status),
                           "invalid_state_transition"};
    }
    subtask->status = SubTaskStatus::InProgress;
    part.touch();
    return core::errors::ok();
}

Status complete_subtask(Part& part, const std::string& conclusion) {
    auto* subtask = std::get_if<SubTaskData>(&part.data);
    if (subtask == nullptr) {
        return wrong_variant(part, "SUBTASK");
    }
    if (is_subtask_final(subtask->status)) {
        return TandemError{ErrorCategory::State,
                           "SubTask " + part.id + " is already " +
                               to_string(subtask->status),
                           "invalid_state_transition"};
    }
    subtask->conclusion = conclusion;
    subtask->status = SubTaskStatus::Completed;
    part.touch();
    return core::errors::ok();
}

Status block_subtask(Part& part, const std::string& reason) {
    auto* subtask = std::get_if<SubTaskData>(&part.data);
    if (subtask == nullptr) {
        return wrong_variant(part, "SUBTASK");
    }
    if (is_subtask_final(subtask->status)) {
        return TandemError{ErrorCategory::State,
                           "SubTask " + part.id + " is already " +
                               to_string(subtask->status),
                           "invalid_state_transition"};
    }
    subtask->block_reason = reason;
    subtask->status = SubTaskStatus::Blocked;
    part.touch();
    return core::errors::ok();
}

Status cancel_subtask(Part& part) {
    auto* subtask = std::get_if<SubTaskData>(&part.data);
    if (subtask == nullptr) {
        return wrong_variant(part, "SUBTASK");
    }
    if (subtask->status == SubTaskStatus::Completed) {
        return TandemError{ErrorCategory::State,
                           "SubTask " + part.id + " is already COMPLETED",
                           "invalid_state_transition"};
    }
    subtask->status = SubTaskStatus::Cancelled;
    part.touch();
    return core::errors::ok();
}

TodoItem& add_todo_item(TodoData& todo, const std::string& content) {
    TodoItem item;
    item.id = core::config::generate_id("todo");
    item.content = content;
    item.status = TodoStatus::Pending;
    todo.items.push_back(std::move(item));
    return todo.items.back();
}

bool update_todo_status(TodoData& todo, const std::string& item_id,
                        const TodoStatus status) {
    for (auto& item : todo.items) {
        if (item.id == item_id) {
            item.status = status;
            return true;
        }
    }
    return false;
}

std::size_t completed_count(const TodoData& todo) {
    std::size_t count = 0;
    for (const auto& item : todo.items) {
        if (item.status == TodoStatus::Completed) {
            ++count;
        }
    }
    return count;
}

double progress(const TodoData& todo) {
    if (todo.items.empty()) {
        return 0.0;
    }
    return static_cast<double>(completed_count(todo)) /
           static_cast<double>(todo.items.size());
}

std::string to_string(const PartType type) {
    switch (type) {
        case PartType::Text:
            return "TEXT";
        case PartType::Reasoning:
            return "REASONING";
        case PartType::Tool:
            return "TOOL";
        case PartType::Goal:
            return "GOAL";
        case PartType::Progress:
            return "PROGRESS";
        case PartType::Todo:
            return "TODO";
        case PartType::SubTask:
            return "SUBTASK";
        default:
            return "UNKNOWN";
    }
}

std::string to_string(const ToolStatus status) {
    switch (status) {
        case ToolStatus::Pending:
            return "PENDING";
        case ToolStatus::Running:
            return "RUNNING";
        case ToolStatus::Completed:
            return "COMPLETED";
        case ToolStatus::Error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

std::string to_string(const GoalStatus status) {
    switch (status) {
        case GoalStatus::Pending:
            return "PENDING";
        case GoalStatus::InProgress:
            return "IN_PROGRESS";
        case GoalStatus::Completed:
            return "COMPLETED";
        case GoalStatus::Cancelled:
            return "CANCELLED";
        default:
            return "UNKNOWN";
    }
}

std::string to_string(const TodoStatus status) {
    switch (status) {
        case TodoStatus::Pending:
            return "PENDING";
        case TodoStatus::InProgress:
            return "IN_PROGRESS";
        case TodoStatus::Completed:
            return "COMPLETED";
        case TodoStatus::Cancelled:
            return "CANCELLED";
        default:
            return "UNKNOWN";
    }
}

std::string to_string(const SubTaskStatus status) {
    switch (status) {
        case SubTaskStatus::Pending:
            return "PENDING";
        case SubTaskStatus::InProgress:
            return "IN_PROGRESS";
        case SubTaskStatus::Completed:
            return "COMPLETED";
        case SubTaskStatus::Blocked:
            return "BLOCKED";
        case SubTaskStatus::Cancelled:
            return "CANCELLED";
        default:
            return "UNKNOWN";
    }
}

std::string format_timestamp(const Timestamp ts) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        ts.time_since_epoch())
                        .count();
    const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm utc_tm{};
    gmtime_r(&seconds, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3)
        << std::setfill('0') << (ms % 1000) << "Z";
    return oss.str();
}

}  // namespace tandem::protocol
