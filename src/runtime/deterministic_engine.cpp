#include "runtime/deterministic_engine.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/subtask_scheduler.hpp"

namespace tandem::runtime {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::Status;
using core::errors::TandemError;
using protocol::GoalData;
using protocol::GoalStatus;
using protocol::Part;
using protocol::ProgressData;
using protocol::SubTaskData;
using protocol::SubTaskStatus;
using protocol::TextData;
using protocol::ToolCall;

namespace {

constexpr std::size_t kMaxQuotedOutput = 400;

std::string strip_punctuation(std::string token) {
    while (!token.empty() && (token.back() == ',' || token.back() == ';' ||
                              token.back() == ':' || token.back() == '?' ||
                              token.back() == '!' || token.back() == ')' ||
                              token.back() == '.' || token.back() == '"' ||
                              token.back() == '\'')) {
        token.pop_back();
    }
    while (!token.empty() && (token.front() == '(' || token.front() == '"' ||
                              token.front() == '\'' || token.front() == '`')) {
        token.erase(token.begin());
    }
    if (!token.empty() && token.back() == '`') {
        token.pop_back();
    }
    return token;
}

std::string summarize(const std::string& text) {
    if (text.size() <= kMaxQuotedOutput) {
        return text;
    }
    return text.substr(0, kMaxQuotedOutput) + "...";
}

std::string goal_title(const std::string& input) {
    constexpr std::size_t kMaxTitle = 60;
    const auto newline = input.find('\n');
    std::string title = input.substr(0, newline);
    if (title.size() > kMaxTitle) {
        title = title.substr(0, kMaxTitle) + "...";
    }
    return title.empty() ? "Answer the request" : title;
}

}  // namespace

std::vector<std::string> find_path_tokens(const std::string& text, const std::size_t limit) {
    std::vector<std::string> paths;
    std::istringstream in(text);
    std::string raw;
    while (paths.size() < limit && in >> raw) {
        const std::string token = strip_punctuation(raw);
        if (token.size() < 3 || token.find("://") != std::string::npos) {
            continue;
        }
        const bool has_slash = token.find('/') != std::string::npos;
        const auto dot = token.rfind('.');
        const bool has_extension = dot != std::string::npos && dot > 0 &&
                                   dot + 1 < token.size() &&
                                   std::isalpha(static_cast<unsigned char>(token[dot + 1])) != 0;
        if (!has_extension && !(has_slash && token.front() != '/' && token.back() != '/')) {
            continue;
        }
        if (std::find(paths.begin(), paths.end(), token) == paths.end()) {
            paths.push_back(token);
        }
    }
    return paths;
}

std::string find_path_token(const std::string& text) {
    const auto paths = find_path_tokens(text, 1);
    return paths.empty() ? "" : paths.front();
}

std::string pick_search_pattern(const std::string& text) {
    std::string token;
    std::string fallback;
    for (const char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            token.push_back(c);
            continue;
        }
        if (!token.empty()) {
            if (token.size() >= 4) {
                return token;
            }
            if (fallback.empty()) {
                fallback = token;
            }
            token.clear();
        }
    }
    if (token.size() >= 4) {
        return token;
    }
    if (fallback.empty()) {
        fallback = token;
    }
    return fallback;
}

DeterministicEngine::DeterministicEngine(DeterministicEngineOptions options)
    : options_(options) {}

Status DeterministicEngine::process(const session::Conversation& conversation,
                                    const RoundInput& input, RoundContext& context) {
    const auto paths = find_path_tokens(input.text);
    const std::string pattern =
        options_.use_knowledge_search ? pick_search_pattern(input.text) : "";
    const int total_steps = 2 + (paths.empty() ? 0 : 1) + (pattern.empty() ? 0 : 1);
    int step = 0;

    Part goal = context.new_part(GoalData{goal_title(input.text), input.text,
                                          GoalStatus::InProgress});
    auto emitted = context.emit(goal);
    if (core::errors::is_error(emitted)) {
        return emitted;
    }

    Part progress = context.new_part(ProgressData{++step, total_steps, "Understanding request"});
    emitted = context.emit(progress);
    if (core::errors::is_error(emitted)) {
        return emitted;
    }

    std::ostringstream answer;
    if (input.continuation) {
        answer << "Picking up your follow-up message.\n";
    }
    if (!input.reminders.empty()) {
        answer << "I also saw what you sent while I was working.\n";
    }

    if (!paths.empty()) {
        std::get<ProgressData>(progress.data) = ProgressData{
            ++step, total_steps, "Reading " + std::to_string(paths.size()) + " file(s)"};
        progress.touch();
        emitted = context.emit(progress);
        if (core::errors::is_error(emitted)) {
            return emitted;
        }

        std::vector<Part> reads;
        for (const auto& path : paths) {
            SubTaskData subtask;
            subtask.target = path;
            subtask.question = "What does " + path + " contain?";
            subtask.reason = "Named in the request";
            subtask.required_tools = {"read_file"};
            reads.push_back(context.new_part(std::move(subtask)));
            emitted = context.emit(reads.back());
            if (core::errors::is_error(emitted)) {
                return emitted;
            }
        }

        SubTaskScheduler scheduler(
            [&context](const Part& part) -> Result<std::string> {
                const auto& target = std::get<SubTaskData>(part.data).target;
                auto read = context.invoke_tool(ToolCall{"read_file", {{"path", target}}});
                if (core::errors::is_error(read)) {
                    return core::errors::get_error(read);
                }
                const auto& result = core::errors::get_value(read);
                if (!result.success) {
                    return TandemError{ErrorCategory::Execution, result.error_message,
                                       "tool_failed"};
                }
                return summarize(result.output);
            },
            [&context](const Part& part) { return context.emit(part); });

        auto finished = scheduler.run(std::move(reads));
        if (core::errors::is_error(finished)) {
            return core::errors::get_error(finished);
        }
        for (const auto& part : core::errors::get_value(finished)) {
            const auto& subtask = std::get<SubTaskData>(part.data);
            if (subtask.status == SubTaskStatus::Completed) {
                answer << "Contents of " << subtask.target << ":\n" << subtask.conclusion << "\n";
            } else {
                TANDEM_LOG_WARN("DeterministicEngine: read_file " + subtask.target +
                                " failed: " + subtask.block_reason);
                answer << "I could not read " << subtask.target << ": "
                       << subtask.block_reason << "\n";
            }
        }
    }

    if (!pattern.empty()) {
        std::get<ProgressData>(progress.data) =
            ProgressData{++step, total_steps, "Searching knowledge for " + pattern};
        progress.touch();
        emitted = context.emit(progress);
        if (core::errors::is_error(emitted)) {
            return emitted;
        }

        auto found = context.invoke_tool(ToolCall{"knowledge_search", {{"pattern", pattern}}});
        if (!core::errors::is_error(found) && core::errors::get_value(found).success) {
            answer << "Knowledge notes for \"" << pattern << "\":\n"
                   << summarize(core::errors::get_value(found).output) << "\n";
        }
    }

    std::get<ProgressData>(progress.data) = ProgressData{++step, total_steps, "Composing answer"};
    progress.touch();
    emitted = context.emit(progress);
    if (core::errors::is_error(emitted)) {
        return emitted;
    }

    answer << "Conversation " << conversation.id() << " has "
           << conversation.message_count() << " messages. You said: " << input.text;
    emitted = context.emit(context.new_part(TextData{answer.str()}));
    if (core::errors::is_error(emitted)) {
        return emitted;
    }

    std::get<GoalData>(goal.data).status = GoalStatus::Completed;
    goal.touch();
    return context.emit(goal);
}

}  // namespace tandem::runtime
