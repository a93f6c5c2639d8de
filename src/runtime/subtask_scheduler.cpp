#include "runtime/subtask_scheduler.hpp"

#include <exception>
#include <future>
#include <optional>
#include <unordered_map>
#include <utility>
#include "core/logging/logger.hpp"

namespace tandem::runtime {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::TandemError;
using protocol::Part;
using protocol::SubTaskData;
using protocol::SubTaskStatus;

namespace {

SubTaskData& subtask_of(Part& part) {
    return std::get<SubTaskData>(part.data);
}

// Reason the subtask can never run, if a dependency already rules it out.
std::optional<std::string> blocking_dependency(
    const SubTaskData& subtask, const std::unordered_map<std::string, std::size_t>& index,
    const std::vector<Part>& parts) {
    for (const auto& dependency : subtask.depends_on) {
        auto it = index.find(dependency);
        if (it == index.end()) {
            return "Unknown dependency " + dependency;
        }
        const auto status = std::get<SubTaskData>(parts[it->second].data).status;
        if (status == SubTaskStatus::Blocked || status == SubTaskStatus::Cancelled) {
            return "Dependency " + dependency + " ended " + protocol::to_string(status);
        }
    }
    return std::nullopt;
}

bool dependencies_met(const SubTaskData& subtask,
                      const std::unordered_map<std::string, std::size_t>& index,
                      const std::vector<Part>& parts) {
    for (const auto& dependency : subtask.depends_on) {
        const auto& status = std::get<SubTaskData>(parts[index.at(dependency)].data).status;
        if (status != SubTaskStatus::Completed) {
            return false;
        }
    }
    return true;
}

}  // namespace

SubTaskScheduler::SubTaskScheduler(SubTaskRunner runner, PartEmitter emitter)
    : runner_(std::move(runner)), emitter_(std::move(emitter)) {}

Result<std::vector<Part>> SubTaskScheduler::run(std::vector<Part> subtasks) const {
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < subtasks.size(); ++i) {
        if (subtasks[i].type() != protocol::PartType::SubTask) {
            return TandemError{ErrorCategory::Input,
                               "Part " + subtasks[i].id + " is not a subtask",
                               "wrong_part_type"};
        }
        if (!index.emplace(subtasks[i].id, i).second) {
            return TandemError{ErrorCategory::Input,
                               "Duplicate subtask id " + subtasks[i].id, "duplicate_part"};
        }
    }

    for (int wave = 1;; ++wave) {
        // Propagate blocks until stable so chains fail in one pass.
        bool changed = true;
        while (changed) {
            changed = false;
            for (auto& part : subtasks) {
                if (subtask_of(part).status != SubTaskStatus::Pending) {
                    continue;
                }
                if (auto reason = blocking_dependency(subtask_of(part), index, subtasks)) {
                    auto blocked = protocol::block_subtask(part, reason.value());
                    if (!core::errors::is_error(blocked)) {
                        publish(part);
                        changed = true;
                    }
                }
            }
        }

        std::vector<std::size_t> eligible;
        bool pending_left = false;
        for (std::size_t i = 0; i < subtasks.size(); ++i) {
            const auto& subtask = std::get<SubTaskData>(subtasks[i].data);
            if (subtask.status != SubTaskStatus::Pending) {
                continue;
            }
            pending_left = true;
            if (dependencies_met(subtask, index, subtasks)) {
                eligible.push_back(i);
            }
        }
        if (!pending_left) {
            break;
        }
        if (eligible.empty()) {
            for (auto& part : subtasks) {
                if (subtask_of(part).status == SubTaskStatus::Pending &&
                    !core::errors::is_error(
                        protocol::block_subtask(part, "Dependency cycle"))) {
                    publish(part);
                }
            }
            break;
        }

        TANDEM_LOG_INFO("SubTaskScheduler: wave " + std::to_string(wave) + " starts " +
                        std::to_string(eligible.size()) + " subtasks");
        std::vector<std::future<Result<std::string>>> running;
        running.reserve(eligible.size());
        for (const auto i : eligible) {
            auto started = protocol::start_subtask(subtasks[i]);
            if (core::errors::is_error(started)) {
                return core::errors::get_error(started);
            }
            publish(subtasks[i]);
            running.push_back(std::async(std::launch::async, runner_, subtasks[i]));
        }

        for (std::size_t k = 0; k < eligible.size(); ++k) {
            Part& part = subtasks[eligible[k]];
            Result<std::string> outcome = std::string();
            try {
                outcome = running[k].get();
            } catch (const std::exception& e) {
                outcome = TandemError{ErrorCategory::Execution, e.what(), "subtask_failed"};
            }

            const auto finished =
                core::errors::is_error(outcome)
                    ? protocol::block_subtask(part, core::errors::get_error(outcome).message)
                    : protocol::complete_subtask(part, core::errors::get_value(outcome));
            if (core::errors::is_error(finished)) {
                return core::errors::get_error(finished);
            }
            publish(part);
        }
    }

    return subtasks;
}

void SubTaskScheduler::publish(const Part& part) const {
    if (!emitter_) {
        return;
    }
    auto emitted = emitter_(part);
    if (core::errors::is_error(emitted)) {
        TANDEM_LOG_WARN("SubTaskScheduler: could not emit " + part.id + ": " +
                        core::errors::get_error(emitted).message);
    }
}

}  // namespace tandem::runtime
