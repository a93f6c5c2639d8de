#pragma once

#include <functional>
#include <string>
#include <vector>
#include "core/errors/tandem_errors.hpp"
#include "protocol/part_contract.hpp"

namespace tandem::runtime {

// Produces the conclusion of one subtask. An error blocks the subtask.
using SubTaskRunner =
    std::function<core::errors::Result<std::string>(const protocol::Part& subtask)>;

using PartEmitter = std::function<core::errors::Status(const protocol::Part& part)>;

// Runs SubTask parts in dependency waves. Each wave starts every subtask
// whose dependencies are all Completed, concurrently, and waits for all of
// them. A subtask depending on a Blocked, Cancelled or unknown subtask, or
// caught in a cycle, ends Blocked.
class SubTaskScheduler {
public:
    SubTaskScheduler(SubTaskRunner runner, PartEmitter emitter);

    // Returns the subtasks in their final state, in input order. Fails with
    // `wrong_part_type` if any part is not a SubTask, before running anything.
    core::errors::Result<std::vector<protocol::Part>> run(
        std::vector<protocol::Part> subtasks) const;

private:
    void publish(const protocol::Part& part) const;

    SubTaskRunner runner_;
    PartEmitter emitter_;
};

}  // namespace tandem::runtime
