#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "transport/connection.hpp"

namespace tandem::session {

// Request/response over a connection that only delivers uncorrelated frames.
// Every dispatch gets a fresh tool call id and a single-resolution slot; a
// slot is claimed exactly once, by `resolve` or by the timeout.
class ToolCallCorrelator {
public:
    // Sends a TOOL_CALL frame and blocks the calling round until the matching
    // result arrives or `timeout` passes.
    core::errors::Result<protocol::ToolResult> dispatch(
        transport::Connection& connection,
        const std::string& conversation_id,
        const std::string& tool_name,
        const nlohmann::json& params,
        std::chrono::milliseconds timeout);

    // False when nothing waits on `tool_call_id`: late, duplicate or unknown.
    bool resolve(const std::string& tool_call_id, const nlohmann::json& payload);

    // Fails every waiter, e.g. on shutdown. Returns how many were released.
    std::size_t fail_all(const std::string& reason);

    std::size_t pending_count() const;

private:
    struct PendingToolCall {
        std::string tool_call_id;
        std::string conversation_id;
        std::string tool_name;
        std::promise<core::errors::Result<protocol::ToolResult>> slot;
    };

    std::shared_ptr<PendingToolCall> claim(const std::string& tool_call_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PendingToolCall>> pending_;
};

}  // namespace tandem::session
