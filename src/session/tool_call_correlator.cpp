#include "session/tool_call_correlator.hpp"

#include <utility>
#include <vector>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "protocol/frame_contract.hpp"

namespace tandem::session {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::TandemError;
using protocol::ToolResult;

Result<ToolResult> ToolCallCorrelator::dispatch(transport::Connection& connection,
                                                const std::string& conversation_id,
                                                const std::string& tool_name,
                                                const nlohmann::json& params,
                                                const std::chrono::milliseconds timeout) {
    auto pending = std::make_shared<PendingToolCall>();
    pending->tool_call_id = core::config::generate_tool_call_id(tool_name);
    pending->conversation_id = conversation_id;
    pending->tool_name = tool_name;
    auto future = pending->slot.get_future();
    const std::string tool_call_id = pending->tool_call_id;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.emplace(tool_call_id, pending).second) {
            return TandemError{ErrorCategory::Internal,
                               "Duplicate tool call id " + tool_call_id,
                               "duplicate_tool_call_id"};
        }
    }

    const auto started = std::chrono::steady_clock::now();
    auto sent = connection.send(protocol::tool_call_frame(tool_call_id, tool_name, params));
    if (core::errors::is_error(sent)) {
        claim(tool_call_id);
        TANDEM_LOG_WARN("ToolCallCorrelator: could not send " + tool_name + " (" +
                        tool_call_id + "): " + core::errors::get_error(sent).message);
        return core::errors::get_error(sent);
    }
    TANDEM_LOG_INFO("ToolCallCorrelator: dispatched " + tool_name + " as " + tool_call_id);

    if (future.wait_for(timeout) != std::future_status::ready) {
        if (claim(tool_call_id)) {
            TANDEM_LOG_WARN("ToolCallCorrelator: " + tool_name + " (" + tool_call_id +
                            ") timed out after " + std::to_string(timeout.count()) + "ms");
            return TandemError{ErrorCategory::Timeout,
                               "Tool " + tool_name + " did not answer within " +
                                   std::to_string(timeout.count()) + "ms",
                               "tool_call_timeout"};
        }
        // A resolver claimed the slot first; its value is on the way.
    }

    auto result = future.get();
    if (!core::errors::is_error(result)) {
        auto& value = std::get<ToolResult>(result);
        value.duration_ms = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - started)
                                .count();
    }
    return result;
}

bool ToolCallCorrelator::resolve(const std::string& tool_call_id,
                                 const nlohmann::json& payload) {
    auto pending = claim(tool_call_id);
    if (!pending) {
        TANDEM_LOG_WARN("ToolCallCorrelator: no pending call for " + tool_call_id +
                        ", dropping result");
        return false;
    }

    pending->slot.set_value(protocol::tool_result_from_payload(tool_call_id, payload));
    TANDEM_LOG_INFO("ToolCallCorrelator: resolved " + pending->tool_name + " (" +
                    tool_call_id + ")");
    return true;
}

std::size_t ToolCallCorrelator::fail_all(const std::string& reason) {
    std::vector<std::shared_ptr<PendingToolCall>> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released.reserve(pending_.size());
        for (auto& [id, pending] : pending_) {
            released.push_back(std::move(pending));
        }
        pending_.clear();
    }
    for (auto& pending : released) {
        pending->slot.set_value(TandemError{ErrorCategory::Transport, reason,
                                            "connection_closed"});
    }
    return released.size();
}

std::size_t ToolCallCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::shared_ptr<ToolCallCorrelator::PendingToolCall> ToolCallCorrelator::claim(
    const std::string& tool_call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(tool_call_id);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto pending = std::move(it->second);
    pending_.erase(it);
    return pending;
}

}  // namespace tandem::session
