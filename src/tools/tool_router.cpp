#include "tools/tool_router.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace tandem::tools {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::TandemError;
using protocol::ToolResult;

ToolRouter::ToolRouter(const std::vector<std::string>& forwarded_tools)
    : forwarded_(forwarded_tools.begin(), forwarded_tools.end()) {}

bool ToolRouter::must_forward(const std::string& tool_name) const {
    return forwarded_.count(tool_name) > 0;
}

void ToolRouter::register_local(const std::string& tool_name, LocalToolHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[tool_name] = std::move(handler);
}

bool ToolRouter::has_local(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(tool_name) > 0;
}

Result<ToolResult> ToolRouter::run_local(const protocol::ToolCall& call) const {
    LocalToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(call.name);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        return TandemError{ErrorCategory::Input, "Unknown tool: " + call.name,
                           "unknown_tool"};
    }

    const auto started = std::chrono::steady_clock::now();
    try {
        auto result = handler(call.params);
        if (!core::errors::is_error(result)) {
            auto& value = std::get<ToolResult>(result);
            value.duration_ms = std::chrono::duration<double, std::milli>(
                                    std::chrono::steady_clock::now() - started)
                                    .count();
        }
        return result;
    } catch (const std::exception& e) {
        TANDEM_LOG_ERROR("ToolRouter: local tool " + call.name + " threw: " + e.what());
        return TandemError{ErrorCategory::Execution,
                           "Tool " + call.name + " failed: " + e.what(),
                           "tool_failed"};
    }
}

}  // namespace tandem::tools
