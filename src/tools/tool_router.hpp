#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace tandem::tools {

using LocalToolHandler =
    std::function<core::errors::Result<protocol::ToolResult>(const nlohmann::json& params)>;

// Decides per call whether a tool runs on the IDE or in-process.
class ToolRouter {
public:
    explicit ToolRouter(const std::vector<std::string>& forwarded_tools);

    bool must_forward(const std::string& tool_name) const;

    void register_local(const std::string& tool_name, LocalToolHandler handler);
    bool has_local(const std::string& tool_name) const;

    // Runs on the caller's thread. Fails with `unknown_tool` when no handler
    // is registered.
    core::errors::Result<protocol::ToolResult> run_local(
        const protocol::ToolCall& call) const;

private:
    const std::unordered_set<std::string> forwarded_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LocalToolHandler> handlers_;
};

}  // namespace tandem::tools
