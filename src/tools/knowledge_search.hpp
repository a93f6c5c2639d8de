#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace tandem::tools {

struct KnowledgeQuery {
    std::string pattern;
    std::filesystem::path scope = ".";
    std::size_t max_matches = 20;
};

// Plain substring search over the text files below a fixed root. Registered
// as the local `knowledge_search` tool.
class KnowledgeSearch {
public:
    explicit KnowledgeSearch(std::filesystem::path root);

    core::errors::Result<protocol::ToolResult> search(const KnowledgeQuery& query) const;

    // Tool entry point: {"pattern": "...", "scope"?: "sub/dir", "maxMatches"?: N}
    core::errors::Result<protocol::ToolResult> operator()(const nlohmann::json& params) const;

    // Canonical form of `target` when it stays inside the root.
    core::errors::Result<std::filesystem::path> resolve_scope(
        const std::filesystem::path& target) const;

private:
    std::filesystem::path root_;
};

}  // namespace tandem::tools
