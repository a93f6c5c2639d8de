#include "tools/knowledge_search.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace tandem::tools {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::TandemError;
using protocol::ToolResult;

namespace {

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

ToolResult failed(const std::string& message) {
    ToolResult result;
    result.success = false;
    result.error_message = message;
    return result;
}

}  // namespace

KnowledgeSearch::KnowledgeSearch(std::filesystem::path root) : root_(std::move(root)) {}

Result<std::filesystem::path> KnowledgeSearch::resolve_scope(
    const std::filesystem::path& target) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec) || ec) {
        return TandemError{ErrorCategory::Input,
                           "Knowledge root is not a directory: " + root_.string(),
                           "invalid_path"};
    }
    const auto canonical_root = std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return TandemError{ErrorCategory::Input,
                           "Unable to resolve knowledge root: " + root_.string(),
                           "invalid_path"};
    }

    auto candidate = target;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }
    const auto canonical_candidate = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return TandemError{ErrorCategory::Input,
                           "Unable to resolve scope: " + target.string(), "invalid_path"};
    }
    if (!is_within_root(canonical_root, canonical_candidate)) {
        return TandemError{ErrorCategory::Input,
                           "Scope escapes knowledge root: " + canonical_candidate.string(),
                           "path_outside_root"};
    }
    return canonical_candidate;
}

Result<ToolResult> KnowledgeSearch::search(const KnowledgeQuery& query) const {
    if (query.pattern.empty()) {
        return TandemError{ErrorCategory::Input, "Search pattern cannot be empty.",
                           "empty_search_pattern"};
    }
    if (query.max_matches == 0) {
        return TandemError{ErrorCategory::Input, "max_matches must be greater than zero.",
                           "invalid_search_limit"};
    }

    auto resolved = resolve_scope(query.scope);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (const auto& entry :
             std::filesystem::recursive_directory_iterator(scope_path, options, ec)) {
            if (!entry.is_regular_file(ec) || ec) {
                continue;
            }
            files.push_back(entry.path());
        }
    } else {
        return failed("Scope does not exist: " + scope_path.string());
    }

    constexpr std::uintmax_t kMaxFileBytes = 1024 * 1024;
    std::ostringstream out;
    std::size_t matches = 0;
    for (const auto& file : files) {
        if (matches >= query.max_matches) {
            break;
        }
        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxFileBytes || is_probably_binary(file)) {
            continue;
        }

        std::ifstream in(file);
        std::string line;
        std::size_t line_no = 0;
        while (in.is_open() && std::getline(in, line)) {
            ++line_no;
            if (line.find(query.pattern) == std::string::npos) {
                continue;
            }
            out << std::filesystem::relative(file, scope_path, ec).string() << ":"
                << line_no << ":" << trim_line(line) << "\n";
            if (++matches >= query.max_matches) {
                break;
            }
        }
    }

    ToolResult result;
    result.success = true;
    result.output = matches == 0 ? "No matches found." : out.str();
    result.raw = {{"pattern", query.pattern}, {"matches", matches}};
    return result;
}

Result<ToolResult> KnowledgeSearch::operator()(const nlohmann::json& params) const {
    KnowledgeQuery query;
    if (!params.is_object() || !params.contains("pattern") ||
        !params.at("pattern").is_string()) {
        return TandemError{ErrorCategory::Input, "knowledge_search needs a string pattern",
                           "empty_search_pattern"};
    }
    query.pattern = params.at("pattern").get<std::string>();
    if (params.contains("scope") && params.at("scope").is_string()) {
        query.scope = params.at("scope").get<std::string>();
    }
    if (params.contains("maxMatches") && params.at("maxMatches").is_number_unsigned()) {
        query.max_matches = params.at("maxMatches").get<std::size_t>();
    }
    return search(query);
}

}  // namespace tandem::tools
