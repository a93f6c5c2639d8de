#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "runtime/reasoning_engine.hpp"

namespace tandem::runtime {

struct DeterministicEngineOptions {
    // Also query the local knowledge_search tool with a keyword from the input.
    bool use_knowledge_search = false;
};

// Model-free engine: Goal, Progress steps, one read_file SubTask per path the
// input names (run through SubTaskScheduler), optionally a local knowledge
// search, then a Text answer.
class DeterministicEngine : public ReasoningEngine {
public:
    explicit DeterministicEngine(DeterministicEngineOptions options = {});

    core::errors::Status process(const session::Conversation& conversation,
                                 const RoundInput& input,
                                 RoundContext& context) override;

private:
    DeterministicEngineOptions options_;
};

// Whitespace-separated tokens that look like file paths, e.g. "src/Main.java"
// or "pom.xml", deduplicated, in order, at most `limit` of them.
std::vector<std::string> find_path_tokens(const std::string& text, std::size_t limit = 4);

// First path token; empty when there is none.
std::string find_path_token(const std::string& text);

// First alphanumeric run of 4+ chars, else the first shorter run.
std::string pick_search_pattern(const std::string& text);

}  // namespace tandem::runtime
