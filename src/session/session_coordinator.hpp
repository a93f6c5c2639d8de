#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/tandem_errors.hpp"
#include "runtime/reasoning_engine.hpp"
#include "runtime/worker_pool.hpp"
#include "session/connection_registry.hpp"
#include "session/conversation.hpp"
#include "session/conversation_store.hpp"
#include "session/tool_call_correlator.hpp"
#include "tools/tool_router.hpp"

namespace tandem::session {

enum class SubmitOutcome {
    Started,  // a new round was scheduled
    Queued    // a round is running; the message waits for a continuation
};

struct SubmitOptions {
    // `analyze` opens a conversation, `chat` needs one that already exists.
    bool create_if_missing = true;
    std::optional<std::string> project_key;
    std::optional<std::string> user_name;
    std::optional<std::string> user_ip;
};

struct CoordinatorOptions {
    std::chrono::milliseconds tool_timeout{30000};
    // Close the bound connection once a conversation has no more rounds to run.
    bool close_connection_after_rounds = true;
};

// Runs at most one reasoning round per conversation. Input that arrives
// while a round is in flight is stored as a deferred message and answered by
// a continuation round once the current one has been released.
class SessionCoordinator {
public:
    SessionCoordinator(ConversationStore& store, ConnectionRegistry& connections,
                       ToolCallCorrelator& correlator, const tools::ToolRouter& router,
                       runtime::ReasoningEngine& engine, runtime::WorkerPool& pool,
                       CoordinatorOptions options = {});

    // Waits for scheduled rounds to finish.
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    core::errors::Result<SubmitOutcome> submit(const std::string& conversation_id,
                                               const std::string& text,
                                               const SubmitOptions& options = {});

    bool is_in_flight(const std::string& conversation_id) const;
    std::size_t in_flight_count() const;

    // True once no round is in flight and every round task has returned;
    // false if `timeout` passes first.
    bool wait_for_idle(std::chrono::milliseconds timeout);

    // Later submissions fail with `shutting_down`; running rounds finish.
    void begin_shutdown();
    bool accepting() const { return accepting_.load(); }

private:
    class Round;

    void process(std::shared_ptr<Conversation> conversation, std::string user_message_id);
    core::errors::Status run_round(const std::shared_ptr<Conversation>& conversation,
                                   const std::string& user_message_id, bool continuation);
    core::errors::Status run_round_guarded(const std::shared_ptr<Conversation>& conversation,
                                           const std::string& user_message_id,
                                           bool continuation);

    // Unmarks the conversation, then looks for input that arrived during the
    // round. When there is some, the conversation is marked again and the
    // message to answer is returned.
    std::optional<Message> release_and_check(const std::shared_ptr<Conversation>& conversation,
                                             const std::string& consumed_message_id);

    ConversationStore& store_;
    ConnectionRegistry& connections_;
    ToolCallCorrelator& correlator_;
    const tools::ToolRouter& router_;
    runtime::ReasoningEngine& engine_;
    runtime::WorkerPool& pool_;
    const CoordinatorOptions options_;

    std::atomic_bool accepting_{true};
    mutable std::mutex in_flight_mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, std::shared_ptr<Conversation>> in_flight_;
    std::size_t running_tasks_ = 0;
};

std::string to_string(SubmitOutcome outcome);

}  // namespace tandem::session
