#include "session/session_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/frame_contract.hpp"

namespace tandem::session {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::Status;
using core::errors::TandemError;
using protocol::Part;
using protocol::ToolCall;
using protocol::ToolResult;

// Round-scoped services for the engine: streams parts into the assistant
// message and out to whichever connection is bound, and routes tool calls.
class SessionCoordinator::Round : public runtime::RoundContext {
public:
    Round(SessionCoordinator& owner, std::shared_ptr<Conversation> conversation,
          std::string message_id)
        : owner_(owner),
          conversation_(std::move(conversation)),
          message_id_(std::move(message_id)) {}

    const std::string& conversation_id() const override { return conversation_->id(); }
    const std::string& message_id() const override { return message_id_; }

    Status emit(const Part& part) override {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        const bool known = conversation_->find_part(part.id).has_value();
        auto stored = known ? conversation_->update_part(part)
                            : conversation_->append_part(part);
        if (core::errors::is_error(stored)) {
            return stored;
        }
        // A dropped delivery is logged by the registry; the round carries on
        // against the stored conversation.
        auto sent = owner_.connections_.send_to(conversation_id(),
                                                protocol::part_frame(conversation_id(), part));
        static_cast<void>(sent);
        return core::errors::ok();
    }

    Result<ToolResult> invoke_tool(const ToolCall& call) override {
        protocol::ToolData data;
        data.tool_name = call.name;
        data.input = call.params;
        data.title = call.name;
        Part part = new_part(std::move(data));
        auto emitted = emit(part);
        if (core::errors::is_error(emitted)) {
            return core::errors::get_error(emitted);
        }

        auto started = protocol::start_tool(part);
        if (core::errors::is_error(started)) {
            return core::errors::get_error(started);
        }
        emitted = emit(part);
        if (core::errors::is_error(emitted)) {
            return core::errors::get_error(emitted);
        }

        Result<ToolResult> result = route(call);

        Status finished = core::errors::ok();
        if (core::errors::is_error(result)) {
            finished = protocol::fail_tool(part, core::errors::get_error(result).message);
        } else if (!core::errors::get_value(result).success) {
            finished = protocol::fail_tool(part, core::errors::get_value(result).error_message);
        } else {
            const auto& value = core::errors::get_value(result);
            finished = protocol::complete_tool(part, value.raw, call.name, value.output);
        }
        if (core::errors::is_error(finished)) {
            return core::errors::get_error(finished);
        }
        emitted = emit(part);
        if (core::errors::is_error(emitted)) {
            return core::errors::get_error(emitted);
        }
        return result;
    }

private:
    Result<ToolResult> route(const ToolCall& call) {
        if (!owner_.router_.must_forward(call.name)) {
            return owner_.router_.run_local(call);
        }

        auto connection = owner_.connections_.lookup(conversation_id());
        if (!connection) {
            TANDEM_LOG_WARN("Round: no connection to forward " + call.name);
            return TandemError{ErrorCategory::Transport,
                               "No IDE connection to run " + call.name,
                               "connection_closed"};
        }
        return owner_.correlator_.dispatch(*connection, conversation_id(), call.name,
                                           call.params, owner_.options_.tool_timeout);
    }

    SessionCoordinator& owner_;
    std::shared_ptr<Conversation> conversation_;
    const std::string message_id_;
    std::mutex emit_mutex_;
};

SessionCoordinator::SessionCoordinator(ConversationStore& store,
                                       ConnectionRegistry& connections,
                                       ToolCallCorrelator& correlator,
                                       const tools::ToolRouter& router,
                                       runtime::ReasoningEngine& engine,
                                       runtime::WorkerPool& pool,
                                       CoordinatorOptions options)
    : store_(store),
      connections_(connections),
      correlator_(correlator),
      router_(router),
      engine_(engine),
      pool_(pool),
      options_(options) {}

SessionCoordinator::~SessionCoordinator() {
    std::unique_lock<std::mutex> lock(in_flight_mutex_);
    idle_cv_.wait(lock, [this] { return running_tasks_ == 0; });
}

Result<SubmitOutcome> SessionCoordinator::submit(const std::string& conversation_id,
                                                 const std::string& text,
                                                 const SubmitOptions& options) {
    if (!accepting_.load()) {
        return TandemError{ErrorCategory::State, "Server is shutting down", "shutting_down"};
    }
    if (conversation_id.empty()) {
        return TandemError{ErrorCategory::Input, "Conversation id is required",
                           "missing_session_id"};
    }
    if (text.empty()) {
        return TandemError{ErrorCategory::Input, "Input is required", "missing_input"};
    }

    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_.find(conversation_id);
        if (it != in_flight_.end()) {
            auto added = it->second->add_message(make_user_message(conversation_id, text, true));
            if (core::errors::is_error(added)) {
                return core::errors::get_error(added);
            }
            TANDEM_LOG_INFO("SessionCoordinator: " + conversation_id +
                            " is busy, message queued for continuation");
            return SubmitOutcome::Queued;
        }
    }

    auto loaded = options.create_if_missing
                      ? store_.get_or_create(conversation_id, options.project_key)
                      : store_.find(conversation_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    auto conversation = core::errors::get_value(loaded);
    if (!conversation) {
        return TandemError{ErrorCategory::Input, "conversation not found",
                           "conversation_not_found"};
    }
    if (options.project_key.has_value()) conversation->set_project_key(*options.project_key);
    if (options.user_name.has_value()) conversation->set_user_name(*options.user_name);
    if (options.user_ip.has_value()) conversation->set_user_ip(*options.user_ip);

    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(conversation_id);
    if (it != in_flight_.end()) {
        // Another submit claimed the conversation while it was loading.
        auto added = it->second->add_message(make_user_message(conversation_id, text, true));
        if (core::errors::is_error(added)) {
            return core::errors::get_error(added);
        }
        return SubmitOutcome::Queued;
    }

    Message message = make_user_message(conversation_id, text);
    const std::string message_id = message.id;
    auto added = conversation->add_message(std::move(message));
    if (core::errors::is_error(added)) {
        return core::errors::get_error(added);
    }

    in_flight_.emplace(conversation_id, conversation);
    ++running_tasks_;
    conversation->mark_processing();
    auto scheduled = pool_.try_submit([this, conversation, message_id] {
        process(conversation, message_id);
    });
    if (core::errors::is_error(scheduled)) {
        in_flight_.erase(conversation_id);
        --running_tasks_;
        conversation->mark_idle();
        idle_cv_.notify_all();
        TANDEM_LOG_WARN("SessionCoordinator: rejected " + conversation_id + ": " +
                        core::errors::get_error(scheduled).message);
        return core::errors::get_error(scheduled);
    }

    TANDEM_LOG_INFO("SessionCoordinator: round scheduled for " + conversation_id);
    return SubmitOutcome::Started;
}

void SessionCoordinator::process(std::shared_ptr<Conversation> conversation,
                                 std::string user_message_id) {
    const std::string conversation_id = conversation->id();
    bool continuation = false;
    std::shared_ptr<transport::Connection> last_connection;

    for (;;) {
        core::logging::ScopedTraceId trace(core::logging::make_trace_id(conversation_id));
        TANDEM_LOG_INFO(std::string("SessionCoordinator: ") +
                        (continuation ? "continuation" : "round") + " started");

        const Status round = run_round_guarded(conversation, user_message_id, continuation);

        auto saved = store_.save(*conversation);
        if (core::errors::is_error(saved)) {
            TANDEM_LOG_ERROR("SessionCoordinator: could not save " + conversation_id + ": " +
                             core::errors::get_error(saved).message);
        }

        if (core::errors::is_error(round)) {
            const auto& error = core::errors::get_error(round);
            TANDEM_LOG_ERROR("SessionCoordinator: round failed [" + error.code + "] " +
                             error.message);
            static_cast<void>(
                connections_.send_to(conversation_id, protocol::error_frame(error.message)));
        } else {
            static_cast<void>(
                connections_.send_to(conversation_id, protocol::complete_frame(conversation_id)));
            TANDEM_LOG_INFO("SessionCoordinator: round completed");
        }

        last_connection = connections_.lookup(conversation_id);
        auto next = release_and_check(conversation, user_message_id);
        if (!next.has_value()) {
            break;
        }
        TANDEM_LOG_INFO("SessionCoordinator: continuing with message " + next->id);
        user_message_id = next->id;
        continuation = true;
    }

    if (options_.close_connection_after_rounds && last_connection) {
        connections_.unregister(conversation_id, last_connection->id());
        last_connection->close();
    }

    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    --running_tasks_;
    idle_cv_.notify_all();
}

Status SessionCoordinator::run_round_guarded(const std::shared_ptr<Conversation>& conversation,
                                             const std::string& user_message_id,
                                             const bool continuation) {
    try {
        return run_round(conversation, user_message_id, continuation);
    } catch (const std::exception& e) {
        return TandemError{ErrorCategory::Execution,
                           std::string("Reasoning failed: ") + e.what(), "round_failed"};
    } catch (...) {
        return TandemError{ErrorCategory::Internal, "Reasoning failed with an unknown error",
                           "round_failed"};
    }
}

Status SessionCoordinator::run_round(const std::shared_ptr<Conversation>& conversation,
                                     const std::string& user_message_id,
                                     const bool continuation) {
    auto user_message = conversation->find_message(user_message_id);
    if (!user_message.has_value()) {
        return TandemError{ErrorCategory::Internal,
                           "User message " + user_message_id + " disappeared",
                           "message_not_found"};
    }

    Message assistant = make_assistant_message(conversation->id());
    const std::string assistant_id = assistant.id;
    auto added = conversation->add_message(std::move(assistant));
    if (core::errors::is_error(added)) {
        return added;
    }

    // Deferred messages that landed before this round's assistant message
    // become reminders; later ones are picked up by a continuation.
    std::vector<Message> history = conversation->messages();
    history.erase(std::remove_if(history.begin(), history.end(),
                                 [&](const Message& m) {
                                     return m.id == user_message_id || m.id == assistant_id;
                                 }),
                  history.end());

    runtime::RoundInput input;
    input.conversation_id = conversation->id();
    input.user_message_id = user_message_id;
    input.text = user_message->content;
    input.reminders = render_pending_reminders(history);
    input.continuation = continuation;

    Round round(*this, conversation, assistant_id);
    return engine_.process(*conversation, input, round);
}

std::optional<Message> SessionCoordinator::release_and_check(
    const std::shared_ptr<Conversation>& conversation,
    const std::string& consumed_message_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(conversation->id());

    auto next = conversation->next_unanswered_user_message(consumed_message_id);
    if (next.has_value() && in_flight_.emplace(conversation->id(), conversation).second) {
        return next;
    }

    conversation->mark_idle();
    idle_cv_.notify_all();
    return std::nullopt;
}

bool SessionCoordinator::is_in_flight(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.count(conversation_id) > 0;
}

std::size_t SessionCoordinator::in_flight_count() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}

bool SessionCoordinator::wait_for_idle(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(in_flight_mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return in_flight_.empty() && running_tasks_ == 0; });
}

void SessionCoordinator::begin_shutdown() {
    accepting_.store(false);
}

std::string to_string(const SubmitOutcome outcome) {
    switch (outcome) {
        case SubmitOutcome::Started: return "started";
        case SubmitOutcome::Queued: return "queued";
    }
    return "unknown";
}

}  // namespace tandem::session
