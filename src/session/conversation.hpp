#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/tandem_errors.hpp"
#include "protocol/part_contract.hpp"

namespace tandem::session {

enum class Role {
    User,
    Assistant,
    System
};

enum class ConversationStatus {
    Idle,
    Processing,
    Completed
};

// Messages are append-only; an assistant message accumulates parts while a
// round streams.
struct Message {
    std::string id;
    std::string conversation_id;
    Role role = Role::User;
    std::string content;
    // Absorbed while a round was in flight; shown to the model as a reminder.
    bool deferred = false;
    std::vector<protocol::Part> parts;
    protocol::Timestamp created_time;
    protocol::Timestamp updated_time;

    bool is_user() const { return role == Role::User; }
    bool is_assistant() const { return role == Role::Assistant; }

    void touch();
    void add_part(protocol::Part part);
    const protocol::Part* find_part(const std::string& part_id) const;
    protocol::Part* find_part(const std::string& part_id);
    bool remove_part(const std::string& part_id);
};

Message make_user_message(const std::string& conversation_id, const std::string& text,
                          bool deferred = false);
Message make_assistant_message(const std::string& conversation_id);

// Thread-safe: a submitter may append user messages while the round thread
// appends parts. Readers get copies.
class Conversation {
public:
    explicit Conversation(std::string id);

    const std::string& id() const { return id_; }

    ConversationStatus status() const;
    void mark_processing();
    void mark_idle();
    void complete();

    std::optional<std::string> project_key() const;
    void set_project_key(std::string project_key);
    std::optional<std::string> user_name() const;
    void set_user_name(std::string user_name);
    std::optional<std::string> user_ip() const;
    void set_user_ip(std::string user_ip);

    protocol::Timestamp created_time() const;
    protocol::Timestamp updated_time() const;
    void set_created_time(protocol::Timestamp created_time);

    core::errors::Status add_message(Message message);
    std::vector<Message> messages() const;
    std::size_t message_count() const;
    std::optional<Message> find_message(const std::string& message_id) const;

    std::optional<Message> latest_message() const;
    std::optional<Message> latest_user_message() const;
    std::optional<Message> latest_assistant_message() const;

    // True when a user message follows `message_id`. An empty id means "no
    // assistant message yet": true when the latest message is a user message.
    bool has_new_user_message_after(const std::string& message_id) const;

    // Newest user message positioned after both the latest assistant message
    // and `consumed_message_id`, i.e. input nobody has answered yet.
    std::optional<Message> next_unanswered_user_message(
        const std::string& consumed_message_id) const;

    // Parts must carry this conversation's id and name an existing message.
    core::errors::Status append_part(const protocol::Part& part);
    // Replaces a stored part of the same kind. A finished Tool part keeps its state.
    core::errors::Status update_part(const protocol::Part& part);
    std::optional<protocol::Part> find_part(const std::string& part_id) const;

private:
    std::optional<std::size_t> index_of(const std::string& message_id) const;
    std::optional<std::size_t> latest_assistant_index() const;
    core::errors::Status check_part(const protocol::Part& part) const;
    void touch();

    const std::string id_;
    mutable std::mutex mutex_;
    ConversationStatus status_ = ConversationStatus::Idle;
    std::optional<std::string> project_key_;
    std::optional<std::string> user_name_;
    std::optional<std::string> user_ip_;
    std::vector<Message> messages_;
    protocol::Timestamp created_time_;
    protocol::Timestamp updated_time_;
};

// <system-reminder> block for deferred user messages that follow the latest
// assistant message in `messages`; empty when there are none.
std::string render_pending_reminders(const std::vector<Message>& messages);

std::string to_string(Role role);
std::string to_string(ConversationStatus status);

}  // namespace tandem::session
