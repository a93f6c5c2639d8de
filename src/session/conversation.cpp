#include "session/conversation.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"

namespace tandem::session {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::TandemError;
using protocol::Part;

namespace {

protocol::Timestamp now() {
    return std::chrono::system_clock::now();
}

Message make_message(const std::string& conversation_id, const Role role) {
    Message message;
    message.id = core::config::generate_id("msg");
    message.conversation_id = conversation_id;
    message.role = role;
    message.created_time = now();
    message.updated_time = message.created_time;
    return message;
}

}  // namespace

void Message::touch() {
    updated_time = now();
}

void Message::add_part(Part part) {
    parts.push_back(std::move(part));
    touch();
}

const Part* Message::find_part(const std::string& part_id) const {
    for (const auto& part : parts) {
        if (part.id == part_id) {
            return &part;
        }
    }
    return nullptr;
}

Part* Message::find_part(const std::string& part_id) {
    for (auto& part : parts) {
        if (part.id == part_id) {
            return &part;
        }
    }
    return nullptr;
}

bool Message::remove_part(const std::string& part_id) {
    for (auto it = parts.begin(); it != parts.end(); ++it) {
        if (it->id == part_id) {
            parts.erase(it);
            touch();
            return true;
        }
    }
    return false;
}

Message make_user_message(const std::string& conversation_id, const std::string& text,
                          const bool deferred) {
    Message message = make_message(conversation_id, Role::User);
    message.content = text;
    message.deferred = deferred;
    message.add_part(protocol::make_part(message.id, conversation_id,
                                         protocol::TextData{text}));
    return message;
}

Message make_assistant_message(const std::string& conversation_id) {
    return make_message(conversation_id, Role::Assistant);
}

Conversation::Conversation(std::string id)
    : id_(std::move(id)), created_time_(now()), updated_time_(created_time_) {}

ConversationStatus Conversation::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void Conversation::mark_processing() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = ConversationStatus::Processing;
    touch();
}

void Conversation::mark_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = ConversationStatus::Idle;
    touch();
}

void Conversation::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = ConversationStatus::Completed;
    touch();
}

std::optional<std::string> Conversation::project_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return project_key_;
}

void Conversation::set_project_key(std::string project_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    project_key_ = std::move(project_key);
    touch();
}

std::optional<std::string> Conversation::user_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_name_;
}

void Conversation::set_user_name(std::string user_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_name_ = std::move(user_name);
    touch();
}

std::optional<std::string> Conversation::user_ip() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_ip_;
}

void Conversation::set_user_ip(std::string user_ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_ip_ = std::move(user_ip);
    touch();
}

protocol::Timestamp Conversation::created_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_time_;
}

protocol::Timestamp Conversation::updated_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updated_time_;
}

void Conversation::set_created_time(const protocol::Timestamp created_time) {
    std::lock_guard<std::mutex> lock(mutex_);
    created_time_ = created_time;
}

Status Conversation::add_message(Message message) {
    if (message.conversation_id != id_) {
        return TandemError{ErrorCategory::State,
                           "Message " + message.id + " belongs to conversation " +
                               message.conversation_id + ", not " + id_,
                           "conversation_mismatch"};
    }
    for (const auto& part : message.parts) {
        if (part.conversation_id != id_ || part.message_id != message.id) {
            return TandemError{ErrorCategory::State,
                               "Part " + part.id + " does not belong to message " +
                                   message.id,
                               "conversation_mismatch"};
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (index_of(message.id).has_value()) {
        return TandemError{ErrorCategory::State,
                           "Message already present: " + message.id,
                           "duplicate_message"};
    }
    messages_.push_back(std::move(message));
    touch();
    return core::errors::ok();
}

std::vector<Message> Conversation::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::size_t Conversation::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::optional<Message> Conversation::find_message(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = index_of(message_id);
    if (!index.has_value()) {
        return std::nullopt;
    }
    return messages_[index.value()];
}

std::optional<Message> Conversation::latest_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (messages_.empty()) {
        return std::nullopt;
    }
    return messages_.back();
}

std::optional<Message> Conversation::latest_user_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (it->is_user()) {
            return *it;
        }
    }
    return std::nullopt;
}

std::optional<Message> Conversation::latest_assistant_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = latest_assistant_index();
    if (!index.has_value()) {
        return std::nullopt;
    }
    return messages_[index.value()];
}

bool Conversation::has_new_user_message_after(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (message_id.empty()) {
        return !messages_.empty() && messages_.back().is_user();
    }

    const auto index = index_of(message_id);
    if (!index.has_value()) {
        return false;
    }
    for (std::size_t i = index.value() + 1; i < messages_.size(); ++i) {
        if (messages_[i].is_user()) {
            return true;
        }
    }
    return false;
}

std::optional<Message> Conversation::next_unanswered_user_message(
    const std::string& consumed_message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t first_candidate = 0;
    if (const auto assistant = latest_assistant_index()) {
        first_candidate = assistant.value() + 1;
    }
    if (const auto consumed = index_of(consumed_message_id)) {
        first_candidate = std::max(first_candidate, consumed.value() + 1);
    }

    for (std::size_t i = messages_.size(); i > first_candidate; --i) {
        if (messages_[i - 1].is_user()) {
            return messages_[i - 1];
        }
    }
    return std::nullopt;
}

Status Conversation::append_part(const Part& part) {
    auto checked = check_part(part);
    if (core::errors::is_error(checked)) {
        return checked;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = index_of(part.message_id);
    if (!index.has_value()) {
        return TandemError{ErrorCategory::State,
                           "Unknown message " + part.message_id + " for part " + part.id,
                           "message_not_found"};
    }
    Message& message = messages_[index.value()];
    if (message.find_part(part.id) != nullptr) {
        return TandemError{ErrorCategory::State, "Part already present: " + part.id,
                           "duplicate_part"};
    }
    message.add_part(part);
    touch();
    return core::errors::ok();
}

Status Conversation::update_part(const Part& part) {
    auto checked = check_part(part);
    if (core::errors::is_error(checked)) {
        return checked;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = index_of(part.message_id);
    if (!index.has_value()) {
        return TandemError{ErrorCategory::State,
                           "Unknown message " + part.message_id + " for part " + part.id,
                           "message_not_found"};
    }
    Message& message = messages_[index.value()];
    Part* existing = message.find_part(part.id);
    if (existing == nullptr) {
        return TandemError{ErrorCategory::State, "Unknown part: " + part.id,
                           "part_not_found"};
    }
    if (existing->data.index() != part.data.index()) {
        return TandemError{ErrorCategory::State,
                           "Part " + part.id + " cannot change from " +
                               protocol::to_string(existing->type()) + " to " +
                               protocol::to_string(part.type()),
                           "invalid_state_transition"};
    }
    const auto* stored_tool = std::get_if<protocol::ToolData>(&existing->data);
    if (stored_tool != nullptr && protocol::is_terminal(stored_tool->state)) {
        const auto& incoming = std::get<protocol::ToolData>(part.data);
        if (incoming.state != stored_tool->state) {
            return TandemError{ErrorCategory::State,
                               "Tool part " + part.id + " is already " +
                                   protocol::to_string(stored_tool->state),
                               "invalid_state_transition"};
        }
    }
    *existing = part;
    message.touch();
    touch();
    return core::errors::ok();
}

std::optional<Part> Conversation::find_part(const std::string& part_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& message : messages_) {
        if (const Part* part = message.find_part(part_id)) {
            return *part;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> Conversation::index_of(const std::string& message_id) const {
    if (message_id.empty()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < messages_.size(); ++i) {
        if (messages_[i].id == message_id) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> Conversation::latest_assistant_index() const {
    for (std::size_t i = messages_.size(); i > 0; --i) {
        if (messages_[i - 1].is_assistant()) {
            return i - 1;
        }
    }
    return std::nullopt;
}

Status Conversation::check_part(const Part& part) const {
    if (part.conversation_id != id_) {
        return TandemError{ErrorCategory::State,
                           "Part " + part.id + " belongs to conversation " +
                               part.conversation_id + ", not " + id_,
                           "conversation_mismatch"};
    }
    return core::errors::ok();
}

void Conversation::touch() {
    updated_time_ = now();
}

std::string render_pending_reminders(const std::vector<Message>& messages) {
    std::size_t first = 0;
    for (std::size_t i = messages.size(); i > 0; --i) {
        if (messages[i - 1].is_assistant()) {
            first = i;
            break;
        }
    }

    std::ostringstream body;
    bool any = false;
    for (std::size_t i = first; i < messages.size(); ++i) {
        if (messages[i].is_user() && messages[i].deferred) {
            body << messages[i].content << "\n";
            any = true;
        }
    }
    if (!any) {
        return "";
    }

    std::ostringstream out;
    out << "<system-reminder>\n"
        << "The user sent the following message while you were working:\n\n"
        << body.str()
        << "\nRespond to it now and adjust your plan.\n"
        << "</system-reminder>\n";
    return out.str();
}

std::string to_string(const Role role) {
    switch (role) {
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
        case Role::System:
            return "system";
        default:
            return "unknown";
    }
}

std::string to_string(const ConversationStatus status) {
    switch (status) {
        case ConversationStatus::Idle:
            return "idle";
        case ConversationStatus::Processing:
            return "processing";
        case ConversationStatus::Completed:
            return "completed";
        default:
            return "unknown";
    }
}

}  // namespace tandem::session
