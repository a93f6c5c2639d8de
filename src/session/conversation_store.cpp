#include "session/conversation_store.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/frame_contract.hpp"

namespace tandem::session {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::Status;
using core::errors::TandemError;
using nlohmann::json;

namespace {

std::optional<Role> parse_role(const std::string& text) {
    if (text == "user") return Role::User;
    if (text == "assistant") return Role::Assistant;
    if (text == "system") return Role::System;
    return std::nullopt;
}

std::optional<ConversationStatus> parse_status(const std::string& text) {
    if (text == "idle") return ConversationStatus::Idle;
    if (text == "processing") return ConversationStatus::Processing;
    if (text == "completed") return ConversationStatus::Completed;
    return std::nullopt;
}

std::int64_t to_unix_ms(const protocol::Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch())
        .count();
}

protocol::Timestamp from_unix_ms(const std::int64_t ms) {
    return protocol::Timestamp(std::chrono::milliseconds(ms));
}

TandemError corrupt(const std::string& message) {
    return TandemError{ErrorCategory::Internal, message, "conversation_corrupt"};
}

bool is_safe_file_name(const std::string& conversation_id) {
    if (conversation_id.empty() || conversation_id == "." || conversation_id == "..") {
        return false;
    }
    return conversation_id.find('/') == std::string::npos &&
           conversation_id.find('\\') == std::string::npos;
}

}  // namespace

json conversation_to_json(const Conversation& conversation) {
    json value;
    value["id"] = conversation.id();
    value["status"] = to_string(conversation.status());
    value["createdMs"] = to_unix_ms(conversation.created_time());
    if (const auto project_key = conversation.project_key()) {
        value["projectKey"] = project_key.value();
    }
    if (const auto user_name = conversation.user_name()) {
        value["userName"] = user_name.value();
    }
    if (const auto user_ip = conversation.user_ip()) {
        value["userIp"] = user_ip.value();
    }

    value["messages"] = json::array();
    for (const auto& message : conversation.messages()) {
        json entry;
        entry["id"] = message.id;
        entry["role"] = to_string(message.role);
        entry["content"] = message.content;
        entry["deferred"] = message.deferred;
        entry["createdMs"] = to_unix_ms(message.created_time);
        entry["updatedMs"] = to_unix_ms(message.updated_time);
        entry["parts"] = json::array();
        for (const auto& part : message.parts) {
            entry["parts"].push_back(protocol::part_to_json(part));
        }
        value["messages"].push_back(std::move(entry));
    }
    return value;
}

Result<std::shared_ptr<Conversation>> conversation_from_json(const json& value) {
    if (!value.is_object() || !value.contains("id") || !value.at("id").is_string()) {
        return corrupt("Conversation document has no id");
    }

    auto conversation = std::make_shared<Conversation>(value.at("id").get<std::string>());
    if (value.contains("createdMs") && value.at("createdMs").is_number_integer()) {
        conversation->set_created_time(from_unix_ms(value.at("createdMs").get<std::int64_t>()));
    }
    if (value.contains("projectKey") && value.at("projectKey").is_string()) {
        conversation->set_project_key(value.at("projectKey").get<std::string>());
    }
    if (value.contains("userName") && value.at("userName").is_string()) {
        conversation->set_user_name(value.at("userName").get<std::string>());
    }
    if (value.contains("userIp") && value.at("userIp").is_string()) {
        conversation->set_user_ip(value.at("userIp").get<std::string>());
    }

    if (value.contains("messages") && value.at("messages").is_array()) {
        for (const auto& entry : value.at("messages")) {
            if (!entry.is_object()) {
                return corrupt("Message entry is not an object");
            }
            const auto role = parse_role(entry.value("role", ""));
            if (!role.has_value()) {
                return corrupt("Message has an unknown role");
            }

            Message message;
            message.id = entry.value("id", "");
            message.conversation_id = conversation->id();
            message.role = role.value();
            message.content = entry.value("content", "");
            message.deferred = entry.value("deferred", false);
            message.created_time = from_unix_ms(entry.value("createdMs", std::int64_t{0}));
            message.updated_time = from_unix_ms(entry.value("updatedMs", std::int64_t{0}));
            if (entry.contains("parts") && entry.at("parts").is_array()) {
                for (const auto& part_value : entry.at("parts")) {
                    auto part = protocol::part_from_json(part_value);
                    if (core::errors::is_error(part)) {
                        return core::errors::get_error(part);
                    }
                    message.parts.push_back(core::errors::take_value(std::move(part)));
                }
            }

            auto added = conversation->add_message(std::move(message));
            if (core::errors::is_error(added)) {
                return core::errors::get_error(added);
            }
        }
    }

    // A persisted "processing" status is stale after a restart.
    const auto status = parse_status(value.value("status", "idle"));
    if (status == ConversationStatus::Completed) {
        conversation->complete();
    } else {
        conversation->mark_idle();
    }
    return conversation;
}

Result<std::shared_ptr<Conversation>> InMemoryPersistence::load(
    const std::string& conversation_id) {
    json snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = snapshots_.find(conversation_id);
        if (it == snapshots_.end()) {
            return std::shared_ptr<Conversation>{};
        }
        snapshot = it->second;
    }
    return conversation_from_json(snapshot);
}

Status InMemoryPersistence::save(const Conversation& conversation) {
    json snapshot = conversation_to_json(conversation);
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_[conversation.id()] = std::move(snapshot);
    ++save_count_;
    return core::errors::ok();
}

std::size_t InMemoryPersistence::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

FilePersistence::FilePersistence(std::filesystem::path root) : root_(std::move(root)) {}

Result<std::filesystem::path> FilePersistence::path_for(
    const std::string& conversation_id) const {
    if (!is_safe_file_name(conversation_id)) {
        return TandemError{ErrorCategory::Input,
                           "Conversation id is not usable as a file name: " +
                               conversation_id,
                           "invalid_conversation_id"};
    }
    return root_ / (conversation_id + ".json");
}

Result<std::shared_ptr<Conversation>> FilePersistence::load(
    const std::string& conversation_id) {
    auto path_result = path_for(conversation_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return std::shared_ptr<Conversation>{};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return TandemError{ErrorCategory::Internal,
                           "Unable to open conversation file: " + path.string(),
                           "conversation_open_failed"};
    }
    const json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return corrupt("Conversation file is not valid JSON: " + path.string());
    }
    return conversation_from_json(doc);
}

Status FilePersistence::save(const Conversation& conversation) {
    auto path_result = path_for(conversation.id());
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);
    const std::string payload = conversation_to_json(conversation)
                                    .dump(2, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(write_mutex_);
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return TandemError{ErrorCategory::Internal,
                           "Unable to create store directory: " + root_.string(),
                           "store_dir_create_failed"};
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return TandemError{ErrorCategory::Internal,
                               "Unable to open conversation file: " + tmp.string(),
                               "conversation_write_failed"};
        }
        out << payload;
        if (!out.good()) {
            return TandemError{ErrorCategory::Internal,
                               "Unable to write conversation file: " + tmp.string(),
                               "conversation_write_failed"};
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp, cleanup_ec);
        return TandemError{ErrorCategory::Internal,
                           "Unable to replace conversation file: " + path.string(),
                           "conversation_write_failed"};
    }
    return core::errors::ok();
}

ConversationStore::ConversationStore(std::shared_ptr<ConversationPersistence> persistence)
    : persistence_(std::move(persistence)) {}

Result<std::shared_ptr<Conversation>> ConversationStore::find(
    const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(conversation_id);
}

Result<std::shared_ptr<Conversation>> ConversationStore::get_or_create(
    const std::string& conversation_id, const std::optional<std::string>& project_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = find_locked(conversation_id);
    if (core::errors::is_error(found)) {
        return found;
    }
    if (auto existing = core::errors::get_value(found)) {
        return existing;
    }

    auto conversation = std::make_shared<Conversation>(conversation_id);
    if (project_key.has_value()) {
        conversation->set_project_key(project_key.value());
    }
    conversations_.emplace(conversation_id, conversation);
    TANDEM_LOG_INFO("ConversationStore: created conversation " + conversation_id);
    return conversation;
}

Result<std::shared_ptr<Conversation>> ConversationStore::find_locked(
    const std::string& conversation_id) {
    auto it = conversations_.find(conversation_id);
    if (it != conversations_.end()) {
        return it->second;
    }
    if (!persistence_) {
        return std::shared_ptr<Conversation>{};
    }

    auto loaded = persistence_->load(conversation_id);
    if (core::errors::is_error(loaded)) {
        return loaded;
    }
    auto conversation = core::errors::get_value(loaded);
    if (conversation) {
        conversations_.emplace(conversation_id, conversation);
        TANDEM_LOG_INFO("ConversationStore: loaded conversation " + conversation_id +
                        " (" + std::to_string(conversation->message_count()) +
                        " messages)");
    }
    return conversation;
}

Status ConversationStore::save(const Conversation& conversation) {
    if (!persistence_) {
        return core::errors::ok();
    }
    return persistence_->save(conversation);
}

void ConversationStore::end(const std::string& conversation_id) {
    std::shared_ptr<Conversation> conversation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = conversations_.find(conversation_id);
        if (it == conversations_.end()) {
            return;
        }
        conversation = it->second;
    }
    conversation->complete();
    TANDEM_LOG_INFO("ConversationStore: conversation " + conversation_id + " completed");

    // Without persistence the cache is the only copy.
    if (!persistence_) {
        return;
    }
    auto saved = persistence_->save(*conversation);
    if (core::errors::is_error(saved)) {
        TANDEM_LOG_ERROR("ConversationStore: could not save ended conversation " +
                         conversation_id + ": " + core::errors::get_error(saved).message);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it != conversations_.end() && it->second == conversation) {
        conversations_.erase(it);
    }
}

std::size_t ConversationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

}  // namespace tandem::session
