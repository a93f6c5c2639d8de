#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"
#include "session/conversation.hpp"

namespace tandem::session {

// Storage boundary for conversation history. `load` yields nullptr when the
// conversation has never been saved.
class ConversationPersistence {
public:
    virtual ~ConversationPersistence() = default;
    virtual core::errors::Result<std::shared_ptr<Conversation>> load(
        const std::string& conversation_id) = 0;
    virtual core::errors::Status save(const Conversation& conversation) = 0;
};

class InMemoryPersistence : public ConversationPersistence {
public:
    core::errors::Result<std::shared_ptr<Conversation>> load(
        const std::string& conversation_id) override;
    core::errors::Status save(const Conversation& conversation) override;
    std::size_t save_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> snapshots_;
    std::size_t save_count_ = 0;
};

// One JSON document per conversation: <root>/<conversation_id>.json
class FilePersistence : public ConversationPersistence {
public:
    explicit FilePersistence(std::filesystem::path root);

    core::errors::Result<std::shared_ptr<Conversation>> load(
        const std::string& conversation_id) override;
    core::errors::Status save(const Conversation& conversation) override;

    core::errors::Result<std::filesystem::path> path_for(
        const std::string& conversation_id) const;

private:
    std::filesystem::path root_;
    std::mutex write_mutex_;
};

nlohmann::json conversation_to_json(const Conversation& conversation);
core::errors::Result<std::shared_ptr<Conversation>> conversation_from_json(
    const nlohmann::json& value);

// In-memory owner of every conversation not currently claimed by a round.
class ConversationStore {
public:
    explicit ConversationStore(std::shared_ptr<ConversationPersistence> persistence = nullptr);

    // Cached or persisted conversation; nullptr when neither exists.
    core::errors::Result<std::shared_ptr<Conversation>> find(
        const std::string& conversation_id);

    core::errors::Result<std::shared_ptr<Conversation>> get_or_create(
        const std::string& conversation_id,
        const std::optional<std::string>& project_key = std::nullopt);

    core::errors::Status save(const Conversation& conversation);

    // Marks the conversation Completed, e.g. once its client went away. With
    // persistence it is saved and dropped from the cache.
    void end(const std::string& conversation_id);

    std::size_t size() const;

private:
    core::errors::Result<std::shared_ptr<Conversation>> find_locked(
        const std::string& conversation_id);

    std::shared_ptr<ConversationPersistence> persistence_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Conversation>> conversations_;
};

}  // namespace tandem::session
