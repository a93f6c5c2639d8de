#include "session/connection_registry.hpp"

#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace tandem::session {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::TandemError;

void ConnectionRegistry::register_connection(
    const std::string& conversation_id,
    std::shared_ptr<transport::Connection> connection) {
    const std::string connection_id = connection->id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bindings_[conversation_id] = std::move(connection);
    }
    TANDEM_LOG_INFO("ConnectionRegistry: " + conversation_id + " -> " + connection_id);
}

bool ConnectionRegistry::unregister(const std::string& conversation_id,
                                    const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(conversation_id);
    if (it == bindings_.end() || it->second->id() != connection_id) {
        return false;
    }
    bindings_.erase(it);
    TANDEM_LOG_INFO("ConnectionRegistry: unregistered " + conversation_id);
    return true;
}

std::vector<std::string> ConnectionRegistry::unregister_connection(
    const std::string& connection_id) {
    std::vector<std::string> removed;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = bindings_.begin(); it != bindings_.end();) {
        if (it->second->id() == connection_id) {
            removed.push_back(it->first);
            it = bindings_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::shared_ptr<transport::Connection> ConnectionRegistry::lookup(
    const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(conversation_id);
    if (it == bindings_.end()) {
        return nullptr;
    }
    return it->second;
}

Status ConnectionRegistry::send_to(const std::string& conversation_id,
                                   const nlohmann::json& frame) {
    auto connection = lookup(conversation_id);
    const std::string type = frame.value("type", "");
    if (!connection) {
        TANDEM_LOG_WARN("ConnectionRegistry: no connection for " + conversation_id +
                        ", dropping " + type + " frame");
        return TandemError{ErrorCategory::Transport,
                           "No connection attached to " + conversation_id,
                           "connection_closed"};
    }

    auto sent = connection->send(frame);
    if (core::errors::is_error(sent)) {
        TANDEM_LOG_WARN("ConnectionRegistry: dropping " + type + " frame for " +
                        conversation_id + ": " + core::errors::get_error(sent).message);
    }
    return sent;
}

void ConnectionRegistry::close(const std::string& conversation_id) {
    std::shared_ptr<transport::Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bindings_.find(conversation_id);
        if (it == bindings_.end()) {
            return;
        }
        connection = std::move(it->second);
        bindings_.erase(it);
    }
    TANDEM_LOG_INFO("ConnectionRegistry: closing connection " + connection->id() +
                    " for " + conversation_id);
    connection->close();
}

void ConnectionRegistry::close_all(const std::optional<nlohmann::json>& final_frame) {
    std::unordered_map<std::string, std::shared_ptr<transport::Connection>> bindings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bindings.swap(bindings_);
    }

    // Several conversations may share one connection.
    std::unordered_set<std::string> closed;
    for (auto& [conversation_id, connection] : bindings) {
        if (!closed.insert(connection->id()).second) {
            continue;
        }
        if (final_frame.has_value()) {
            auto sent = connection->send(final_frame.value());
            if (core::errors::is_error(sent)) {
                TANDEM_LOG_WARN("ConnectionRegistry: final frame to " + conversation_id +
                                " dropped: " + core::errors::get_error(sent).message);
            }
        }
        connection->close();
    }
}

std::size_t ConnectionRegistry::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

}  // namespace tandem::session
