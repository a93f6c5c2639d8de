#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"
#include "transport/connection.hpp"

namespace tandem::session {

// conversation id -> currently attached connection. Rebuilt on every
// reconnect, never persisted.
class ConnectionRegistry {
public:
    // Replaces any existing binding for the conversation.
    void register_connection(const std::string& conversation_id,
                             std::shared_ptr<transport::Connection> connection);

    // Removes the binding only while `connection_id` is still the bound one,
    // so a late close of a replaced socket cannot detach its successor.
    bool unregister(const std::string& conversation_id, const std::string& connection_id);

    // Drops every binding held by the connection; returns the conversations
    // it was attached to.
    std::vector<std::string> unregister_connection(const std::string& connection_id);

    std::shared_ptr<transport::Connection> lookup(const std::string& conversation_id) const;

    // Delivers to whichever connection is bound right now. A missing or closed
    // connection drops the frame with a warning.
    core::errors::Status send_to(const std::string& conversation_id,
                                 const nlohmann::json& frame);

    // Unbinds and closes after queued frames are written.
    void close(const std::string& conversation_id);

    // Sends `final_frame` to every bound connection, then closes them all.
    void close_all(const std::optional<nlohmann::json>& final_frame = std::nullopt);

    std::size_t connection_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<transport::Connection>> bindings_;
};

}  // namespace tandem::session
