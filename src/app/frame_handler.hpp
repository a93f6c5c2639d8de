#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/frame_contract.hpp"
#include "session/connection_registry.hpp"
#include "session/conversation_store.hpp"
#include "session/session_coordinator.hpp"
#include "session/tool_call_correlator.hpp"
#include "transport/connection.hpp"

namespace tandem::app {

// Routes decoded inbound frames of one connection to the coordinator, the
// correlator, or straight back to the client.
class FrameHandler {
public:
    FrameHandler(session::SessionCoordinator& coordinator,
                 session::ConnectionRegistry& connections,
                 session::ToolCallCorrelator& correlator,
                 session::ConversationStore& store);

    void on_open(const std::shared_ptr<transport::Connection>& connection);
    void on_frame(const std::shared_ptr<transport::Connection>& connection,
                  const std::string& text);
    void on_close(const std::shared_ptr<transport::Connection>& connection);

private:
    void handle_request(const std::shared_ptr<transport::Connection>& connection,
                        const protocol::ConversationRequest& request);
    void reply(const std::shared_ptr<transport::Connection>& connection,
               const nlohmann::json& frame);

    session::SessionCoordinator& coordinator_;
    session::ConnectionRegistry& connections_;
    session::ToolCallCorrelator& correlator_;
    session::ConversationStore& store_;
};

}  // namespace tandem::app
