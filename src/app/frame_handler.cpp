#include "app/frame_handler.hpp"

#include <variant>
#include "core/logging/logger.hpp"
#include "protocol/frame_contract.hpp"

namespace tandem::app {

FrameHandler::FrameHandler(session::SessionCoordinator& coordinator,
                           session::ConnectionRegistry& connections,
                           session::ToolCallCorrelator& correlator,
                           session::ConversationStore& store)
    : coordinator_(coordinator),
      connections_(connections),
      correlator_(correlator),
      store_(store) {}

void FrameHandler::on_open(const std::shared_ptr<transport::Connection>& connection) {
    TANDEM_LOG_INFO("FrameHandler: connection " + connection->id() + " opened" +
                    (connection->peer_address().empty()
                         ? std::string()
                         : " from " + connection->peer_address()));
    reply(connection, protocol::connected_frame());
}

void FrameHandler::on_frame(const std::shared_ptr<transport::Connection>& connection,
                            const std::string& text) {
    TANDEM_LOG_DEBUG("Connection " + connection->id() + " -> " + text);
    auto decoded = protocol::decode_inbound(text);
    if (core::errors::is_error(decoded)) {
        const auto& error = core::errors::get_error(decoded);
        TANDEM_LOG_WARN("FrameHandler: rejected frame [" + error.code + "] " + error.message);
        reply(connection, protocol::error_frame(error.message));
        return;
    }

    const auto& frame = core::errors::get_value(decoded);
    if (const auto* request = std::get_if<protocol::ConversationRequest>(&frame)) {
        handle_request(connection, *request);
    } else if (std::holds_alternative<protocol::PingFrame>(frame)) {
        reply(connection, protocol::pong_frame(protocol::now_unix_ms()));
    } else if (std::holds_alternative<protocol::PongFrame>(frame)) {
        TANDEM_LOG_DEBUG("FrameHandler: pong from " + connection->id());
    } else if (const auto* result = std::get_if<protocol::ToolResultFrame>(&frame)) {
        correlator_.resolve(result->tool_call_id, result->payload);
    } else if (const auto* unknown = std::get_if<protocol::UnknownFrame>(&frame)) {
        TANDEM_LOG_WARN("FrameHandler: ignoring frame type " + unknown->type);
    }
}

void FrameHandler::on_close(const std::shared_ptr<transport::Connection>& connection) {
    const auto conversations = connections_.unregister_connection(connection->id());
    for (const auto& conversation_id : conversations) {
        // A running round keeps going and may deliver to a reconnecting client.
        if (!coordinator_.is_in_flight(conversation_id)) {
            store_.end(conversation_id);
        }
    }
    connection->close();
    TANDEM_LOG_INFO("FrameHandler: connection " + connection->id() + " closed");
}

void FrameHandler::handle_request(const std::shared_ptr<transport::Connection>& connection,
                                  const protocol::ConversationRequest& request) {
    connections_.register_connection(request.conversation_id, connection);

    session::SubmitOptions options;
    options.create_if_missing = request.kind == protocol::RequestKind::Analyze;
    options.project_key = request.project_key;
    options.user_name = request.user_name;
    options.user_ip = request.user_ip;
    if (!options.user_ip.has_value() && !connection->peer_address().empty()) {
        options.user_ip = connection->peer_address();
    }

    auto submitted = coordinator_.submit(request.conversation_id, request.input, options);
    if (core::errors::is_error(submitted)) {
        const auto& error = core::errors::get_error(submitted);
        TANDEM_LOG_WARN("FrameHandler: submit for " + request.conversation_id +
                        " failed [" + error.code + "] " + error.message);
        if (!coordinator_.is_in_flight(request.conversation_id)) {
            connections_.unregister(request.conversation_id, connection->id());
        }
        reply(connection, protocol::error_frame(error.message));
        return;
    }
    TANDEM_LOG_INFO("FrameHandler: " + request.conversation_id + " " +
                    session::to_string(core::errors::get_value(submitted)));
}

void FrameHandler::reply(const std::shared_ptr<transport::Connection>& connection,
                         const nlohmann::json& frame) {
    auto sent = connection->send(frame);
    if (core::errors::is_error(sent)) {
        TANDEM_LOG_WARN("FrameHandler: reply to " + connection->id() + " dropped: " +
                        core::errors::get_error(sent).message);
    }
}

}  // namespace tandem::app
