#pragma once

#include <string>
#include <utility>
#include "core/errors/tandem_errors.hpp"
#include "protocol/part_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "session/conversation.hpp"

namespace tandem::runtime {

struct RoundInput {
    std::string conversation_id;
    std::string user_message_id;
    std::string text;
    // <system-reminder> block for messages absorbed during the previous round
    std::string reminders;
    bool continuation = false;
};

// Services a round offers to the engine driving it. Parts passed to `emit`
// belong to the round's assistant message.
class RoundContext {
public:
    virtual ~RoundContext() = default;

    virtual const std::string& conversation_id() const = 0;
    virtual const std::string& message_id() const = 0;

    // Appends the part (or updates it when the id is known) and streams it.
    // Safe to call from several threads; parts reach the client in call order.
    virtual core::errors::Status emit(const protocol::Part& part) = 0;

    // Runs the tool locally or on the IDE and streams its Tool part through
    // Pending, Running and a terminal state. Blocks the round until done.
    virtual core::errors::Result<protocol::ToolResult> invoke_tool(
        const protocol::ToolCall& call) = 0;

    protocol::Part new_part(protocol::PartData data) const {
        return protocol::make_part(message_id(), conversation_id(), std::move(data));
    }
};

// The model loop. Implementations stream everything they produce through
// the context; a returned error fails the round.
class ReasoningEngine {
public:
    virtual ~ReasoningEngine() = default;

    virtual core::errors::Status process(const session::Conversation& conversation,
                                         const RoundInput& input,
                                         RoundContext& context) = 0;
};

}  // namespace tandem::runtime
