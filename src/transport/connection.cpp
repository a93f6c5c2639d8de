#include "transport/connection.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace tandem::transport {

Connection::Connection(std::string id, std::shared_ptr<Transport> transport,
                       std::string peer_address)
    : id_(std::move(id)),
      peer_address_(std::move(peer_address)),
      transport_(transport),
      writer_(std::move(transport)) {}

core::errors::Status Connection::send(const nlohmann::json& frame) {
    std::string text = frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG)) {
        TANDEM_LOG_DEBUG("Connection " + id_ + " <- " + text);
    }
    return writer_.enqueue(std::move(text));
}

void Connection::close() {
    writer_.close();
}

void Connection::flush() {
    writer_.flush();
}

bool Connection::is_open() const {
    return writer_.accepting() && transport_->is_open();
}

}  // namespace tandem::transport
