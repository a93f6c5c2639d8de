#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/tandem_errors.hpp"
#include "transport/connection_writer.hpp"
#include "transport/transport.hpp"

namespace tandem::transport {

// One attached client. Every outbound frame goes through the writer.
class Connection {
public:
    Connection(std::string id, std::shared_ptr<Transport> transport,
               std::string peer_address = "");

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& id() const { return id_; }
    const std::string& peer_address() const { return peer_address_; }

    core::errors::Status send(const nlohmann::json& frame);

    // Writes queued frames, then closes the transport.
    void close();
    void flush();
    bool is_open() const;

private:
    const std::string id_;
    const std::string peer_address_;
    std::shared_ptr<Transport> transport_;
    ConnectionWriter writer_;
};

}  // namespace tandem::transport
