#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include "transport/transport.hpp"

namespace tandem::transport {

// Newline-delimited frames over a connected stream socket. Takes ownership of
// the descriptor.
class SocketTransport : public Transport {
public:
    explicit SocketTransport(int fd, std::size_t max_frame_bytes = 16 * 1024 * 1024);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    core::errors::Status write_frame(const std::string& frame) override;
    void close() override;
    bool is_open() const override;

    // Blocks until a full line arrives. nullopt on EOF, error or close.
    std::optional<std::string> read_frame();

    std::string peer_address() const;

private:
    int fd_;
    std::atomic_bool open_{true};
    std::size_t max_frame_bytes_;
    std::string read_buffer_;
};

}  // namespace tandem::transport
