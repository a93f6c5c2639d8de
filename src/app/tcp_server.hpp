#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "app/frame_handler.hpp"
#include "core/errors/tandem_errors.hpp"
#include "transport/socket_transport.hpp"

namespace tandem::app {

// Accepts TCP clients and runs one reader thread per connection. Each line
// read is handed to the FrameHandler; writes go through the connection's
// writer.
class TcpServer {
public:
    TcpServer(std::string host, std::uint16_t port, FrameHandler& handler);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Binds and listens. Port 0 picks an ephemeral port, see `port()`.
    core::errors::Status start();

    // Accept loop; returns after `stop()`.
    void run();

    // Stops accepting. Safe to call from a signal-watching thread.
    void stop();

    // Closes every live socket and joins the reader threads.
    void close_connections();

    std::uint16_t port() const { return bound_port_.load(); }

    // Reader threads not yet joined.
    std::size_t reader_count() const;

private:
    struct Reader {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    void serve_connection(std::shared_ptr<transport::SocketTransport> socket,
                          std::shared_ptr<std::atomic_bool> done);
    // Joins readers whose connection has ended and drops expired sockets.
    void reap_finished();

    const std::string host_;
    const std::uint16_t requested_port_;
    FrameHandler& handler_;
    int listen_fd_ = -1;
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic_bool running_{false};

    mutable std::mutex sockets_mutex_;
    std::vector<std::weak_ptr<transport::SocketTransport>> sockets_;
    std::vector<Reader> readers_;
};

}  // namespace tandem::app
