#include "app/tcp_server.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "transport/connection.hpp"

namespace tandem::app {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::TandemError;

namespace {

constexpr int kAcceptPollMs = 200;
constexpr time_t kSendTimeoutSeconds = 10;

TandemError socket_error(const std::string& what) {
    return TandemError{ErrorCategory::Transport, what + ": " + std::strerror(errno),
                       "listen_failed"};
}

}  // namespace

TcpServer::TcpServer(std::string host, const std::uint16_t port, FrameHandler& handler)
    : host_(std::move(host)), requested_port_(port), handler_(handler) {}

TcpServer::~TcpServer() {
    stop();
    close_connections();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
}

Status TcpServer::start() {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(requested_port_);
    if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        return TandemError{ErrorCategory::Input, "Not an IPv4 address: " + host_,
                           "invalid_host"};
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        return socket_error("socket");
    }
    const int reuse = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        auto error = socket_error("bind " + host_ + ":" + std::to_string(requested_port_));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return error;
    }
    if (::listen(listen_fd_, SOMAXCONN) != 0) {
        auto error = socket_error("listen");
        ::close(listen_fd_);
        listen_fd_ = -1;
        return error;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_.store(ntohs(bound.sin_port));
    }
    running_.store(true);
    TANDEM_LOG_INFO("TcpServer: listening on " + host_ + ":" + std::to_string(port()));
    return core::errors::ok();
}

void TcpServer::run() {
    while (running_.load()) {
        reap_finished();
        pollfd pfd{listen_fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            TANDEM_LOG_ERROR(std::string("TcpServer: poll failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }

        const int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                TANDEM_LOG_WARN(std::string("TcpServer: accept failed: ") +
                                std::strerror(errno));
            }
            continue;
        }

        // A peer that stops reading fails the write instead of blocking the drain thread.
        const timeval send_timeout{kSendTimeoutSeconds, 0};
        if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &send_timeout,
                         sizeof(send_timeout)) != 0) {
            TANDEM_LOG_WARN(std::string("TcpServer: SO_SNDTIMEO failed: ") +
                            std::strerror(errno));
        }

        auto socket = std::make_shared<transport::SocketTransport>(fd);
        auto done = std::make_shared<std::atomic_bool>(false);
        std::lock_guard<std::mutex> lock(sockets_mutex_);
        sockets_.push_back(socket);
        readers_.push_back(
            Reader{std::thread(&TcpServer::serve_connection, this, std::move(socket), done),
                   done});
    }
    TANDEM_LOG_INFO("TcpServer: stopped accepting");
}

void TcpServer::stop() {
    running_.store(false);
}

std::size_t TcpServer::reader_count() const {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    return readers_.size();
}

void TcpServer::reap_finished() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(sockets_mutex_);
        sockets_.erase(std::remove_if(sockets_.begin(), sockets_.end(),
                                      [](const auto& weak) { return weak.expired(); }),
                       sockets_.end());
        auto it = readers_.begin();
        while (it != readers_.end()) {
            if (it->done->load()) {
                finished.push_back(std::move(it->thread));
                it = readers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void TcpServer::close_connections() {
    std::vector<Reader> readers;
    {
        std::lock_guard<std::mutex> lock(sockets_mutex_);
        for (auto& weak : sockets_) {
            if (auto socket = weak.lock()) {
                socket->close();
            }
        }
        sockets_.clear();
        readers.swap(readers_);
    }
    for (auto& reader : readers) {
        if (reader.thread.joinable()) {
            reader.thread.join();
        }
    }
}

void TcpServer::serve_connection(std::shared_ptr<transport::SocketTransport> socket,
                                 std::shared_ptr<std::atomic_bool> done) {
    auto connection = std::make_shared<transport::Connection>(
        core::config::generate_id("conn"), socket, socket->peer_address());
    handler_.on_open(connection);

    while (auto line = socket->read_frame()) {
        if (line->empty()) {
            continue;
        }
        handler_.on_frame(connection, line.value());
    }
    handler_.on_close(connection);
    done->store(true);
}

}  // namespace tandem::app
