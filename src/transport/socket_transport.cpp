#include "transport/socket_transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace tandem::transport {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::TandemError;

SocketTransport::SocketTransport(const int fd, const std::size_t max_frame_bytes)
    : fd_(fd), max_frame_bytes_(max_frame_bytes) {}

SocketTransport::~SocketTransport() {
    close();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Status SocketTransport::write_frame(const std::string& frame) {
    if (!open_.load()) {
        return TandemError{ErrorCategory::Transport, "Connection is closed",
                           "connection_closed"};
    }

    const std::string line = frame + "\n";
    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = ::send(fd_, line.data() + written, line.size() - written,
                                 MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            open_.store(false);
            return TandemError{ErrorCategory::Transport, "Socket write failed: " + reason,
                               "connection_closed"};
        }
        written += static_cast<std::size_t>(n);
    }
    return core::errors::ok();
}

void SocketTransport::close() {
    if (open_.exchange(false) && fd_ >= 0) {
        // Wakes a reader blocked in recv; the descriptor is released in the destructor.
        ::shutdown(fd_, SHUT_RDWR);
    }
}

bool SocketTransport::is_open() const {
    return open_.load();
}

std::optional<std::string> SocketTransport::read_frame() {
    for (;;) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        if (read_buffer_.size() > max_frame_bytes_) {
            TANDEM_LOG_WARN("SocketTransport: frame exceeds " +
                            std::to_string(max_frame_bytes_) + " bytes, closing");
            close();
            return std::nullopt;
        }

        char chunk[4096];
        const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::nullopt;
        }
        if (n == 0) {
            return std::nullopt;
        }
        read_buffer_.append(chunk, static_cast<std::size_t>(n));
    }
}

std::string SocketTransport::peer_address() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0 ||
        addr.sin_family != AF_INET) {
        return "";
    }
    char buffer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) == nullptr) {
        return "";
    }
    return buffer;
}

}  // namespace tandem::transport
