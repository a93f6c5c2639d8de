#include "transport/connection_writer.hpp"

#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace tandem::transport {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::TandemError;

ConnectionWriter::ConnectionWriter(std::shared_ptr<Transport> transport,
                                   const std::chrono::milliseconds drain_timeout)
    : transport_(std::move(transport)), drain_timeout_(drain_timeout) {
    drain_thread_ = std::thread([this] { drain_loop(); });
}

ConnectionWriter::~ConnectionWriter() {
    close();
}

Status ConnectionWriter::enqueue(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ || broken_) {
            ++dropped_;
            return TandemError{ErrorCategory::Transport,
                               "Connection writer is closed",
                               "connection_closed"};
        }
        queue_.push_back(std::move(frame));
    }
    queue_cv_.notify_one();
    return core::errors::ok();
}

void ConnectionWriter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() && !writing_) || stopping_; });
}

void ConnectionWriter::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        accepting_ = false;
        drained = idle_cv_.wait_for(lock, drain_timeout_, [this] {
            return (queue_.empty() && !writing_) || broken_;
        });
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (!drained) {
        // Unblocks a write stuck on a peer that stopped reading.
        TANDEM_LOG_WARN("ConnectionWriter: drain timed out after " +
                        std::to_string(drain_timeout_.count()) + "ms, closing transport");
        transport_->close();
    }
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    if (drained) {
        transport_->close();
    }
    idle_cv_.notify_all();
}

bool ConnectionWriter::accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_ && !broken_;
}

std::size_t ConnectionWriter::written_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

std::size_t ConnectionWriter::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void ConnectionWriter::drain_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        queue_cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (queue_.empty()) {
            break;
        }

        std::string frame = std::move(queue_.front());
        queue_.pop_front();
        if (broken_) {
            ++dropped_;
            continue;
        }

        writing_ = true;
        lock.unlock();
        const Status status = transport_->write_frame(frame);
        lock.lock();
        writing_ = false;

        if (core::errors::is_error(status)) {
            broken_ = true;
            dropped_ += 1 + queue_.size();
            queue_.clear();
            TANDEM_LOG_WARN("ConnectionWriter: " + core::errors::get_error(status).message +
                            ", dropping queued frames");
        } else {
            ++written_;
        }
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

}  // namespace tandem::transport
