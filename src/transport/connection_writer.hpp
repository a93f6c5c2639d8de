#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "core/errors/tandem_errors.hpp"
#include "transport/transport.hpp"

namespace tandem::transport {

// Single-consumer outbound queue for one connection. Any thread may enqueue;
// one drain thread owns every write to the transport, so frames are written
// whole and in enqueue order.
class ConnectionWriter {
public:
    explicit ConnectionWriter(std::shared_ptr<Transport> transport,
                              std::chrono::milliseconds drain_timeout = std::chrono::seconds(5));
    ~ConnectionWriter();

    ConnectionWriter(const ConnectionWriter&) = delete;
    ConnectionWriter& operator=(const ConnectionWriter&) = delete;

    core::errors::Status enqueue(std::string frame);

    // Blocks until every frame enqueued so far has been written or dropped.
    void flush();

    // Stops accepting frames, writes what is already queued, then closes the
    // transport. If the queue has not drained within the drain timeout the
    // transport is closed first and the remaining frames are dropped. Idempotent.
    void close();

    bool accepting() const;
    std::size_t written_count() const;
    std::size_t dropped_count() const;

private:
    void drain_loop();

    std::shared_ptr<Transport> transport_;
    const std::chrono::milliseconds drain_timeout_;
    std::mutex close_mutex_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::string> queue_;
    bool accepting_ = true;
    bool stopping_ = false;
    bool writing_ = false;
    bool broken_ = false;
    std::size_t written_ = 0;
    std::size_t dropped_ = 0;
    std::thread drain_thread_;
};

}  // namespace tandem::transport
