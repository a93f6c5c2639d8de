#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "core/errors/tandem_errors.hpp"

namespace tandem::runtime {

// Fixed set of threads with a bounded backlog. A task is accepted only while
// running + queued stays below threads + queue_capacity; otherwise the
// caller gets `worker_pool_saturated` instead of an unbounded queue.
class WorkerPool {
public:
    WorkerPool(std::size_t threads, std::size_t queue_capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    core::errors::Status try_submit(std::function<void()> task);

    // Stops accepting, lets queued tasks finish, joins every thread.
    void shutdown();

    std::size_t thread_count() const { return threads_.size(); }
    std::size_t active_count() const;
    std::size_t queued_count() const;

private:
    void worker_loop();

    const std::size_t queue_capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    std::size_t active_ = 0;
    bool running_ = true;
    std::vector<std::thread> threads_;
};

}  // namespace tandem::runtime
