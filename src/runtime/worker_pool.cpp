#include "runtime/worker_pool.hpp"

#include <exception>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace tandem::runtime {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::TandemError;

WorkerPool::WorkerPool(const std::size_t threads, const std::size_t queue_capacity)
    : queue_capacity_(queue_capacity) {
    const std::size_t count = threads == 0 ? 1 : threads;
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

Status WorkerPool::try_submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return TandemError{ErrorCategory::State, "Worker pool is shut down",
                               "worker_pool_stopped"};
        }
        if (active_ + queue_.size() >= threads_.size() + queue_capacity_) {
            return TandemError{ErrorCategory::Capacity,
                               "All " + std::to_string(threads_.size()) +
                                   " workers are busy",
                               "worker_pool_saturated",
                               "Retry once a running conversation completes."};
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return core::errors::ok();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::size_t WorkerPool::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t WorkerPool::queued_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            TANDEM_LOG_ERROR(std::string("WorkerPool: task threw: ") + e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
}

}  // namespace tandem::runtime
