// File: src/framework/worker_pool.cpp
#include "framework/worker_pool.hpp"
#include <stdexcept>

namespace p3if {

WorkerPool::WorkerPool()
    : WorkerPool(Config())
{
}

WorkerPool::WorkerPool(const Config& config)
    : config_(config)
{
    if (config_.num_threads == 0) {
        config_.num_threads = 1;
    }
    if (config_.queue_capacity == 0) {
        config_.queue_capacity = 1;
    }

    workers_.reserve(config_.num_threads);
    for (size_t i = 0; i < config_.num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

// ============================================================================
// Task Queue
// ============================================================================

void WorkerPool::Enqueue(std::function<void()> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
        return stopping_ || queue_.size() < config_.queue_capacity;
    });

    if (stopping_) {
        throw std::runtime_error("WorkerPool has been shut down");
    }

    queue_.push_back(std::move(task));
    submitted_.fetch_add(1, std::memory_order_relaxed);
    lock.unlock();
    not_empty_.notify_one();
}

void WorkerPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            if (queue_.empty()) {
                // stopping_ and nothing left to drain
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }
        not_full_.notify_one();

        // packaged_task stores any exception in the future
        task();

        completed_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (queue_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void WorkerPool::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

WorkerPool::Stats WorkerPool::GetStats() const {
    Stats stats;
    stats.submitted = submitted_.load(std::memory_order_relaxed);
    stats.completed = completed_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    stats.pending = queue_.size();
    return stats;
}

} // namespace p3if
