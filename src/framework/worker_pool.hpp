// File: src/framework/worker_pool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace p3if {

/// Bounded pool of worker threads with a bounded task queue
///
/// Used to run independent multiplex batches against several Framework
/// instances in parallel. Submit() blocks while the queue is full and
/// returns a std::future for the task's result; exceptions thrown by a task
/// are delivered through that future.
class WorkerPool {
public:
    /// Configuration for WorkerPool
    struct Config {
        size_t num_threads{4};      ///< Worker threads (minimum 1)
        size_t queue_capacity{64};  ///< Pending tasks before Submit blocks (minimum 1)
    };

    /// Statistics for WorkerPool
    struct Stats {
        uint64_t submitted{0};
        uint64_t completed{0};
        size_t pending{0};
    };

    WorkerPool();
    explicit WorkerPool(const Config& config);

    /// Stops accepting work, drains the queue and joins all workers
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a callable; blocks while the queue is at capacity
    /// @throws std::runtime_error if the pool has been shut down
    template<typename F>
    auto Submit(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
        std::future<Result> future = task->get_future();
        Enqueue([task]() { (*task)(); });
        return future;
    }

    /// Block until every submitted task has finished
    void WaitIdle();

    /// Stop accepting work, finish queued tasks and join the workers
    void Shutdown();

    size_t GetThreadCount() const { return workers_.size(); }
    const Config& GetConfig() const { return config_; }
    Stats GetStats() const;

private:
    void Enqueue(std::function<void()> task);
    void WorkerLoop();

    Config config_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable idle_;
    std::deque<std::function<void()>> queue_;

    bool stopping_{false};
    size_t active_{0};

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> completed_{0};
};

} // namespace p3if
