/**
 * @file thread_pool.cpp
 * @brief Bounded worker pool implementation
 */

#include "scaleguard/core/threading/thread_pool.h"

namespace scaleguard::core {

// ============================================================================
// ThreadPool Implementation
// ============================================================================

ThreadPool::ThreadPool(SizeT num_threads)
{
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;  // Fallback
        }
    }

    workers_.reserve(num_threads);
    for (SizeT i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_thread, this);
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.exchange(true, std::memory_order_acq_rel)) {
            return;  // Already stopped
        }
    }

    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_thread()
{
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() {
                return stop_.load(std::memory_order_acquire) || !queue_.empty();
            });

            // Drain remaining tasks before exiting
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // packaged_task stores any exception in the caller's future
        task();
    }
}

} // namespace scaleguard::core
