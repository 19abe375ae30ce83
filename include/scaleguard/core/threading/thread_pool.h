#pragma once
/**
 * @file thread_pool.h
 * @brief Bounded worker pool for parallel provider I/O
 *
 * Provides a fixed-size thread pool with a shared FIFO queue and a
 * structured fan-out helper used to query every region concurrently.
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include <thread>
#include <atomic>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <vector>

namespace scaleguard::core {

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * @brief Fixed-size worker pool
 *
 * Tasks run in submission order as workers become free. Exceptions thrown
 * by a task are captured in its future and rethrown by get().
 */
class ThreadPool {
public:
    /**
     * @brief Construct a thread pool
     * @param num_threads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(SizeT num_threads = 0);

    /**
     * @brief Destructor - runs every queued task, then joins the workers
     */
    ~ThreadPool();

    // Non-copyable, non-moveable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Submit a task and get a future for the result
     * @tparam F Callable type
     * @param f Function to execute
     * @return Future containing the result
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>
    {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();

        return result;
    }

    /**
     * @brief Get the number of worker threads
     */
    SizeT num_threads() const { return workers_.size(); }

    /**
     * @brief Stop accepting work, drain the queue and join the workers
     */
    void shutdown();

    /**
     * @brief Check if the pool has been shut down
     */
    bool is_shutdown() const { return stop_.load(std::memory_order_acquire); }

private:
    using Task = std::function<void()>;

    void worker_thread();

    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    std::atomic<bool> stop_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
};

// ============================================================================
// Structured Fan-out
// ============================================================================

/**
 * @brief Run one task per input on the pool and join all of them
 *
 * Every task is awaited before returning, even after a failure, so no task
 * outlives the call. Results are written in input order. The first failing
 * task in input order determines the returned code.
 *
 * @param pool Pool to run on
 * @param inputs One task is spawned per element
 * @param task Callable (const In&, Out&) -> ScalingResult
 * @param outputs Resized to inputs.size() and filled in order
 */
template<typename In, typename Out, typename Fn>
ScalingResult fan_out(ThreadPool& pool,
                      const std::vector<In>& inputs,
                      Fn task,
                      std::vector<Out>& outputs)
{
    outputs.clear();
    outputs.resize(inputs.size());

    std::vector<std::future<ScalingResult>> futures;
    futures.reserve(inputs.size());
    for (SizeT i = 0; i < inputs.size(); ++i) {
        futures.push_back(pool.submit([&inputs, &outputs, &task, i]() {
            return task(inputs[i], outputs[i]);
        }));
    }

    ScalingResult first_error = ScalingResult::Success;
    std::exception_ptr first_exception;
    for (auto& future : futures) {
        try {
            ScalingResult result = future.get();
            if (result != ScalingResult::Success && first_error == ScalingResult::Success &&
                !first_exception) {
                first_error = result;
            }
        } catch (...) {
            if (!first_exception && first_error == ScalingResult::Success) {
                first_exception = std::current_exception();
            }
        }
    }

    if (first_exception) {
        std::rethrow_exception(first_exception);
    }
    return first_error;
}

} // namespace scaleguard::core
