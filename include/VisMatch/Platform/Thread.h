#pragma once

/**
 * @file Thread.h
 * @brief Thread pool and cooperative cancellation
 *
 * Provides:
 * - Global elastic thread pool for offloading blocking work (image decoding)
 * - CancellationToken checked between units of work
 *
 * Usage:
 * @code
 * auto future = ThreadPool::Instance().Submit([]() { return Decode(); });
 * if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
 *     // give up waiting
 * }
 *
 * CancellationToken token;
 * for (auto& item : items) {
 *     token.ThrowIfCancelled("Process");
 *     process(item);
 * }
 * @endcode
 */

#include <VisMatch/Core/Export.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace Vis::Match::Platform {

// ============================================================================
// System Information
// ============================================================================

/**
 * @brief Get number of hardware threads (logical cores)
 * @return Number of threads, minimum 1
 */
VISMATCH_API size_t GetNumCores();

/**
 * @brief Get recommended number of worker threads
 * @return GetNumCores() - 1, minimum 1
 */
VISMATCH_API size_t GetRecommendedThreadCount();

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * @brief Elastic worker pool for blocking work
 *
 * Starts with GetRecommendedThreadCount() workers. A task submitted while
 * every worker is busy starts another worker, up to MaxSize(), so a decode
 * that outlived its caller's timeout does not hold up the next one. Workers
 * are never retired. Use Instance() to access.
 */
class VISMATCH_API ThreadPool {
public:
    /**
     * @brief Get global thread pool instance
     */
    static ThreadPool& Instance();

    /**
     * @brief Destructor - runs queued tasks, then joins the workers
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Current number of worker threads
    size_t Size() const;

    /// Upper bound on worker threads
    size_t MaxSize() const { return maxThreads_; }

    /// Check if pool is running
    bool IsRunning() const { return !stop_; }

    /**
     * @brief Submit a task and get a future for the result
     * @return Future for the result (exceptions are rethrown by get())
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

private:
    ThreadPool(size_t minThreads, size_t maxThreads);

    void Enqueue(std::function<void()> task);
    void StartWorker();     // requires mutex_
    void WorkerLoop();

    const size_t maxThreads_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    size_t idleWorkers_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable taskAvailable_;
    std::atomic<bool> stop_{false};
};

// ============================================================================
// Cancellation
// ============================================================================

/**
 * @brief Cooperative cancellation flag
 *
 * Shared between the caller that may cancel and the worker loop that polls it.
 * Cancellation is sticky; a token cannot be reset.
 */
class VISMATCH_API CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Request cancellation
    void Cancel() { cancelled_.store(true, std::memory_order_release); }

    /// Check whether cancellation was requested
    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /**
     * @brief Throw CancelledException if cancellation was requested
     * @param what Name of the operation for the error message
     */
    void ThrowIfCancelled(const char* what) const;

private:
    std::atomic<bool> cancelled_{false};
};

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using ReturnType = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<ReturnType> result = task->get_future();
    Enqueue([task]() { (*task)(); });
    return result;
}

} // namespace Vis::Match::Platform
