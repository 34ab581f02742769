/**
 * @file Thread.cpp
 * @brief Thread pool and cancellation implementation
 */

#include <VisMatch/Platform/Thread.h>
#include <VisMatch/Core/Exception.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace Vis::Match::Platform {

// ============================================================================
// System Information
// ============================================================================

size_t GetNumCores() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<size_t>(cores) : 1;
}

size_t GetRecommendedThreadCount() {
    size_t cores = GetNumCores();
    return cores > 1 ? cores - 1 : 1;
}

// ============================================================================
// Thread Pool
// ============================================================================

namespace {

// Ceiling for the elastic pool, relative to the starting size
constexpr size_t POOL_GROWTH_FACTOR = 4;
constexpr size_t POOL_MIN_CEILING = 16;

} // anonymous namespace

ThreadPool& ThreadPool::Instance() {
    size_t initial = GetRecommendedThreadCount();
    static ThreadPool instance(initial, std::max(initial * POOL_GROWTH_FACTOR, POOL_MIN_CEILING));
    return instance;
}

ThreadPool::ThreadPool(size_t minThreads, size_t maxThreads)
    : maxThreads_(std::max<size_t>(maxThreads, 1))
{
    size_t initial = std::min(std::max<size_t>(minThreads, 1), maxThreads_);
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.reserve(maxThreads_);
    for (size_t i = 0; i < initial; ++i) {
        StartWorker();
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    taskAvailable_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void ThreadPool::StartWorker() {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this);
}

void ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.push(std::move(task));

        // More queued work than idle workers: every worker is busy
        if (tasks_.size() > idleWorkers_ && workers_.size() < maxThreads_) {
            StartWorker();
        }
    }
    taskAvailable_.notify_one();
}

void ThreadPool::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        ++idleWorkers_;
        taskAvailable_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
        --idleWorkers_;

        if (tasks_.empty()) {
            return;     // stopped and drained
        }

        std::function<void()> task = std::move(tasks_.front());
        tasks_.pop();

        lock.unlock();
        task();
        lock.lock();
    }
}

// ============================================================================
// Cancellation
// ============================================================================

void CancellationToken::ThrowIfCancelled(const char* what) const {
    if (IsCancelled()) {
        throw CancelledException(std::string(what) + " was cancelled");
    }
}

} // namespace Vis::Match::Platform
