#pragma once

/**
 * @file Thread.h
 * @brief Serial task execution
 *
 * Provides:
 * - TaskQueue: one dedicated worker thread running submitted tasks strictly
 *   in submission order (never two at once)
 *
 * Usage:
 * @code
 * TaskQueue queue("serial");
 * auto future = queue.Submit([&]() { return channel.Exchange(request); });
 * Frame frame = future.get();   // rethrows the task's exception, if any
 * @endcode
 */

#include <MiProbe/Core/Export.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace Mi::Probe::Platform {

/**
 * @brief Single-worker FIFO task queue
 *
 * Owns its thread. The destructor drains pending tasks, then joins.
 */
class MIPROBE_API TaskQueue {
public:
    explicit TaskQueue(std::string name = "worker");

    /**
     * @brief Destructor - runs remaining tasks, then stops the worker
     */
    ~TaskQueue();

    // Non-copyable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    const std::string& Name() const { return name_; }

    /**
     * @brief Check if queue accepts tasks
     */
    bool IsRunning() const { return !stop_; }

    /**
     * @brief Submit a task and get a future for the result
     * @param f Function to execute
     * @param args Arguments to pass
     * @return Future for the result (carries any exception thrown by f)
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /**
     * @brief Wait for all pending tasks to complete
     */
    void WaitAll();

    /**
     * @brief Number of queued plus running tasks
     */
    size_t PendingTasks() const;

    /**
     * @brief True when called from the worker thread itself
     */
    bool IsWorkerThread() const;

private:
    void WorkerThread();

    std::string name_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completionCondition_;
    std::atomic<bool> stop_{false};
    size_t activeTasks_ = 0;

    std::thread worker_;
};

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto TaskQueue::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using ReturnType = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<ReturnType> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("TaskQueue '" + name_ + "' is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

} // namespace Mi::Probe::Platform
