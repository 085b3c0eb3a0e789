/**
 * @file Thread.cpp
 * @brief Serial task queue implementation
 */

#include <MiProbe/Platform/Thread.h>

namespace Mi::Probe::Platform {

TaskQueue::TaskQueue(std::string name)
    : name_(std::move(name)) {
    // Started last so every member is initialized before the worker runs
    worker_ = std::thread(&TaskQueue::WorkerThread, this);
}

TaskQueue::~TaskQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void TaskQueue::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);

            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++activeTasks_;
        }

        // packaged_task stores exceptions in the future
        task();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --activeTasks_;
        }
        completionCondition_.notify_all();
    }
}

void TaskQueue::WaitAll() {
    std::unique_lock<std::mutex> lock(mutex_);
    completionCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

size_t TaskQueue::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + activeTasks_;
}

bool TaskQueue::IsWorkerThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

} // namespace Mi::Probe::Platform
