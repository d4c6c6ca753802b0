#include "twinpane/utils/ThreadPool.hpp"

#include <algorithm>

twinpane::utils::ThreadPool::ThreadPool(size_t numThreads)
    : stop_(false), activeTasks_(0) {

    size_t numWorkers = std::min(numThreads, static_cast<size_t>(common::Constants::MAX_THREAD_POOL_SIZE));
    numWorkers = std::max(numWorkers, static_cast<size_t>(common::Constants::MIN_THREAD_POOL_SIZE));

    workers_.reserve(numWorkers);
    for (size_t i = 0; i < numWorkers; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

twinpane::utils::ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void twinpane::utils::ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            condition_.wait(lock, [this]() {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++activeTasks_;
        }

        // packaged_task stores exceptions in its future, so task() does not throw.
        task();

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (tasks_.empty() && activeTasks_ == 0) {
                idleCondition_.notify_all();
            }
        }
    }
}

size_t twinpane::utils::ThreadPool::getPendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

size_t twinpane::utils::ThreadPool::getActiveTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return activeTasks_;
}

void twinpane::utils::ThreadPool::waitAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this]() {
        return tasks_.empty() && activeTasks_ == 0;
    });
}
