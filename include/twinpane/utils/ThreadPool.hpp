#ifndef TWINPANE_THREADPOOL_HPP
#define TWINPANE_THREADPOOL_HPP

#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace twinpane {
namespace utils {

class ThreadPool : public common::NonCopyable {
private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;
    bool stop_;
    size_t activeTasks_;

public:
    explicit ThreadPool(size_t numThreads = common::Constants::DEFAULT_WORKER_THREADS);
    ~ThreadPool();

    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    size_t getPendingTasks() const;
    size_t getActiveTasks() const;
    size_t getThreadCount() const { return workers_.size(); }

    void waitAll();

private:
    void workerLoop();
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {

    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);

        if (stop_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }

        tasks_.emplace([task](){ (*task)(); });
    }

    condition_.notify_one();
    return result;
}

}
}

#endif
