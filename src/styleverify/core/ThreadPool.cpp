#include "styleverify/core/ThreadPool.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"

namespace styleverify {
namespace core {

ThreadPool::ThreadPool(size_t threads)
    : stop_(false), active_tasks_(0) {

    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4; // 无法探测时默认4个线程
    }

    CORE_DEBUG("Creating ThreadPool with {} threads", threads);

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    CORE_DEBUG("ThreadPool destroyed, {} threads joined", workers_.size());
}

void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            // 停止且队列为空时退出
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task 把异常存入 future，这里不会抛出
        task();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_tasks_;
            if (active_tasks_ == 0 && tasks_.empty()) {
                finished_.notify_all();
            }
        }
    }
}

void ThreadPool::waitForAllTasks() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    finished_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

}} // namespace styleverify::core
