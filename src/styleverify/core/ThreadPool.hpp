#pragma once

#include <vector>
#include <queue>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <type_traits>
#include "Exception.hpp"

namespace styleverify {
namespace core {

/**
 * @brief 固定大小的工作线程池
 *
 * 任务以 std::packaged_task 包装，异常保存在返回的 future 中，
 * 由调用方在 get() 时重新抛出。
 */
class ThreadPool {
public:
    /**
     * @brief 构造函数
     * @param threads 线程数量，0 表示使用硬件并发数
     */
    explicit ThreadPool(size_t threads = 0);

    /**
     * @brief 析构函数，执行完队列中剩余任务后回收线程
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief 提交任务到线程池
     * @return std::future 用于获取任务结果
     * @throws StateException 线程池已停止
     */
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    size_t size() const { return workers_.size(); }

    size_t pendingTasks() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    /**
     * @brief 等待所有已提交任务完成
     */
    void waitForAllTasks();

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable finished_;

    bool stop_;
    size_t active_tasks_;
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {

    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        // 不允许在停止状态下添加任务
        if (stop_) {
            STYLEVERIFY_THROW_STATE("enqueue", "enqueue on stopped ThreadPool");
        }

        tasks_.emplace([task]() { (*task)(); });
        ++active_tasks_;
    }

    condition_.notify_one();
    return res;
}

}} // namespace styleverify::core
