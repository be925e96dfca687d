#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used for concurrent drift detection

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace driftwatch {

/// @brief A simple thread pool for executing tasks in parallel
///
/// The destructor drains queued tasks before joining the workers.
class ThreadPool {
public:
    /// @param num_threads Number of worker threads (0 = hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task for execution
    /// @return Future holding the result or the exception thrown by the task
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Submit a task without a result
    template <typename F, typename... Args>
    void Execute(F&& f, Args&&... args);

    size_t Size() const { return workers_.size(); }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Block until the queue is empty and no task is running
    void Wait();

private:
    void WorkerLoop();
    void Enqueue(std::function<void()> task);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    bool stop_ = false;
    size_t active_tasks_ = 0;
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<return_type> result = task->get_future();

    Enqueue([task]() { (*task)(); });
    return result;
}

template <typename F, typename... Args>
void ThreadPool::Execute(F&& f, Args&&... args) {
    Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
}

}  // namespace driftwatch
