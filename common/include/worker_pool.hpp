#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace dre {

// Number of hardware threads, minimum 1
size_t hardware_threads();

// Fixed-size pool capping how many decodes and scans run at once
class WorkerPool {
public:
    // num_threads == 0 uses hardware_threads()
    explicit WorkerPool(size_t num_threads = 0);

    // Drains queued tasks, then joins
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type>;

    // Fire and forget; the task must handle its own exceptions
    void execute(std::function<void()> task);

    // Block until the queue is empty and no task is running
    void wait_all();

    // Queued plus running tasks
    size_t pending() const;

    size_t size() const {
        return workers_.size();
    }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_condition_;
    bool stop_;
    size_t active_tasks_;
};

template<typename F>
auto WorkerPool::submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
    using Result = typename std::invoke_result<F>::type;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
    std::future<Result> future = task->get_future();

    execute([task]() { (*task)(); });

    return future;
}

}  // namespace dre
