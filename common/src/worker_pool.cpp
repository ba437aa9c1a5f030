#include "worker_pool.hpp"
#include <iostream>

namespace dre {

size_t hardware_threads() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<size_t>(cores) : 1;
}

WorkerPool::WorkerPool(size_t num_threads)
    : stop_(false)
    , active_tasks_(0) {

    if (num_threads == 0) {
        num_threads = hardware_threads();
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::execute(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("Worker pool is shutting down");
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::worker_loop() {
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
            ++active_tasks_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "Worker task failed: " << e.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_tasks_;
        }
        idle_condition_.notify_all();
    }
}

void WorkerPool::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_condition_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_tasks_;
}

}  // namespace dre
