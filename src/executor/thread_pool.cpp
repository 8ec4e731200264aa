/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <pthread.h>
#include <string>

namespace lanwake {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });

        // Linux limits thread names to 15 characters plus NUL.
        auto thread_name = name_.substr(0, 11) + "-" + std::to_string(i);
        ::pthread_setname_np(workers_.back().native_handle(), thread_name.substr(0, 15).c_str());
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // jthreads auto-join; then drop anything still queued so its promise breaks.
    workers_.clear();
    std::queue<std::function<void(std::stop_token)>> drained;
    std::lock_guard lock(queue_mutex_);
    task_queue_.swap(drained);
}

void ThreadPool::enqueue(std::function<void(std::stop_token)> task) {
    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (stop.stop_requested()) return;
            if (task_queue_.empty()) continue;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        task(stop);
    }
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace lanwake
