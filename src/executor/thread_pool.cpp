/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace cut_shoot {

size_t ThreadPool::resolve_thread_count(size_t requested) noexcept {
    if (requested > 0) return requested;
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

ThreadPool::ThreadPool(size_t num_threads) {
    const size_t count = resolve_thread_count(num_threads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // Join before the queue and its mutex are destroyed; queued tasks drain first.
    workers_.clear();
}

void ThreadPool::enqueue(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

std::optional<ThreadPool::Task> ThreadPool::next_task(std::stop_token stop) {
    std::unique_lock lock(queue_mutex_);
    queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });
    // Woken by a stop request with nothing left to run.
    if (task_queue_.empty()) return std::nullopt;

    Task task = std::move(task_queue_.front());
    task_queue_.pop();
    return task;
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (auto task = next_task(stop)) {
        ++active_tasks_;
        (*task)();
        --active_tasks_;
        ++completed_tasks_;
    }
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

}  // namespace cut_shoot
