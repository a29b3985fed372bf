/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool for independent solver runs.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <concepts>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace cut_shoot {

/**
 * @brief Fixed-size pool; each submitted task runs once on some worker.
 *
 * Solver runs share nothing but the pool. map() fans a candidate list out
 * and gathers the results back in candidate order, so the outcome of a
 * sweep never depends on which worker finished first.
 */
class ThreadPool {
public:
    /// 0 threads = hardware concurrency.
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable; exceptions surface through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Run func on every item concurrently; results follow input order.
    /// The first exception thrown by a task is rethrown after all tasks finish.
    template <typename T, std::invocable<const T&> F>
    std::vector<std::invoke_result_t<F, const T&>> map(const std::vector<T>& items, F func);

    [[nodiscard]] size_t active_count() const noexcept { return active_tasks_.load(); }
    [[nodiscard]] size_t completed_count() const noexcept { return completed_tasks_.load(); }
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept { return workers_.size(); }

    [[nodiscard]] static size_t resolve_thread_count(size_t requested) noexcept;

private:
    using Task = std::function<void()>;

    void enqueue(Task task);
    std::optional<Task> next_task(std::stop_token stop);
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> completed_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

template <typename T, std::invocable<const T&> F>
std::vector<std::invoke_result_t<F, const T&>> ThreadPool::map(const std::vector<T>& items, F func) {
    using ReturnType = std::invoke_result_t<F, const T&>;
    std::vector<std::future<ReturnType>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        futures.push_back(submit([&item, &func] { return func(item); }));
    }

    for (auto& f : futures) f.wait();

    std::vector<ReturnType> results;
    results.reserve(items.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

}  // namespace cut_shoot
