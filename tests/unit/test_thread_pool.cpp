/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

using namespace cut_shoot;

TEST(ThreadPoolTest, SubmitReturnsValue) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, EveryTaskRunsOnce) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.completed_count(), 100u);
}

TEST(ThreadPoolTest, ExceptionSurfacesThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DrainsQueueOnDestruction) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            (void)pool.submit([&counter] { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 20);
}

// ─── map ─────────────────────────────────────

TEST(ThreadPoolMapTest, ResultsFollowInputOrder) {
    ThreadPool pool(4);
    std::vector<int> delays_ms{30, 0, 20, 5, 10};

    // Later items finish first; the gather must not reorder them.
    auto results = pool.map(delays_ms, [](const int& ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        return std::to_string(ms);
    });

    ASSERT_EQ(results.size(), delays_ms.size());
    for (size_t i = 0; i < delays_ms.size(); ++i) {
        EXPECT_EQ(results[i], std::to_string(delays_ms[i]));
    }
}

TEST(ThreadPoolMapTest, EmptyInput) {
    ThreadPool pool(2);
    auto results = pool.map(std::vector<int>{}, [](const int& x) { return x; });
    EXPECT_TRUE(results.empty());
}

TEST(ThreadPoolMapTest, ExceptionRethrownAfterAllTasksFinish) {
    ThreadPool pool(2);
    std::atomic<int> finished{0};
    std::vector<int> items{1, 2, 3, 4};

    EXPECT_THROW(pool.map(items, [&finished](const int& x) {
        if (x == 2) throw std::invalid_argument("bad candidate");
        finished.fetch_add(1);
        return x;
    }), std::invalid_argument);
    EXPECT_EQ(finished.load(), 3);
}

// ─── Sizing ──────────────────────────────────

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
    EXPECT_EQ(pool.active_count(), 0u);
    EXPECT_EQ(pool.queued_count(), 0u);
}

TEST(ThreadPoolTest, ResolveThreadCount) {
    EXPECT_EQ(ThreadPool::resolve_thread_count(5), 5u);
    EXPECT_GE(ThreadPool::resolve_thread_count(0), 1u);
}
