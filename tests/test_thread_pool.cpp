#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "thread_pool.hpp"

using GlacierUpload::Concurrency::ThreadPool;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
    ThreadPool pool(2, 2, "test");
    EXPECT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool.perJobLimit(), 2u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.submit("job", [i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, TaskExceptionsReachTheFuture) {
    ThreadPool pool(1, 1, "test");
    auto result = pool.submit("job", []() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);

    // The worker survives the exception
    EXPECT_EQ(pool.submit("job", []() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, RejectsZeroSizes) {
    EXPECT_THROW(ThreadPool(0, 1, "test"), std::invalid_argument);
    EXPECT_THROW(ThreadPool(1, 0, "test"), std::invalid_argument);
}

TEST(ThreadPoolTest, PerJobLimitBoundsConcurrency) {
    ThreadPool pool(6, 2, "test");
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(pool.submit("big", [&]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --running;
        }));
    }
    for (auto& result : results) {
        result.get();
    }
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(pool.running("big"), 0u);
}

TEST(ThreadPoolTest, SaturatedJobDoesNotHoldBackOthers) {
    ThreadPool pool(3, 2, "test");
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    std::vector<std::future<void>> blocked;
    for (int i = 0; i < 4; ++i) {
        blocked.push_back(pool.submit("big", [released]() { released.wait(); }));
    }

    // Two "big" tasks hold their slots; the third worker is left for other jobs
    auto other = pool.submit("small", []() { return 42; });
    ASSERT_EQ(other.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(other.get(), 42);
    EXPECT_EQ(pool.running("big"), 2u);
    EXPECT_EQ(pool.queued("big"), 2u);

    release.set_value();
    for (auto& result : blocked) {
        result.get();
    }
}

TEST(ThreadPoolTest, DropQueuedDiscardsTasksThatHaveNotStarted) {
    ThreadPool pool(1, 1, "test");
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    auto first = pool.submit("job", [&started, released]() {
        started.set_value();
        released.wait();
    });
    started.get_future().wait();

    std::atomic<int> ran{0};
    std::vector<std::future<void>> queued;
    for (int i = 0; i < 3; ++i) {
        queued.push_back(pool.submit("job", [&ran]() { ++ran; }));
    }
    auto other = pool.submit("other", []() { return 1; });

    EXPECT_EQ(pool.dropQueued("job"), 3u);
    EXPECT_EQ(pool.queued("job"), 0u);
    EXPECT_EQ(pool.dropQueued("job"), 0u);

    release.set_value();
    first.get();
    EXPECT_EQ(other.get(), 1);
    for (auto& result : queued) {
        EXPECT_THROW(result.get(), std::future_error);
    }
    EXPECT_EQ(ran.load(), 0);
}

TEST(ThreadPoolTest, DestructorRunsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        ThreadPool pool(1, 1, "test");
        for (int i = 0; i < 5; ++i) {
            pool.submit("job", [&ran]() {
                std::this_thread::sleep_for(1ms);
                ++ran;
            });
        }
    }
    EXPECT_EQ(ran.load(), 5);
}
