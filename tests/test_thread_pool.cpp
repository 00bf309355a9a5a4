#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <vector>

#include "thread_pool.hpp"

using namespace binexp;

TEST(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ThreadPoolTest, ReturnsResultsThroughFutures) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.enqueue([](int x) { return x * x; }, i));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, TaskExceptionReachesFuture) {
    ThreadPool pool(2);
    auto future = pool.enqueue([]() -> int { throw std::runtime_error("сбой"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, WaitIdleBlocksUntilAllTasksFinish) {
    std::atomic<int> counter{0};
    ThreadPool pool(3);
    for (int i = 0; i < 500; ++i) {
        pool.enqueue([&counter]() { counter.fetch_add(1); });
    }
    pool.waitIdle();
    EXPECT_EQ(counter.load(), 500);
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 200; ++i) {
            pool.enqueue([&counter]() { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 200);
}
