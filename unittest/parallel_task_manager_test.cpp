#include <gtest/gtest.h>
#include "common/parallel_task_manager.hpp"
#include <atomic>
#include <stdexcept>

TEST(ParallelTaskManagerTest, RunsTasksAndReturnsResults) {
    ParallelTaskManager pool(3);
    EXPECT_EQ(pool.getThreadCount(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.addTask([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }

    pool.waitForAll();
    TaskStats stats = pool.getStats();
    EXPECT_EQ(stats.totalTasks, 20u);
    EXPECT_EQ(stats.completedTasks, 20u);
    EXPECT_EQ(stats.currentQueueSize, 0u);
}

TEST(ParallelTaskManagerTest, BoundsConcurrency) {
    ParallelTaskManager pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 10; ++i) {
        pool.addTask([&running, &peak]() {
            int now = ++running;
            int previous = peak.load();
            while (now > previous && !peak.compare_exchange_weak(previous, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        });
    }

    EXPECT_TRUE(pool.waitForAll(std::chrono::seconds(10)));
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(pool.getActiveTaskCount(), 0u);
}

TEST(ParallelTaskManagerTest, ExceptionsReachTheFuture) {
    ParallelTaskManager pool(1);
    auto result = pool.addTask([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);

    // The worker survives a throwing task
    EXPECT_EQ(pool.addTask([]() { return 7; }).get(), 7);
}
