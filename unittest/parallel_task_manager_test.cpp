#include <gtest/gtest.h>
#include "common/parallel_task_manager.hpp"
#include <atomic>
#include <stdexcept>
#include <vector>

TEST(ParallelTaskManagerTest, ReturnsResultsThroughFutures) {
    ParallelTaskManager manager(3);
    EXPECT_EQ(manager.getThreadCount(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(manager.addTask([](int value) { return value * value; }, i));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ParallelTaskManagerTest, ExceptionsReachTheFuture) {
    ParallelTaskManager manager(2);
    auto failing = manager.addTask([]() { throw std::runtime_error("boom"); });
    auto succeeding = manager.addTask([]() { return 7; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(succeeding.get(), 7);
}

TEST(ParallelTaskManagerTest, WaitForAllDrainsTheQueue) {
    std::atomic<int> done{0};
    ParallelTaskManager manager(2);
    for (int i = 0; i < 20; ++i) {
        manager.addTask([&done]() { ++done; });
    }
    manager.waitForAll();

    EXPECT_EQ(done.load(), 20);
    TaskStats stats = manager.getStats();
    EXPECT_EQ(stats.totalTasks, 20u);
    EXPECT_EQ(stats.completedTasks, 20u);
    EXPECT_EQ(stats.currentQueueSize, 0u);
}
