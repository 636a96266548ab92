#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include "background_task_manager.h"
#include "test_support.h"

using namespace std::chrono_literals;
using facegate::BackgroundTaskManager;
using facegate::test::waitFor;

TEST(BackgroundTaskManagerTest, RunsSubmittedTasks) {
    BackgroundTaskManager tasks(2, 32);
    std::atomic<int> ran{0};

    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(tasks.submitTask("count", [&ran] { ran++; return true; }).empty());
    }

    ASSERT_TRUE(tasks.waitIdle(2s));
    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(tasks.getCompletedCount(), 10u);
    EXPECT_EQ(tasks.getFailedCount(), 0u);
}

TEST(BackgroundTaskManagerTest, TaskIdsAreUnique) {
    BackgroundTaskManager tasks(1, 8);

    std::string first = tasks.submitTask("noop", [] { return true; });
    std::string second = tasks.submitTask("noop", [] { return true; });

    EXPECT_EQ(first.size(), 36u);
    EXPECT_NE(first, second);
    ASSERT_TRUE(tasks.waitIdle(2s));
}

TEST(BackgroundTaskManagerTest, FailuresAndExceptionsAreCounted) {
    BackgroundTaskManager tasks(1, 8);

    tasks.submitTask("fails", [] { return false; });
    tasks.submitTask("throws", []() -> bool { throw std::runtime_error("boom"); });
    tasks.submitTask("ok", [] { return true; });

    ASSERT_TRUE(tasks.waitIdle(2s));
    EXPECT_EQ(tasks.getFailedCount(), 2u);
    EXPECT_EQ(tasks.getCompletedCount(), 1u);
}

TEST(BackgroundTaskManagerTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        BackgroundTaskManager tasks(1, 16);
        tasks.submitTask("slow", [&ran] {
            std::this_thread::sleep_for(50ms);
            ran++;
            return true;
        });
        for (int i = 0; i < 5; ++i) {
            tasks.submitTask("queued", [&ran] { ran++; return true; });
        }

        tasks.shutdown();
        EXPECT_EQ(ran.load(), 6);
        EXPECT_EQ(tasks.getCompletedCount(), 6u);
    }
    EXPECT_EQ(ran.load(), 6);
}

TEST(BackgroundTaskManagerTest, RejectsWhenQueueIsFull) {
    BackgroundTaskManager tasks(1, 2);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();

    tasks.submitTask("blocker", [opened] { opened.wait(); return true; });
    ASSERT_TRUE(waitFor([&tasks] { return tasks.getActiveCount() == 1; }));

    EXPECT_FALSE(tasks.submitTask("queued", [] { return true; }).empty());
    EXPECT_FALSE(tasks.submitTask("queued", [] { return true; }).empty());
    EXPECT_TRUE(tasks.submitTask("overflow", [] { return true; }).empty());
    EXPECT_EQ(tasks.getRejectedCount(), 1u);
    EXPECT_EQ(tasks.getPendingCount(), 2u);

    gate.set_value();
    ASSERT_TRUE(tasks.waitIdle(2s));
    EXPECT_EQ(tasks.getCompletedCount(), 3u);
}

TEST(BackgroundTaskManagerTest, RejectsAfterShutdown) {
    BackgroundTaskManager tasks(1, 4);
    tasks.shutdown();

    EXPECT_TRUE(tasks.submitTask("late", [] { return true; }).empty());
    EXPECT_EQ(tasks.getRejectedCount(), 1u);

    // A second shutdown is harmless
    tasks.shutdown();
}

TEST(BackgroundTaskManagerTest, StatusReportsCounters) {
    BackgroundTaskManager tasks(3, 10);
    tasks.submitTask("ok", [] { return true; });
    ASSERT_TRUE(tasks.waitIdle(2s));

    auto status = tasks.getStatus();
    EXPECT_EQ(status["workers"].get<size_t>(), 3u);
    EXPECT_EQ(status["completed"].get<uint64_t>(), 1u);
    EXPECT_TRUE(status["accepting"].get<bool>());
}
