#include <gtest/gtest.h>
#include "mbk/core/work_queue.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using mbk::core::WorkQueue;

TEST(WorkQueue, HandsOutItemsInSubmissionOrder) {
    WorkQueue<int> queue;
    for (int i = 1; i <= 3; ++i) {
        EXPECT_TRUE(queue.try_push(i * 10));
    }
    EXPECT_EQ(queue.pending(), 3u);

    EXPECT_EQ(queue.pop().value(), 10);
    EXPECT_EQ(queue.pop().value(), 20);
    EXPECT_EQ(queue.pop().value(), 30);
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(WorkQueue, RefusesPushWhenFull) {
    WorkQueue<int> queue(2);
    EXPECT_EQ(queue.capacity(), 2u);

    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_EQ(queue.pending(), 2u);

    queue.pop();
    EXPECT_TRUE(queue.try_push(3));
}

TEST(WorkQueue, ShutdownStillDrainsQueuedItems) {
    WorkQueue<std::string> queue;
    queue.try_push("nightly");
    queue.try_push("hourly");
    queue.shutdown();

    EXPECT_TRUE(queue.is_shutdown());
    EXPECT_FALSE(queue.try_push("late"));

    EXPECT_EQ(queue.pop().value(), "nightly");
    EXPECT_EQ(queue.pop().value(), "hourly");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(WorkQueue, ShutdownWakesIdleWorkers) {
    WorkQueue<int> queue;
    std::atomic<int> woken{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 3; ++i) {
        workers.emplace_back([&]() {
            if (!queue.pop().has_value()) {
                ++woken;
            }
        });
    }

    queue.shutdown();
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(woken.load(), 3);
}

TEST(WorkQueue, HoldsMoveOnlyItems) {
    WorkQueue<std::unique_ptr<int>> queue(1);
    ASSERT_TRUE(queue.try_push(std::make_unique<int>(5)));

    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(**item, 5);
}

TEST(WorkQueue, SeveralWorkersConsumeEverything) {
    WorkQueue<int> queue;
    std::atomic<int> sum{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&]() {
            while (auto item = queue.pop()) {
                sum += *item;
            }
        });
    }

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(queue.try_push(i));
    }
    queue.shutdown();
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(sum.load(), 4950);
}
