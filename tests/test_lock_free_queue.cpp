#include "lock_free_queue.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>

using namespace umpire;

TEST(LockFreeQueue, BoundedFifo) {
    LockFreeQueue<int> q(2);
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(q.capacity(), 2u);

    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_FALSE(q.push(3));
    EXPECT_EQ(q.size(), 2u);

    int v = 0;
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 1);
    EXPECT_TRUE(q.push(3));
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 2);
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 3);
    EXPECT_FALSE(q.pop(v));
}

TEST(LockFreeQueue, PopReleasesSharedOwnership) {
    LockFreeQueue<std::shared_ptr<int>> q(1);
    auto item = std::make_shared<int>(7);
    ASSERT_TRUE(q.push(item));
    EXPECT_EQ(item.use_count(), 2);

    std::shared_ptr<int> out;
    ASSERT_TRUE(q.pop(out));
    out.reset();
    EXPECT_EQ(item.use_count(), 1);
}

TEST(LockFreeQueue, RejectedPushLeavesItemWithCaller) {
    LockFreeQueue<std::unique_ptr<int>> q(1);
    ASSERT_TRUE(q.push(std::make_unique<int>(1)));

    auto item = std::make_unique<int>(2);
    EXPECT_FALSE(q.push(std::move(item)));
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(*item, 2);

    std::unique_ptr<int> out;
    ASSERT_TRUE(q.pop(out));
    EXPECT_TRUE(q.push(std::move(item)));
    EXPECT_EQ(item, nullptr);
}

TEST(LockFreeQueue, SingleProducerSingleConsumer) {
    LockFreeQueue<int> q(16);
    const int n = 10000;

    std::thread producer([&q, n] {
        for (int i = 0; i < n; ++i) {
            while (!q.push(i)) std::this_thread::yield();
        }
    });

    int expected = 0;
    while (expected < n) {
        int v;
        if (q.pop(v)) {
            EXPECT_EQ(v, expected);
            ++expected;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    EXPECT_TRUE(q.empty());
}
