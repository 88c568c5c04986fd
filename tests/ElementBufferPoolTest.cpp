#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/mem/ElementBufferPool.h"

using jstream::mem::ElementBufferPool;
using jstream::mem::PooledBuffer;

TEST(ElementBufferPoolTest, CapacityRoundsUpToPowerOfTwo) {
    ElementBufferPool<int> pool;
    auto a = pool.acquire(0);
    auto b = pool.acquire(5);
    auto c = pool.acquire(32);
    EXPECT_EQ(a.capacity(), 1u);
    EXPECT_EQ(b.capacity(), 8u);
    EXPECT_EQ(c.capacity(), 32u);
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(pool.outstanding(), 3u);
}

TEST(ElementBufferPoolTest, ReleasedBlocksAreReused) {
    ElementBufferPool<int> pool;
    {
        auto buffer = pool.acquire(16);
        buffer.push_back(1);
    }
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_EQ(pool.cached(), 1u);
    EXPECT_EQ(pool.allocations(), 1u);

    auto again = pool.acquire(9);
    EXPECT_EQ(again.capacity(), 16u);
    EXPECT_TRUE(again.empty());
    EXPECT_EQ(pool.allocations(), 1u);
    EXPECT_EQ(pool.cached(), 0u);
}

TEST(ElementBufferPoolTest, PushBackGrowsAndKeepsOrder) {
    ElementBufferPool<std::string> pool;
    auto buffer = pool.acquire(2);
    for (int i = 0; i < 20; ++i) {
        buffer.push_back(std::to_string(i));
    }
    EXPECT_EQ(buffer.size(), 20u);
    EXPECT_EQ(buffer.capacity(), 32u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(buffer[static_cast<std::size_t>(i)], std::to_string(i));
    }
    EXPECT_EQ(pool.outstanding(), 1u);
}

TEST(ElementBufferPoolTest, ClearDestroysElements) {
    ElementBufferPool<std::shared_ptr<int>> pool;
    auto tracked = std::make_shared<int>(7);
    auto buffer = pool.acquire(4);
    buffer.push_back(tracked);
    buffer.push_back(tracked);
    EXPECT_EQ(tracked.use_count(), 3);
    buffer.clear();
    EXPECT_EQ(tracked.use_count(), 1);
    EXPECT_EQ(buffer.capacity(), 4u);

    buffer.push_back(tracked);
    buffer.release();
    EXPECT_EQ(tracked.use_count(), 1);
    EXPECT_FALSE(buffer.valid());
    EXPECT_EQ(pool.outstanding(), 0u);
}

TEST(ElementBufferPoolTest, MoveTransfersOwnership) {
    ElementBufferPool<int> pool;
    auto first = pool.acquire(4);
    first.push_back(42);
    PooledBuffer<int> second(std::move(first));
    EXPECT_FALSE(first.valid());
    ASSERT_TRUE(second.valid());
    EXPECT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0], 42);

    PooledBuffer<int> third;
    third = std::move(second);
    EXPECT_EQ(third[0], 42);
    EXPECT_EQ(pool.outstanding(), 1u);
}

TEST(ElementBufferPoolTest, CacheIsBoundedPerClass) {
    ElementBufferPool<int> pool;
    {
        std::vector<PooledBuffer<int>> buffers;
        for (std::size_t i = 0; i < ElementBufferPool<int>::kMaxCachedPerClass + 4; ++i) {
            buffers.push_back(pool.acquire(8));
        }
    }
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_EQ(pool.cached(), ElementBufferPool<int>::kMaxCachedPerClass);
}

TEST(ElementBufferPoolTest, ConcurrentStreamsShareOnePool) {
    ElementBufferPool<int> pool;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&pool, t] {
            for (int round = 0; round < 200; ++round) {
                auto buffer = pool.acquire(4);
                for (int i = 0; i < 10; ++i) {
                    buffer.push_back(t * 1000 + i);
                }
                EXPECT_EQ(buffer[9], t * 1000 + 9);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_LE(pool.cached(), 3 * ElementBufferPool<int>::kMaxCachedPerClass);
}
