#include <gtest/gtest.h>

#include <type_traits>
#include <vector>

#include "cdp/pipeline/ring_buffer.hpp"

using cdp::pipeline::RingBuffer;

TEST(RingBufferTest, CapacityRoundsUpToPowerOfTwo) {
    EXPECT_EQ(RingBuffer<int>(1).Capacity(), 1u);
    EXPECT_EQ(RingBuffer<int>(3).Capacity(), 4u);
    EXPECT_EQ(RingBuffer<int>(4).Capacity(), 4u);
    EXPECT_EQ(RingBuffer<int>(1000).Capacity(), 1024u);
    EXPECT_EQ(RingBuffer<int>(0).Capacity(), 1u);
}

TEST(RingBufferTest, StartsEmpty) {
    RingBuffer<int> ring(8);
    EXPECT_TRUE(ring.IsEmpty());
    EXPECT_FALSE(ring.IsFull());
    EXPECT_EQ(ring.Count(), 0u);
    EXPECT_FALSE(ring.TryPop().has_value());
    EXPECT_FALSE(ring.Front().has_value());
}

TEST(RingBufferTest, FifoOrder) {
    RingBuffer<int> ring(4);
    for (int i = 1; i <= 4; ++i) {
        EXPECT_TRUE(ring.TryPush(i));
    }
    for (int i = 1; i <= 4; ++i) {
        auto item = ring.TryPop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, i);
    }
    EXPECT_TRUE(ring.IsEmpty());
}

TEST(RingBufferTest, PushFailsWhenFullAndLeavesContentsIntact) {
    RingBuffer<int> ring(2);
    EXPECT_TRUE(ring.TryPush(1));
    EXPECT_TRUE(ring.TryPush(2));
    EXPECT_TRUE(ring.IsFull());
    EXPECT_FALSE(ring.TryPush(3));

    EXPECT_EQ(ring.Count(), 2u);
    EXPECT_EQ(*ring.TryPop(), 1);
    EXPECT_EQ(*ring.TryPop(), 2);
}

TEST(RingBufferTest, WrapsAroundManyTimes) {
    RingBuffer<int> ring(4);
    int next = 0;
    int expected = 0;
    for (int round = 0; round < 100; ++round) {
        ASSERT_TRUE(ring.TryPush(next++));
        ASSERT_TRUE(ring.TryPush(next++));
        ASSERT_TRUE(ring.TryPush(next++));
        EXPECT_EQ(*ring.TryPop(), expected++);
        EXPECT_EQ(*ring.TryPop(), expected++);
        EXPECT_EQ(*ring.TryPop(), expected++);
    }
    EXPECT_TRUE(ring.IsEmpty());
}

TEST(RingBufferTest, FrontAndAtPeekWithoutRemoving) {
    RingBuffer<int> ring(4);
    ring.TryPush(10);
    ring.TryPush(20);
    ring.TryPush(30);
    ring.TryPop();
    ring.TryPush(40);

    EXPECT_EQ(*ring.Front(), 20);
    EXPECT_EQ(ring.At(0), 20);
    EXPECT_EQ(ring.At(1), 30);
    EXPECT_EQ(ring.At(2), 40);
    EXPECT_EQ(ring.Count(), 3u);
}

TEST(RingBufferTest, ClearResets) {
    RingBuffer<int*> ring(4);
    int value = 0;
    ring.TryPush(&value);
    ring.TryPush(&value);
    ring.Clear();

    EXPECT_TRUE(ring.IsEmpty());
    EXPECT_EQ(ring.Capacity(), 4u);
    EXPECT_TRUE(ring.TryPush(&value));
    EXPECT_EQ(*ring.Front(), &value);
}

TEST(RingBufferTest, IsPinnedInPlace) {
    static_assert(!std::is_copy_constructible_v<RingBuffer<int*>>);
    static_assert(!std::is_move_constructible_v<RingBuffer<int*>>);
    static_assert(!std::is_move_assignable_v<RingBuffer<int*>>);
    static_assert(!std::is_move_constructible_v<RingBuffer<int>>);
}
