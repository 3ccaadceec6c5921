#include <gtest/gtest.h>
#include "cellpaint/store/bounded_queue.h"
#include <stdexcept>
#include <vector>

using cellpaint::BoundedQueue;

namespace {
std::vector<int> contents(const BoundedQueue<int>& queue) {
    return std::vector<int>(queue.begin(), queue.end());
}
} // namespace

TEST(BoundedQueueTest, AppendUntilFull) {
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_EQ(queue.capacity(), 2u);

    queue.append(1);
    queue.append(2);
    EXPECT_TRUE(queue.isFull());
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_THROW(queue.append(3), std::length_error);
    EXPECT_EQ(contents(queue), (std::vector<int>{ 1, 2 }));
}

TEST(BoundedQueueTest, PopFrontIsFifo) {
    BoundedQueue<int> queue(3);
    queue.append(1);
    queue.append(2);
    queue.append(3);

    EXPECT_EQ(queue.popFront(), 1);
    EXPECT_EQ(queue.front(), 2);
    EXPECT_EQ(queue.popFront(), 2);
    EXPECT_EQ(queue.popFront(), 3);
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_THROW(queue.popFront(), std::out_of_range);
    EXPECT_THROW(queue.front(), std::out_of_range);
}

TEST(BoundedQueueTest, WrapsAroundTheRing) {
    BoundedQueue<int> queue(3);
    queue.append(1);
    queue.append(2);
    queue.append(3);
    queue.popFront();
    queue.popFront();
    queue.append(4);
    queue.append(5);

    EXPECT_TRUE(queue.isFull());
    EXPECT_EQ(contents(queue), (std::vector<int>{ 3, 4, 5 }));
    EXPECT_EQ(queue.at(2), 5);
    EXPECT_THROW(queue.at(3), std::out_of_range);
}

TEST(BoundedQueueTest, ReverseAcrossWrap) {
    BoundedQueue<int> queue(4);
    for (int i = 1; i <= 4; ++i) queue.append(i);
    queue.popFront();
    queue.popFront();
    queue.append(5);
    // Ring now holds 3, 4, 5 with the front in the middle of storage.
    queue.reverse();
    EXPECT_EQ(contents(queue), (std::vector<int>{ 5, 4, 3 }));
    EXPECT_EQ(queue.popFront(), 5);

    queue.reverse();
    EXPECT_EQ(contents(queue), (std::vector<int>{ 3, 4 }));
}

TEST(BoundedQueueTest, ClearResetsState) {
    BoundedQueue<int> queue(2);
    queue.append(1);
    queue.append(2);
    queue.clear();
    EXPECT_TRUE(queue.isEmpty());
    queue.append(7);
    EXPECT_EQ(contents(queue), (std::vector<int>{ 7 }));
}

TEST(BoundedQueueTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}
