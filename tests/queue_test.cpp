#include "queue.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(queue_test, fifo_order) {
    Queue<int> q(4);
    for (int i = 0; i < 3; i++) {
        q.enqueue(i);
    }
    EXPECT_EQ(q.dequeue(), 0);
    q.enqueue(99);

    std::ostringstream out;
    out << q;
    EXPECT_EQ(out.str(), "Queue([1, 2, 99])");
}

TEST(queue_test, full_and_empty_errors) {
    Queue<int> q(2);
    EXPECT_THROW(q.dequeue(), EmptyCollection);
    q.enqueue(1);
    q.enqueue(2);
    EXPECT_TRUE(q.full());
    EXPECT_THROW(q.enqueue(3), CapacityExceeded);
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.dequeue(), 1);
}

TEST(queue_test, wraps_around_without_stale_values) {
    Queue<int> q(3);
    int next_in = 0;
    int next_out = 0;

    // More operations than capacity so head and tail wrap several times
    for (int round = 0; round < 10; round++) {
        while (!q.full()) {
            q.enqueue(next_in++);
        }
        EXPECT_EQ(q.dequeue(), next_out++);
        EXPECT_EQ(q.dequeue(), next_out++);
    }
    while (!q.empty()) {
        EXPECT_EQ(q.dequeue(), next_out++);
    }
    EXPECT_EQ(next_in, next_out);

    for (std::size_t slot = 0; slot < q.capacity(); slot++) {
        EXPECT_TRUE(q.isSlotCleared(slot));
    }
}

TEST(queue_test, dequeued_slot_cleared_before_reuse) {
    Queue<int> q(2);
    q.enqueue(10);
    q.enqueue(20);
    q.dequeue();
    EXPECT_TRUE(q.isSlotCleared(0));
    EXPECT_FALSE(q.isSlotCleared(1));

    q.enqueue(30);
    EXPECT_FALSE(q.isSlotCleared(0));
    EXPECT_EQ(q.at(0), 20);
    EXPECT_EQ(q.at(1), 30);
    EXPECT_THROW(q.at(2), IndexOutOfRange);
}

TEST(queue_test, zero_capacity_rejects_enqueue) {
    Queue<int> q(0);
    EXPECT_THROW(q.enqueue(1), CapacityExceeded);
    EXPECT_THROW(q.dequeue(), EmptyCollection);
}
