// ======================================================================
// \title  QueueTest.cpp
// \author campuzan
// \brief  cpp file for Queue unit tests
//
// Test FIFO order, the DROP_NEWEST/DROP_OLDEST overflow modes, timed
// waits and close semantics
// ======================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include <Cfdpd/Utils/Queue.hpp>

using namespace Cfdpd;

class QueueTest : public ::testing::Test {
  protected:
    static const FwSizeType QUEUE_DEPTH = 5;

    void enqueueValue(Utils::Queue<U32>& queue, U32 value) {
        Utils::QueueStatus status = queue.enqueue(value);
        ASSERT_EQ(Utils::QUEUE_OK, status);
    }

    U32 dequeueValue(Utils::Queue<U32>& queue) {
        U32 value = 0;
        Utils::QueueStatus status = queue.tryDequeue(value);
        EXPECT_EQ(Utils::QUEUE_OK, status);
        return value;
    }
};

// Test FIFO order
TEST_F(QueueTest, FIFOMode) {
    Utils::Queue<U32> queue(QUEUE_DEPTH);

    // Enqueue values 1, 2, 3, 4, 5
    for (U32 i = 1; i <= 5; i++) {
        enqueueValue(queue, i);
    }

    // Dequeue should return in order: 1, 2, 3, 4, 5
    for (U32 i = 1; i <= 5; i++) {
        EXPECT_EQ(i, dequeueValue(queue));
    }
}

// Test DROP_NEWEST mode (default) - queue full should reject new items
TEST_F(QueueTest, DropNewestMode) {
    Utils::Queue<U32> queue(QUEUE_DEPTH);

    // Fill the queue completely
    for (U32 i = 1; i <= 5; i++) {
        enqueueValue(queue, i);
    }

    // Try to enqueue when full - should fail
    EXPECT_EQ(Utils::QUEUE_FULL, queue.enqueue(99U));

    // Verify original values still intact
    for (U32 i = 1; i <= 5; i++) {
        EXPECT_EQ(i, dequeueValue(queue));
    }
}

// Test DROP_OLDEST mode - queue full should drop oldest and add new
TEST_F(QueueTest, DropOldestMode) {
    Utils::Queue<U32> queue(QUEUE_DEPTH, Utils::QUEUE_DROP_OLDEST);

    // Fill the queue with values 1, 2, 3, 4, 5
    for (U32 i = 1; i <= 5; i++) {
        enqueueValue(queue, i);
    }

    // Enqueue 99 when full - should succeed and drop oldest (1)
    EXPECT_EQ(Utils::QUEUE_DISCARDED_OLDEST, queue.enqueue(99U));

    // Should now have: 2, 3, 4, 5, 99
    EXPECT_EQ(2U, dequeueValue(queue));
    EXPECT_EQ(3U, dequeueValue(queue));
    EXPECT_EQ(4U, dequeueValue(queue));
    EXPECT_EQ(5U, dequeueValue(queue));
    EXPECT_EQ(99U, dequeueValue(queue));
}

// Depth 0 never fills
TEST_F(QueueTest, Unbounded) {
    Utils::Queue<U32> queue;

    for (U32 i = 0; i < 1000; i++) {
        enqueueValue(queue, i);
    }
    EXPECT_EQ(1000U, queue.getQueueSize());
}

// Test empty queue dequeue
TEST_F(QueueTest, DequeueEmpty) {
    Utils::Queue<U32> queue(QUEUE_DEPTH);

    U32 value;
    EXPECT_EQ(Utils::QUEUE_EMPTY, queue.tryDequeue(value));
}

// Test queue size tracking
TEST_F(QueueTest, QueueSize) {
    Utils::Queue<U32> queue(QUEUE_DEPTH);

    EXPECT_EQ(0U, queue.getQueueSize());

    enqueueValue(queue, 1);
    EXPECT_EQ(1U, queue.getQueueSize());

    enqueueValue(queue, 2);
    enqueueValue(queue, 3);
    EXPECT_EQ(3U, queue.getQueueSize());

    dequeueValue(queue);
    EXPECT_EQ(2U, queue.getQueueSize());

    dequeueValue(queue);
    dequeueValue(queue);
    EXPECT_EQ(0U, queue.getQueueSize());
}

// Test high water mark
TEST_F(QueueTest, HighWaterMark) {
    Utils::Queue<U32> queue(QUEUE_DEPTH);

    EXPECT_EQ(0U, queue.get_high_water_mark());

    enqueueValue(queue, 1);
    EXPECT_EQ(1U, queue.get_high_water_mark());

    enqueueValue(queue, 2);
    enqueueValue(queue, 3);
    EXPECT_EQ(3U, queue.get_high_water_mark());

    // Dequeue doesn't lower high water mark
    dequeueValue(queue);
    EXPECT_EQ(3U, queue.get_high_water_mark());

    // Clear and verify
    queue.clear_high_water_mark();
    EXPECT_EQ(0U, queue.get_high_water_mark());
}

// Test alternating enqueue/dequeue
TEST_F(QueueTest, AlternatingFIFO) {
    Utils::Queue<U32> queue(QUEUE_DEPTH);

    enqueueValue(queue, 1);
    enqueueValue(queue, 2);
    EXPECT_EQ(1U, dequeueValue(queue));

    enqueueValue(queue, 3);
    EXPECT_EQ(2U, dequeueValue(queue));
    EXPECT_EQ(3U, dequeueValue(queue));
}

// Owned values are moved through, never copied
TEST_F(QueueTest, MoveOnlyMessages) {
    Utils::Queue<std::unique_ptr<U32> > queue;

    ASSERT_EQ(Utils::QUEUE_OK, queue.enqueue(std::unique_ptr<U32>(new U32(7))));

    std::unique_ptr<U32> out;
    ASSERT_EQ(Utils::QUEUE_OK, queue.tryDequeue(out));
    ASSERT_TRUE(out);
    EXPECT_EQ(7U, *out);
}

// A deadline in the past returns at once
TEST_F(QueueTest, DequeueUntilTimesOut) {
    Utils::Queue<U32> queue;
    U32 value;

    const Utils::Queue<U32>::Clock::time_point start = Utils::Queue<U32>::Clock::now();
    EXPECT_EQ(Utils::QUEUE_TIMEOUT, queue.dequeueFor(value, std::chrono::milliseconds(20)));
    EXPECT_GE(Utils::Queue<U32>::Clock::now() - start, std::chrono::milliseconds(20));

    EXPECT_EQ(Utils::QUEUE_TIMEOUT, queue.dequeueUntil(value, Utils::Queue<U32>::Clock::now()));
}

// A waiting consumer wakes as soon as a producer enqueues
TEST_F(QueueTest, WaiterWakesOnEnqueue) {
    Utils::Queue<U32> queue;

    std::thread producer([&queue] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        EXPECT_EQ(Utils::QUEUE_OK, queue.enqueue(42U));
    });

    U32 value = 0;
    EXPECT_EQ(Utils::QUEUE_OK, queue.dequeueFor(value, std::chrono::seconds(5)));
    EXPECT_EQ(42U, value);
    producer.join();
}

// Messages queued before close are still delivered, later ones are refused
TEST_F(QueueTest, CloseDrainsThenReportsClosed) {
    Utils::Queue<U32> queue;
    enqueueValue(queue, 1);
    enqueueValue(queue, 2);

    queue.close();
    EXPECT_TRUE(queue.isClosed());
    EXPECT_EQ(Utils::QUEUE_CLOSED, queue.enqueue(3U));

    U32 value = 0;
    EXPECT_EQ(Utils::QUEUE_OK, queue.dequeueFor(value, std::chrono::seconds(1)));
    EXPECT_EQ(1U, value);
    EXPECT_EQ(Utils::QUEUE_OK, queue.dequeue(value));
    EXPECT_EQ(2U, value);
    EXPECT_EQ(Utils::QUEUE_CLOSED, queue.dequeue(value));
    EXPECT_EQ(Utils::QUEUE_CLOSED, queue.tryDequeue(value));
}

// Closing wakes a consumer blocked without a deadline
TEST_F(QueueTest, CloseWakesBlockedConsumer) {
    Utils::Queue<U32> queue;

    std::thread closer([&queue] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        queue.close();
    });

    U32 value = 0;
    EXPECT_EQ(Utils::QUEUE_CLOSED, queue.dequeue(value));
    closer.join();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
