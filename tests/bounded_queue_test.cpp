#include <gtest/gtest.h>
#include "utils/bounded_queue.h"
#include <atomic>
#include <thread>

using namespace zwatch;

namespace {

// Even values are droppable, odd values must be delivered
bool evenIsDroppable(const int& value) {
    return value % 2 == 0;
}

using IntQueue = BoundedQueue<int>;

} // namespace

TEST(BoundedQueueTest, FifoOrder) {
    IntQueue queue(4, BackpressurePolicy::DROP_OLDEST);
    queue.push(1);
    queue.push(2);
    queue.push(3);
    EXPECT_EQ(3u, queue.size());
    EXPECT_EQ(1, *queue.pop());
    EXPECT_EQ(2, *queue.pop());
    EXPECT_EQ(3, *queue.tryPop());
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(BoundedQueueTest, DropOldestEvictsOnlyDroppableItems) {
    IntQueue queue(3, BackpressurePolicy::DROP_OLDEST, evenIsDroppable);
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(IntQueue::PushResult::DROPPED_OLDEST, queue.push(5));
    EXPECT_EQ(1u, queue.droppedCount());

    EXPECT_EQ(1, *queue.pop());
    EXPECT_EQ(3, *queue.pop());
    EXPECT_EQ(5, *queue.pop());
}

TEST(BoundedQueueTest, DropOldestDiscardsDroppableNewItemWhenNothingElseCanGo) {
    IntQueue queue(2, BackpressurePolicy::DROP_OLDEST, evenIsDroppable);
    queue.push(1);
    queue.push(3);
    EXPECT_EQ(IntQueue::PushResult::DROPPED_NEW, queue.push(4));
    EXPECT_EQ(2u, queue.size());
}

TEST(BoundedQueueTest, DropNewestDiscardsIncoming) {
    IntQueue queue(2, BackpressurePolicy::DROP_NEWEST);
    queue.push(10);
    queue.push(20);
    EXPECT_EQ(IntQueue::PushResult::DROPPED_NEW, queue.push(30));
    EXPECT_EQ(10, *queue.pop());
    EXPECT_EQ(20, *queue.pop());
}

TEST(BoundedQueueTest, UndroppableItemBlocksUntilSpace) {
    IntQueue queue(1, BackpressurePolicy::DROP_OLDEST, evenIsDroppable);
    queue.push(1);

    std::atomic<bool> pushed(false);
    std::thread producer([&]() {
        queue.push(3);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed);
    EXPECT_EQ(1, *queue.pop());
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(3, *queue.pop());
}

TEST(BoundedQueueTest, BlockPolicyWaitsForConsumer) {
    IntQueue queue(1, BackpressurePolicy::BLOCK);
    queue.push(1);

    std::thread producer([&]() { queue.push(2); });
    EXPECT_EQ(1, *queue.pop());
    producer.join();
    EXPECT_EQ(2, *queue.pop());
    EXPECT_EQ(0u, queue.droppedCount());
}

TEST(BoundedQueueTest, CloseWakesBlockedProducerAndDrains) {
    IntQueue queue(1, BackpressurePolicy::BLOCK);
    queue.push(1);

    IntQueue::PushResult result = IntQueue::PushResult::PUSHED;
    std::thread producer([&]() { result = queue.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    producer.join();

    EXPECT_EQ(IntQueue::PushResult::CLOSED, result);
    EXPECT_EQ(1, *queue.pop());
    EXPECT_FALSE(queue.pop().has_value());
}
