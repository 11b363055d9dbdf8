#include <gtest/gtest.h>

#include <atomic>
#include <decima/command_queue.hpp>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace decima;

TEST(CommandQueue, InitiallyEmpty)
{
    CommandQueue q;
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(q.capacity(), CommandQueue::DEFAULT_CAPACITY);
}

TEST(CommandQueue, PushPopRunsLater)
{
    CommandQueue q;
    int          value = 0;

    EXPECT_TRUE(q.push([&value]() { value = 42; }));
    EXPECT_FALSE(q.empty());
    EXPECT_EQ(value, 0);

    CommandQueue::Command cmd;
    EXPECT_TRUE(q.pop(cmd));
    EXPECT_TRUE(q.empty());

    cmd();
    EXPECT_EQ(value, 42);
}

TEST(CommandQueue, DrainRunsInFifoOrder)
{
    CommandQueue     q;
    std::vector<int> order;

    q.push([&order]() { order.push_back(1); });
    q.push([&order]() { order.push_back(2); });
    q.push([&order]() { order.push_back(3); });

    EXPECT_EQ(q.drain(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(q.drain(), 0u);
}

TEST(CommandQueue, FullQueueRejectsPush)
{
    // Capacity 4 leaves 3 usable slots
    CommandQueue q(4);
    EXPECT_TRUE(q.push([]() {}));
    EXPECT_TRUE(q.push([]() {}));
    EXPECT_TRUE(q.push([]() {}));
    EXPECT_FALSE(q.push([]() {}));

    CommandQueue::Command cmd;
    EXPECT_TRUE(q.pop(cmd));
    EXPECT_TRUE(q.push([]() {}));
}

TEST(CommandQueue, RejectsTinyCapacity)
{
    EXPECT_THROW(CommandQueue(1), std::invalid_argument);
    EXPECT_THROW(CommandQueue(0), std::invalid_argument);
}

TEST(CommandQueue, NullCommandIsCountedButNotRun)
{
    CommandQueue q;
    q.push(nullptr);
    EXPECT_EQ(q.drain(), 1u);
}

TEST(CommandQueue, PoppedSlotReleasesCapture)
{
    CommandQueue q;
    auto         payload = std::make_shared<int>(7);
    std::weak_ptr<int> watch = payload;

    q.push([p = std::move(payload)]() { (void)p; });
    q.drain();
    EXPECT_TRUE(watch.expired());
}

TEST(CommandQueue, ProducerConsumerThreaded)
{
    CommandQueue     q(16);
    std::atomic<int> sum{0};
    constexpr int    N = 5000;

    std::thread producer(
        [&q, &sum]()
        {
            for (int i = 0; i < N; ++i)
            {
                while (!q.push([&sum, i]() { sum.fetch_add(i, std::memory_order_relaxed); }))
                    std::this_thread::yield();
            }
        });

    std::thread consumer(
        [&q]()
        {
            int consumed = 0;
            while (consumed < N)
            {
                consumed += static_cast<int>(q.drain());
                if (consumed < N)
                    std::this_thread::yield();
            }
        });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum.load(), N * (N - 1) / 2);
}
