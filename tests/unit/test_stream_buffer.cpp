#include <atomic>
#include <chrono>
#include <decima/stream_buffer.hpp>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace decima;

namespace
{

StreamConfig window_of(std::size_t size, UpdateFrequency freq = UpdateFrequency::fps30())
{
    StreamConfig c;
    c.window_size      = size;
    c.update_frequency = freq;
    return c;
}

template <typename Pred>
bool wait_for(Pred done, std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

}   // namespace

// --- Window semantics ---

TEST(StreamBuffer, KeepsNewestWindowValues)
{
    StreamBuffer<int> stream(window_of(5));
    for (int i = 1; i <= 7; ++i)
        stream.push(i);

    EXPECT_TRUE(stream.flush());
    EXPECT_EQ(stream.values(), (std::vector<int>{3, 4, 5, 6, 7}));
    EXPECT_EQ(stream.flush_count(), 1u);
}

TEST(StreamBuffer, EvictsAcrossFlushes)
{
    StreamBuffer<int> stream(window_of(5));
    for (int i = 1; i <= 5; ++i)
        stream.push(i);
    stream.flush();
    EXPECT_EQ(stream.values(), (std::vector<int>{1, 2, 3, 4, 5}));

    stream.push(6);
    stream.push(7);
    stream.flush();
    EXPECT_EQ(stream.values(), (std::vector<int>{3, 4, 5, 6, 7}));
    EXPECT_EQ(stream.flush_count(), 2u);
}

TEST(StreamBuffer, PendingInvisibleUntilFlush)
{
    StreamBuffer<int> stream(window_of(10));
    stream.push(1);
    stream.push(2);
    EXPECT_TRUE(stream.values().empty());
    EXPECT_EQ(stream.pending_count(), 2u);

    stream.flush();
    EXPECT_EQ(stream.pending_count(), 0u);
    EXPECT_EQ(stream.values().size(), 2u);
}

TEST(StreamBuffer, EmptyFlushIsNoOp)
{
    StreamBuffer<int> stream(window_of(5));
    stream.push(1);
    stream.flush();
    const double rate = stream.data_rate();

    EXPECT_FALSE(stream.flush());
    EXPECT_EQ(stream.flush_count(), 1u);
    EXPECT_EQ(stream.values(), (std::vector<int>{1}));
    EXPECT_DOUBLE_EQ(stream.data_rate(), rate);
}

TEST(StreamBuffer, SpanPush)
{
    StreamBuffer<double> stream(window_of(3));
    std::vector<double>  batch = {1.0, 2.0, 3.0, 4.0};
    stream.push(std::span<const double>(batch));
    stream.push(std::span<const double>());
    stream.flush();
    EXPECT_EQ(stream.values(), (std::vector<double>{2.0, 3.0, 4.0}));
}

TEST(StreamBuffer, SnapshotsAreImmutable)
{
    StreamBuffer<int> stream(window_of(3));
    stream.push(1);
    stream.flush();
    auto before = stream.data();

    stream.push(2);
    stream.flush();
    EXPECT_EQ(*before, (std::vector<int>{1}));
    EXPECT_EQ(*stream.data(), (std::vector<int>{1, 2}));
}

// --- Data rate ---

TEST(StreamBuffer, RateCountsLastSecond)
{
    StreamBuffer<int> stream(window_of(100));
    for (int i = 0; i < 10; ++i)
        stream.push(i);
    stream.flush();
    EXPECT_DOUBLE_EQ(stream.data_rate(), 10.0);
}

TEST(StreamBuffer, RateForgetsOldArrivals)
{
    StreamBuffer<int> stream(window_of(100));
    for (int i = 0; i < 10; ++i)
        stream.push(i);
    stream.flush();

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    stream.push(99);
    stream.flush();
    EXPECT_DOUBLE_EQ(stream.data_rate(), 1.0);
}

// --- clear / set_data ---

TEST(StreamBuffer, ClearDropsEverything)
{
    StreamBuffer<int> stream(window_of(5));
    stream.push(1);
    stream.flush();
    stream.push(2);

    stream.clear();
    EXPECT_TRUE(stream.values().empty());
    EXPECT_EQ(stream.pending_count(), 0u);
    EXPECT_DOUBLE_EQ(stream.data_rate(), 0.0);
    EXPECT_FALSE(stream.flush());
}

TEST(StreamBuffer, SetDataKeepsNewestValues)
{
    StreamBuffer<int> stream(window_of(5));
    stream.push(100);
    stream.set_data(std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8});

    EXPECT_EQ(stream.values(), (std::vector<int>{4, 5, 6, 7, 8}));
    EXPECT_EQ(stream.pending_count(), 0u);

    stream.set_data(std::vector<int>{9});
    EXPECT_EQ(stream.values(), (std::vector<int>{9}));
}

// --- Callback ---

TEST(StreamBuffer, CallbackSeesEveryPublish)
{
    StreamBuffer<int>        stream(window_of(4));
    std::vector<std::size_t> sizes;
    stream.set_flush_callback([&sizes](const StreamBuffer<int>::Snapshot& snap)
                              { sizes.push_back(snap.data->size()); });

    stream.push(1);
    stream.flush();
    stream.flush();   // nothing pending: no callback
    stream.set_data(std::vector<int>{1, 2, 3, 4, 5});
    stream.clear();

    EXPECT_EQ(sizes, (std::vector<std::size_t>{1, 4, 0}));
}

TEST(StreamBuffer, CallbackMayReadTheStream)
{
    StreamBuffer<int> stream(window_of(4));
    std::size_t       seen = 0;
    stream.set_flush_callback([&](const StreamBuffer<int>::Snapshot& snap)
                              { seen = stream.values().size() + snap.flush_count; });
    stream.push(5);
    stream.flush();
    EXPECT_EQ(seen, 2u);
}

// --- Concurrency and lifecycle ---

TEST(StreamBuffer, ConcurrentProducers)
{
    StreamBuffer<int>        stream(window_of(100'000));
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t)
    {
        producers.emplace_back(
            [&stream, t]()
            {
                for (int i = 0; i < 1000; ++i)
                    stream.push(t * 1000 + i);
            });
    }

    // Flush while producers are still pushing.
    std::atomic<bool> done{false};
    std::thread       flusher(
        [&]()
        {
            while (!done.load())
                stream.flush();
        });

    for (auto& p : producers)
        p.join();
    done = true;
    flusher.join();
    stream.flush();

    EXPECT_EQ(stream.values().size(), 4000u);
}

TEST(StreamBuffer, TimerFlushesWhileActive)
{
    StreamBuffer<int> stream(window_of(1000, UpdateFrequency::fps120()));
    EXPECT_FALSE(stream.is_active());

    stream.start();
    stream.start();   // no-op
    EXPECT_TRUE(stream.is_active());

    for (int i = 0; i < 20; ++i)
        stream.push(i);
    ASSERT_TRUE(wait_for([&] { return stream.values().size() == 20u; }));
    EXPECT_TRUE(stream.snapshot().active);

    stream.stop();
    stream.stop();
    EXPECT_FALSE(stream.is_active());

    const auto flushes = stream.flush_count();
    stream.push(21);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(stream.flush_count(), flushes);
    EXPECT_EQ(stream.pending_count(), 1u);
}

TEST(StreamBuffer, RestartAfterStop)
{
    StreamBuffer<int> stream(window_of(10, UpdateFrequency::custom(200.0)));
    stream.start();
    stream.stop();
    stream.start();
    stream.push(1);
    ASSERT_TRUE(wait_for([&] { return stream.values().size() == 1u; }));
    stream.stop();
}

TEST(StreamBuffer, StopFromInsideCallback)
{
    StreamBuffer<int> stream(window_of(10, UpdateFrequency::fps120()));
    stream.set_flush_callback([&stream](const StreamBuffer<int>::Snapshot&) { stream.stop(); });
    stream.start();
    stream.push(1);
    ASSERT_TRUE(wait_for([&] { return !stream.is_active(); }));
}

TEST(StreamBuffer, CallbackExceptionDoesNotStopTimer)
{
    StreamBuffer<int> stream(window_of(10, UpdateFrequency::fps120()));
    std::atomic<int>  calls{0};
    stream.set_flush_callback(
        [&calls](const StreamBuffer<int>::Snapshot&)
        {
            ++calls;
            throw std::runtime_error("listener failed");
        });
    stream.start();
    stream.push(1);
    ASSERT_TRUE(wait_for([&] { return calls.load() >= 1; }));
    stream.push(2);
    ASSERT_TRUE(wait_for([&] { return calls.load() >= 2; }));
    EXPECT_TRUE(stream.is_active());
    stream.stop();
}

TEST(StreamBuffer, RejectsZeroWindow)
{
    EXPECT_THROW(StreamBuffer<int>{window_of(0)}, std::invalid_argument);
}

TEST(StreamBuffer, ExposesConfig)
{
    StreamBuffer<int> stream(window_of(7, UpdateFrequency::fps15()));
    EXPECT_EQ(stream.window_size(), 7u);
    EXPECT_EQ(stream.update_frequency(), UpdateFrequency::fps15());
    EXPECT_EQ(stream.config().window_size, 7u);
}
