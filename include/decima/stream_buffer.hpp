#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <decima/config.hpp>
#include <decima/flush_timer.hpp>
#include <decima/logger.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace decima
{

// ─── Stream Buffer ──────────────────────────────────────────────────────────
// Ingests values pushed at any rate from any thread and commits them into a
// bounded sliding window on a fixed cadence.
//
//   decima::StreamBuffer<double> stream({.window_size = 500,
//                                        .update_frequency = decima::UpdateFrequency::fps60()});
//   stream.set_flush_callback([](const auto& snap) { /* redraw snap.data */ });
//   stream.start();
//   stream.push(42.5);   // from any thread
//
// Locking: producers only ever take the ingest mutex, for the length of an
// append.  Flush, clear() and set_data() serialize on the window mutex and
// take the ingest mutex only to swap the pending buffer out.  Readers get
// immutable snapshots.

template <typename T>
class StreamBuffer
{
   public:
    using Clock     = std::chrono::steady_clock;
    using WindowPtr = std::shared_ptr<const std::vector<T>>;

    struct Snapshot
    {
        WindowPtr     data;
        double        data_rate   = 0.0;
        bool          active      = false;
        std::uint64_t flush_count = 0;
    };

    using FlushCallback = std::function<void(const Snapshot&)>;

    static constexpr std::chrono::seconds RATE_WINDOW{1};

    explicit StreamBuffer(StreamConfig config = {})
        : config_(validated(config)), published_(std::make_shared<const std::vector<T>>())
    {
    }

    ~StreamBuffer() { stop(); }

    StreamBuffer(const StreamBuffer&)            = delete;
    StreamBuffer& operator=(const StreamBuffer&) = delete;

    // ── Ingest (any thread) ──

    void push(T value)
    {
        const auto                  now = Clock::now();
        std::lock_guard<std::mutex> lock(ingest_mutex_);
        pending_.push_back(std::move(value));
        arrivals_.push_back(now);
        prune_arrivals(now);
    }

    void push(std::span<const T> values)
    {
        if (values.empty())
            return;
        const auto                  now = Clock::now();
        std::lock_guard<std::mutex> lock(ingest_mutex_);
        pending_.insert(pending_.end(), values.begin(), values.end());
        arrivals_.insert(arrivals_.end(), values.size(), now);
        prune_arrivals(now);
    }

    // ── Lifecycle ──

    void start()
    {
        if (active_.exchange(true))
            return;
        timer_.start(config_.update_frequency.interval(), [this] { flush(); });
        DECIMA_LOG_INFO("stream", "Stream started ({})", describe(config_));
    }

    // Idempotent.  No flush runs after stop() returns.
    void stop()
    {
        if (!active_.exchange(false))
            return;
        timer_.stop();
        DECIMA_LOG_INFO("stream", "Stream stopped after {} flushes", flush_count());
    }

    bool is_active() const { return active_.load(); }

    // ── Window maintenance ──

    // Moves everything pending into the window, evicting the oldest values
    // beyond window_size().  No-op (returns false) when nothing is pending.
    bool flush()
    {
        std::unique_lock<std::mutex> window_lock(window_mutex_);

        std::vector<T> incoming;
        double         rate = 0.0;
        {
            std::lock_guard<std::mutex> lock(ingest_mutex_);
            if (pending_.empty())
                return false;
            incoming.swap(pending_);
            prune_arrivals(Clock::now());
            rate = static_cast<double>(arrivals_.size());
        }

        for (auto& value : incoming)
            window_.push_back(std::move(value));
        while (window_.size() > config_.window_size)
            window_.pop_front();

        data_rate_ = rate;
        ++flush_count_;
        DECIMA_LOG_TRACE("stream",
                         "Flushed {} values, window {}, rate {}",
                         incoming.size(),
                         window_.size(),
                         rate);
        publish(std::move(window_lock));
        return true;
    }

    // Drops pending values, the window and the rate history.
    void clear()
    {
        std::unique_lock<std::mutex> window_lock(window_mutex_);
        {
            std::lock_guard<std::mutex> lock(ingest_mutex_);
            pending_.clear();
            arrivals_.clear();
        }
        window_.clear();
        data_rate_ = 0.0;
        publish(std::move(window_lock));
    }

    // Replaces the window with the newest window_size() of `values` right
    // away, discarding anything pending.
    void set_data(std::span<const T> values)
    {
        std::unique_lock<std::mutex> window_lock(window_mutex_);
        {
            std::lock_guard<std::mutex> lock(ingest_mutex_);
            pending_.clear();
        }
        const std::size_t keep = std::min(values.size(), config_.window_size);
        window_.assign(values.end() - static_cast<std::ptrdiff_t>(keep), values.end());
        publish(std::move(window_lock));
    }

    void set_data(const std::vector<T>& values) { set_data(std::span<const T>(values)); }

    void set_flush_callback(FlushCallback callback)
    {
        std::lock_guard<std::mutex> lock(window_mutex_);
        on_publish_ = std::move(callback);
    }

    // ── Reads ──

    WindowPtr data() const
    {
        std::lock_guard<std::mutex> lock(window_mutex_);
        return published_;
    }

    std::vector<T> values() const { return *data(); }

    Snapshot snapshot() const
    {
        std::lock_guard<std::mutex> lock(window_mutex_);
        return Snapshot{published_, data_rate_, is_active(), flush_count_};
    }

    double data_rate() const
    {
        std::lock_guard<std::mutex> lock(window_mutex_);
        return data_rate_;
    }

    std::uint64_t flush_count() const
    {
        std::lock_guard<std::mutex> lock(window_mutex_);
        return flush_count_;
    }

    std::size_t pending_count() const
    {
        std::lock_guard<std::mutex> lock(ingest_mutex_);
        return pending_.size();
    }

    std::size_t            window_size() const { return config_.window_size; }
    const UpdateFrequency& update_frequency() const { return config_.update_frequency; }
    const StreamConfig&    config() const { return config_; }

   private:
    static StreamConfig validated(const StreamConfig& config)
    {
        config.validate();
        return config;
    }

    // Requires ingest_mutex_.
    void prune_arrivals(Clock::time_point now)
    {
        const auto cutoff = now - RATE_WINDOW;
        while (!arrivals_.empty() && arrivals_.front() <= cutoff)
            arrivals_.pop_front();
    }

    // Swaps in a fresh snapshot under the window lock, then notifies with
    // every lock released.
    void publish(std::unique_lock<std::mutex> window_lock)
    {
        published_ = std::make_shared<const std::vector<T>>(window_.begin(), window_.end());
        Snapshot      snap{published_, data_rate_, is_active(), flush_count_};
        FlushCallback callback = on_publish_;
        window_lock.unlock();

        if (callback)
            callback(snap);
    }

    const StreamConfig config_;

    mutable std::mutex            ingest_mutex_;
    std::vector<T>                pending_;
    std::deque<Clock::time_point> arrivals_;

    mutable std::mutex window_mutex_;
    std::deque<T>      window_;
    WindowPtr          published_;
    double             data_rate_   = 0.0;
    std::uint64_t      flush_count_ = 0;
    FlushCallback      on_publish_;

    std::atomic<bool> active_{false};

    // Declared last: its thread is joined before the state it flushes goes away.
    FlushTimer timer_;
};

}   // namespace decima
