#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace decima
{

// Runs a callback at a fixed cadence on its own thread.
// Ticks are scheduled against absolute deadlines; a tick that overruns its
// slot pushes the schedule forward instead of firing a burst to catch up.
class FlushTimer
{
   public:
    using Callback = std::function<void()>;
    using Clock    = std::chrono::steady_clock;

    FlushTimer() = default;
    ~FlushTimer() { stop(); }

    FlushTimer(const FlushTimer&)            = delete;
    FlushTimer& operator=(const FlushTimer&) = delete;

    // Starts ticking every `interval`.  Restarts when already running.
    // Throws std::invalid_argument for a non-positive interval or empty callback.
    void start(std::chrono::nanoseconds interval, Callback callback);

    // Idempotent.  Once it returns no further tick runs, except when called
    // from inside the callback itself, where it only requests the stop.
    void stop();

    bool          running() const { return running_.load(std::memory_order_acquire); }
    std::uint64_t tick_count() const { return ticks_.load(std::memory_order_relaxed); }

   private:
    void run(std::stop_token stop, std::chrono::nanoseconds interval, Callback callback);

    std::mutex                  mutex_;
    std::condition_variable_any wake_;
    std::atomic<bool>           running_{false};
    std::atomic<std::uint64_t>  ticks_{0};
    std::jthread                thread_;
};

}   // namespace decima
