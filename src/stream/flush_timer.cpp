#include <decima/flush_timer.hpp>
#include <decima/logger.hpp>
#include <exception>
#include <stdexcept>

namespace decima
{

void FlushTimer::start(std::chrono::nanoseconds interval, Callback callback)
{
    if (interval.count() <= 0)
        throw std::invalid_argument("flush interval must be positive");
    if (!callback)
        throw std::invalid_argument("flush callback is empty");

    stop();
    running_.store(true, std::memory_order_release);
    thread_ = std::jthread([this, interval, callback = std::move(callback)](std::stop_token st)
                           { run(std::move(st), interval, callback); });
}

void FlushTimer::stop()
{
    if (!thread_.joinable())
    {
        running_.store(false, std::memory_order_release);
        return;
    }

    thread_.request_stop();
    running_.store(false, std::memory_order_release);

    // A tick calling stop() cannot join itself; the loop exits after the
    // callback returns and the owner joins later.
    if (thread_.get_id() == std::this_thread::get_id())
        return;

    thread_.join();
}

void FlushTimer::run(std::stop_token stop, std::chrono::nanoseconds interval, Callback callback)
{
    DECIMA_LOG_DEBUG("timer",
                     "Flush timer started ({} us interval)",
                     static_cast<long long>(
                         std::chrono::duration_cast<std::chrono::microseconds>(interval).count()));

    auto next = Clock::now() + interval;
    while (!stop.stop_requested())
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Returns early only when a stop is requested.
            if (wake_.wait_until(lock, stop, next, [] { return false; }) || stop.stop_requested())
                break;
        }

        try
        {
            callback();
        }
        catch (const std::exception& e)
        {
            DECIMA_LOG_ERROR("timer", "Flush callback threw: {}", e.what());
        }
        catch (...)
        {
            DECIMA_LOG_ERROR("timer", "Flush callback threw a non-standard exception");
        }
        ticks_.fetch_add(1, std::memory_order_relaxed);

        next += interval;
        const auto now = Clock::now();
        if (next < now)
        {
            DECIMA_LOG_TRACE("timer", "Tick overran its slot, rescheduling");
            next = now + interval;
        }
    }

    DECIMA_LOG_DEBUG("timer", "Flush timer stopped after {} ticks", tick_count());
}

}   // namespace decima
