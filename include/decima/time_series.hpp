#pragma once

#include <chrono>

namespace decima
{

// A value stamped with its arrival time, for live streams plotted against time.
template <typename T>
struct TimeSeriesPoint
{
    using Clock = std::chrono::system_clock;

    Clock::time_point timestamp = Clock::now();
    T                 value{};

    // Seconds elapsed from `origin` to this point's timestamp.
    double seconds_since(Clock::time_point origin) const
    {
        return std::chrono::duration<double>(timestamp - origin).count();
    }
};

}   // namespace decima
