#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace decima
{

// Running query statistics of a ReductionEngine.
struct RenderMetrics
{
    double        last_query_seconds    = 0.0;
    double        average_query_seconds = 0.0;
    std::uint64_t total_queries         = 0;
    std::size_t   memory_usage_bytes    = 0;   // estimate of LOD cache payload

    void record_query(double seconds);
    void reset() { *this = RenderMetrics{}; }
};

// Times a scope and records it into `metrics` on exit.
class QueryTimer
{
   public:
    using Clock = std::chrono::steady_clock;

    explicit QueryTimer(RenderMetrics& metrics) : metrics_(metrics), start_(Clock::now()) {}
    ~QueryTimer();

    QueryTimer(const QueryTimer&)            = delete;
    QueryTimer& operator=(const QueryTimer&) = delete;

   private:
    RenderMetrics&    metrics_;
    Clock::time_point start_;
};

}   // namespace decima
