#include <decima/render_metrics.hpp>

namespace decima
{

void RenderMetrics::record_query(double seconds)
{
    last_query_seconds = seconds;
    ++total_queries;
    // Incremental mean
    average_query_seconds +=
        (seconds - average_query_seconds) / static_cast<double>(total_queries);
}

QueryTimer::~QueryTimer()
{
    const std::chrono::duration<double> elapsed = Clock::now() - start_;
    metrics_.record_query(elapsed.count());
}

}   // namespace decima
