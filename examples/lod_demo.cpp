#include <chrono>
#include <cmath>
#include <decima/decima.hpp>
#include <iostream>
#include <thread>
#include <vector>

using namespace decima;

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    // Two million samples of a noisy chirp
    constexpr std::size_t N = 2'000'000;
    std::vector<Point>    raw(N);
    for (std::size_t i = 0; i < N; ++i)
    {
        const double t = static_cast<double>(i) * 1e-4;
        raw[i]         = Point{t, std::sin(t * t * 0.05) + 0.1 * std::sin(t * 37.0)};
    }

    ReductionEngine<Point> engine(Series<Point>(std::move(raw)),
                                  sampling::LargestTriangleThreeBuckets{});

    // Let the ladder fill in the background
    while (engine.precompute_in_flight())
    {
        engine.process_pending();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    for (std::size_t target : {50, 120, 700, 3000, 20000})
    {
        auto view = engine.optimized_data(std::nullopt, target);
        std::cout << "target " << target << " -> level "
                  << engine.resolve_level(target).value_or(target) << ", " << view.size()
                  << " points\n";
    }

    const auto accessor = [](const Point& p) { return p; };

    // Zoom into a 10 second window rendered 1280 pixels wide
    auto zoomed = engine.data_for_viewport(50.0, 60.0, 1280.0, accessor);
    std::cout << "viewport [50, 60] -> " << zoomed.size() << " points\n";

    engine.build_spatial_index(accessor, Rect{0.0, -1.5, 200.0, 3.0});
    while (!engine.spatial_index_ready() && engine.spatial_index_pending())
    {
        engine.process_pending();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (auto hits = engine.points_near({100.0, 0.0}, 0.01))
        std::cout << "points within 0.01 of (100, 0): " << hits->size() << "\n";

    const auto& m = engine.metrics();
    std::cout << "queries " << m.total_queries << ", avg "
              << m.average_query_seconds * 1000.0 << " ms, cache "
              << m.memory_usage_bytes / 1024 << " KiB\n";

    return 0;
}
