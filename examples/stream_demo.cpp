#include <chrono>
#include <decima/decima.hpp>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace decima;

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    StreamBuffer<double> stream({.window_size = 500, .update_frequency = UpdateFrequency::fps30()});

    // Timestamped history of every committed window, for plotting against time
    std::mutex                           history_mutex;
    std::vector<TimeSeriesPoint<double>> history;
    const auto                           origin = std::chrono::system_clock::now();

    stream.set_flush_callback(
        [&](const StreamBuffer<double>::Snapshot& snap)
        {
            if (snap.data->empty())
                return;
            std::lock_guard<std::mutex> lock(history_mutex);
            history.push_back({std::chrono::system_clock::now(), snap.data->back()});
        });

    SimulatedSource source;
    source.start(stream, std::chrono::milliseconds(2));

    for (int second = 1; second <= 3; ++second)
    {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto snap = stream.snapshot();
        std::cout << "t=" << second << "s window " << snap.data->size() << " rate "
                  << snap.data_rate << "/s flushes " << snap.flush_count << "\n";
    }

    source.stop();

    // Reduce the final window for a 100 pixel sparkline
    ReductionEngine<double> engine(Series<double>(stream.values()), sampling::MinMax{});
    auto                    sparkline = engine.optimized_data(std::nullopt, 100);
    std::cout << "sparkline: " << sparkline.size() << " of " << engine.original_count()
              << " values\n";

    std::lock_guard<std::mutex> lock(history_mutex);
    if (!history.empty())
    {
        std::cout << "last commit at " << history.back().seconds_since(origin) << "s, value "
                  << history.back().value << "\n";
    }

    return 0;
}
