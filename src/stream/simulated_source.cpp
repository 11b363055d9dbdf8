#include <algorithm>
#include <condition_variable>
#include <decima/logger.hpp>
#include <decima/simulated_source.hpp>
#include <mutex>
#include <stdexcept>

namespace decima
{

namespace
{

SimulatedSource::Params checked(const SimulatedSource::Params& params)
{
    if (!(params.min <= params.max))
        throw std::invalid_argument("simulated source range is empty");
    if (!(params.noise >= 0.0))
        throw std::invalid_argument("simulated source noise must be non-negative");
    return params;
}

}   // namespace

SimulatedSource::SimulatedSource(std::uint32_t seed) : SimulatedSource(seed, Params{}) {}

SimulatedSource::SimulatedSource(std::uint32_t seed, Params params)
    : params_(checked(params)),
      rng_(seed),
      step_(-params_.noise, params_.noise),
      value_(std::clamp(params_.initial, params_.min, params_.max))
{
}

double SimulatedSource::next()
{
    const double noise          = step_(rng_);
    const double mean_reversion = (params_.mean - value_) * params_.reversion;
    value_                      = std::clamp(value_ + noise + mean_reversion, params_.min, params_.max);
    return value_;
}

void SimulatedSource::start(StreamBuffer<double>& stream, std::chrono::milliseconds interval)
{
    if (interval.count() <= 0)
        throw std::invalid_argument("simulated source interval must be positive");
    if (running())
        return;

    stream_ = &stream;
    stream.start();
    producer_ = std::jthread(
        [this, &stream, interval](std::stop_token stop)
        {
            std::mutex                  mutex;
            std::condition_variable_any wake;
            auto                        next_tick = std::chrono::steady_clock::now();
            while (!stop.stop_requested())
            {
                stream.push(next());
                next_tick += interval;
                std::unique_lock<std::mutex> lock(mutex);
                wake.wait_until(lock, stop, next_tick, [] { return false; });
            }
        });
    DECIMA_LOG_INFO("source",
                    "Simulated source started ({} ms interval)",
                    static_cast<long long>(interval.count()));
}

void SimulatedSource::stop()
{
    if (!running())
        return;
    producer_ = std::jthread{};
    if (stream_)
        stream_->stop();
    stream_ = nullptr;
    DECIMA_LOG_INFO("source", "Simulated source stopped");
}

}   // namespace decima
