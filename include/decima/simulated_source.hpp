#pragma once

#include <chrono>
#include <cstdint>
#include <decima/stream_buffer.hpp>
#include <random>
#include <stop_token>
#include <thread>

namespace decima
{

// Mean-reverting random walk that can feed a StreamBuffer on its own thread.
// Handy for demos and soak tests of the ingest path.
class SimulatedSource
{
   public:
    struct Params
    {
        double initial   = 50.0;
        double mean      = 50.0;
        double min       = 0.0;
        double max       = 100.0;
        double noise     = 2.0;    // uniform step in [-noise, noise]
        double reversion = 0.05;   // pull toward `mean` per step
    };

    explicit SimulatedSource(std::uint32_t seed = std::random_device{}());
    SimulatedSource(std::uint32_t seed, Params params);
    ~SimulatedSource() { stop(); }

    SimulatedSource(const SimulatedSource&)            = delete;
    SimulatedSource& operator=(const SimulatedSource&) = delete;

    // Advances the walk one step.  Not thread-safe; while running, only the
    // producer thread calls it.
    double next();
    double value() const { return value_; }

    // Starts `stream` and pushes one value every `interval` until stop().
    // Throws std::invalid_argument for a non-positive interval.
    void start(StreamBuffer<double>& stream,
               std::chrono::milliseconds interval = std::chrono::milliseconds(50));

    // Stops the producer thread and the stream it was feeding.  Idempotent.
    void stop();

    bool running() const { return producer_.joinable(); }

   private:
    Params                                 params_;
    std::mt19937                           rng_;
    std::uniform_real_distribution<double> step_;
    double                                 value_;

    StreamBuffer<double>* stream_ = nullptr;
    std::jthread          producer_;
};

}   // namespace decima
