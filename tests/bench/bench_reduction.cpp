#include <benchmark/benchmark.h>
#include <cmath>
#include <cstdint>
#include <vector>

#include <decima/reduction_engine.hpp>
#include <decima/sampling.hpp>
#include <decima/stream_buffer.hpp>

// --- Helpers ---

static decima::Series<double> make_sine(std::size_t n)
{
    std::vector<double> y(n);
    for (std::size_t i = 0; i < n; ++i)
        y[i] = std::sin(static_cast<double>(i) * 0.001) * 100.0;
    return decima::Series<double>(std::move(y));
}

static decima::EngineConfig lazy_config()
{
    decima::EngineConfig c;
    c.eager_precompute = false;
    return c;
}

// --- Strategy benchmarks ---

static void BM_Uniform_1M_to_1000(benchmark::State& state)
{
    auto data = make_sine(1'000'000);
    for (auto _ : state)
    {
        auto result = decima::reduce(data, 1000, decima::sampling::Uniform{});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * 1'000'000);
}
BENCHMARK(BM_Uniform_1M_to_1000);

static void BM_LTTB_1M_to_1000(benchmark::State& state)
{
    auto data = make_sine(1'000'000);
    for (auto _ : state)
    {
        auto result = decima::reduce(data, 1000, decima::sampling::LargestTriangleThreeBuckets{});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * 1'000'000);
}
BENCHMARK(BM_LTTB_1M_to_1000);

static void BM_MinMax_Varying(benchmark::State& state)
{
    const auto n    = static_cast<std::size_t>(state.range(0));
    auto       data = make_sine(n);
    for (auto _ : state)
    {
        auto result = decima::reduce(data, 2000, decima::sampling::MinMax{});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_MinMax_Varying)->Arg(10'000)->Arg(100'000)->Arg(1'000'000)->Arg(10'000'000);

// --- Engine benchmarks ---

static void BM_Engine_CacheMiss(benchmark::State& state)
{
    auto data = make_sine(1'000'000);
    decima::ReductionEngine<double> engine(data, decima::sampling::Uniform{}, lazy_config());
    for (auto _ : state)
    {
        // Re-installing the strategy drops the cache, so every query recomputes.
        engine.set_sampling_strategy(decima::sampling::Uniform{});
        auto result = engine.optimized_data(std::nullopt, 1000);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * 1'000'000);
}
BENCHMARK(BM_Engine_CacheMiss);

static void BM_Engine_CacheHit(benchmark::State& state)
{
    decima::ReductionEngine<double> engine(make_sine(1'000'000),
                                           decima::sampling::Uniform{},
                                           lazy_config());
    engine.optimized_data(std::nullopt, 1000);
    for (auto _ : state)
    {
        auto result = engine.optimized_data(std::nullopt, 1000);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Engine_CacheHit);

// --- Stream benchmarks ---

static void BM_Stream_PushFlush(benchmark::State& state)
{
    const auto batch = static_cast<std::size_t>(state.range(0));
    decima::StreamConfig config;
    config.window_size = 10'000;
    decima::StreamBuffer<double> stream(config);
    for (auto _ : state)
    {
        for (std::size_t i = 0; i < batch; ++i)
            stream.push(static_cast<double>(i));
        stream.flush();
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(batch));
}
BENCHMARK(BM_Stream_PushFlush)->Arg(10)->Arg(1000)->Arg(100'000);
