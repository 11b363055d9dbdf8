#pragma once

#include <cstddef>
#include <decima/series.hpp>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace decima
{

namespace sampling
{

/// Identity: the input is returned unchanged regardless of size.
struct None
{
    bool operator==(const None&) const = default;
};

/// Fixed-stride selection of exactly `target_count` elements.
struct Uniform
{
    bool operator==(const Uniform&) const = default;
};

/// Bucketed selection keeping first/last verbatim and one representative per
/// interior bucket.  The representative is the bucket's midpoint index, not the
/// area-maximizing point of textbook LTTB.
struct LargestTriangleThreeBuckets
{
    std::size_t buckets = 1000;

    bool operator==(const LargestTriangleThreeBuckets&) const = default;
};

/// Walks the series in buckets of `n / (target/2)` elements and emits each
/// bucket's midpoint index between the two anchors.
struct MinMax
{
    bool operator==(const MinMax&) const = default;
};

/// Variance-driven density.  Currently falls back to Uniform; `threshold` is
/// accepted and ignored.
struct Adaptive
{
    double threshold = 0.0;

    bool operator==(const Adaptive&) const = default;
};

}   // namespace sampling

using SamplingStrategy = std::variant<sampling::None,
                                      sampling::Uniform,
                                      sampling::LargestTriangleThreeBuckets,
                                      sampling::MinMax,
                                      sampling::Adaptive>;

std::string strategy_name(const SamplingStrategy& strategy);

// Throws std::invalid_argument for LTTB buckets < 2 or a non-finite Adaptive threshold.
void validate(const SamplingStrategy& strategy);

namespace sampling
{

// Index selectors.  Each returns strictly the indices to keep, in ascending
// order.  When `count <= target` they return every index.

[[nodiscard]] std::vector<std::size_t> uniform_indices(std::size_t count, std::size_t target_count);

[[nodiscard]] std::vector<std::size_t> lttb_midpoint_indices(std::size_t count,
                                                             std::size_t buckets);

[[nodiscard]] std::vector<std::size_t> min_max_midpoint_indices(std::size_t count,
                                                                std::size_t target_count);

/// Resolves `strategy` against a series of `count` elements.
/// Returns std::nullopt when the series passes through unchanged (None, or
/// `count <= target_count`).  Throws std::invalid_argument when
/// `target_count < 2` or the strategy is invalid.
[[nodiscard]] std::optional<std::vector<std::size_t>> select_indices(
    std::size_t count,
    std::size_t target_count,
    const SamplingStrategy& strategy);

}   // namespace sampling

/// Reduces `values` to a representative subset of at most `target_count`
/// elements (Uniform yields exactly `target_count`).
template <typename T>
[[nodiscard]] std::vector<T> reduce(std::span<const T>      values,
                                    std::size_t             target_count,
                                    const SamplingStrategy& strategy)
{
    auto indices = sampling::select_indices(values.size(), target_count, strategy);
    if (!indices)
        return {values.begin(), values.end()};

    std::vector<T> out;
    out.reserve(indices->size());
    for (std::size_t i : *indices)
        out.push_back(values[i]);
    return out;
}

template <typename T>
[[nodiscard]] std::vector<T> reduce(const std::vector<T>&   values,
                                    std::size_t             target_count,
                                    const SamplingStrategy& strategy)
{
    return reduce(std::span<const T>(values), target_count, strategy);
}

// Series overload: pass-through results share storage with the input.
template <typename T>
[[nodiscard]] Series<T> reduce(const Series<T>&        series,
                               std::size_t             target_count,
                               const SamplingStrategy& strategy)
{
    auto indices = sampling::select_indices(series.size(), target_count, strategy);
    if (!indices)
        return series;

    std::vector<T> out;
    out.reserve(indices->size());
    for (std::size_t i : *indices)
        out.push_back(series[i]);
    return Series<T>(std::move(out));
}

}   // namespace decima
