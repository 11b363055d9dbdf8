#include <algorithm>
#include <cmath>
#include <cstdint>
#include <decima/sampling.hpp>
#include <numeric>
#include <stdexcept>
#include <type_traits>

namespace decima
{

namespace
{

std::vector<std::size_t> all_indices(std::size_t count)
{
    std::vector<std::size_t> out(count);
    std::iota(out.begin(), out.end(), std::size_t{0});
    return out;
}

// floor(a * b / c) in integer arithmetic; a < c and b is a series length.
std::size_t scaled(std::size_t a, std::size_t b, std::size_t c)
{
    return static_cast<std::size_t>(static_cast<std::uint64_t>(a) * b / c);
}

}   // namespace

std::string strategy_name(const SamplingStrategy& strategy)
{
    return std::visit(
        [](const auto& s) -> std::string
        {
            using S = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<S, sampling::None>)
                return "none";
            else if constexpr (std::is_same_v<S, sampling::Uniform>)
                return "uniform";
            else if constexpr (std::is_same_v<S, sampling::LargestTriangleThreeBuckets>)
                return "lttb(" + std::to_string(s.buckets) + ")";
            else if constexpr (std::is_same_v<S, sampling::MinMax>)
                return "minmax";
            else
                return "adaptive(" + std::to_string(s.threshold) + ")";
        },
        strategy);
}

void validate(const SamplingStrategy& strategy)
{
    if (const auto* lttb = std::get_if<sampling::LargestTriangleThreeBuckets>(&strategy))
    {
        if (lttb->buckets < 2)
            throw std::invalid_argument("LTTB requires at least 2 buckets, got "
                                        + std::to_string(lttb->buckets));
    }
    else if (const auto* adaptive = std::get_if<sampling::Adaptive>(&strategy))
    {
        if (!std::isfinite(adaptive->threshold))
            throw std::invalid_argument("Adaptive sampling threshold must be finite");
    }
}

namespace sampling
{

std::vector<std::size_t> uniform_indices(std::size_t count, std::size_t target_count)
{
    if (count <= target_count)
        return all_indices(count);

    std::vector<std::size_t> out;
    out.reserve(target_count);
    for (std::size_t i = 0; i < target_count; ++i)
        out.push_back(scaled(i, count, target_count));

    // Anchor the tail even if the stride already picked a nearby index.
    out.back() = count - 1;
    return out;
}

std::vector<std::size_t> lttb_midpoint_indices(std::size_t count, std::size_t buckets)
{
    if (count <= buckets)
        return all_indices(count);

    std::vector<std::size_t> out;
    out.reserve(buckets);

    // Always keep the first point
    out.push_back(0);

    for (std::size_t bucket = 1; bucket + 1 < buckets; ++bucket)
    {
        const std::size_t range_start = scaled(bucket, count, buckets);
        const std::size_t range_end   = std::min(scaled(bucket + 1, count, buckets), count);
        out.push_back((range_start + range_end) / 2);
    }

    // Always keep the last point
    out.push_back(count - 1);
    return out;
}

std::vector<std::size_t> min_max_midpoint_indices(std::size_t count, std::size_t target_count)
{
    if (count <= target_count)
        return all_indices(count);

    std::vector<std::size_t> out;
    out.reserve(target_count);
    out.push_back(0);

    if (target_count > 2)
    {
        // Widen buckets for tiny targets so interior picks never exceed target - 2.
        const std::size_t interior = target_count - 2;
        const std::size_t width =
            std::max(count / (target_count / 2), (count + interior - 1) / interior);

        for (std::size_t i = 0; i < count;)
        {
            const std::size_t bucket_end = std::min(i + width, count);
            out.push_back((i + bucket_end) / 2);
            i = bucket_end;
        }
    }

    out.push_back(count - 1);
    return out;
}

std::optional<std::vector<std::size_t>> select_indices(std::size_t             count,
                                                       std::size_t             target_count,
                                                       const SamplingStrategy& strategy)
{
    if (target_count < 2)
        throw std::invalid_argument("target point count must be at least 2, got "
                                    + std::to_string(target_count));
    validate(strategy);

    if (std::holds_alternative<None>(strategy) || count <= target_count)
        return std::nullopt;

    return std::visit(
        [&](const auto& s) -> std::optional<std::vector<std::size_t>>
        {
            using S = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<S, None>)
                return std::nullopt;
            else if constexpr (std::is_same_v<S, Uniform>)
                return uniform_indices(count, target_count);
            else if constexpr (std::is_same_v<S, LargestTriangleThreeBuckets>)
                return lttb_midpoint_indices(count, std::min(s.buckets, target_count));
            else if constexpr (std::is_same_v<S, MinMax>)
                return min_max_midpoint_indices(count, target_count);
            else
                return uniform_indices(count, target_count);   // Adaptive: uniform fallback
        },
        strategy);
}

}   // namespace sampling

}   // namespace decima
