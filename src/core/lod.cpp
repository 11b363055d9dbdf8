#include <algorithm>
#include <decima/lod.hpp>
#include <iterator>
#include <stdexcept>

namespace decima::lod
{

std::vector<std::size_t> normalized_ladder(std::vector<std::size_t> levels)
{
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());
    return levels;
}

std::size_t resolve_level(std::span<const std::size_t> levels, std::size_t target_points)
{
    if (levels.empty())
        throw std::invalid_argument("cannot resolve a detail level from an empty ladder");

    auto distance = [target_points](std::size_t level)
    { return level > target_points ? level - target_points : target_points - level; };

    std::size_t best = levels.front();
    for (std::size_t level : levels)
    {
        if (distance(level) < distance(best))
            best = level;
    }
    return best;
}

std::optional<std::size_t> serving_level(std::span<const std::size_t> levels,
                                         std::size_t                  target_points)
{
    const std::size_t nearest = resolve_level(levels, target_points);
    if (nearest <= target_points)
        return nearest;

    auto above = std::upper_bound(levels.begin(), levels.end(), target_points);
    if (above == levels.begin())
        return std::nullopt;
    return *std::prev(above);
}

}   // namespace decima::lod
