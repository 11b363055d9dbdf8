#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace decima::lod
{

// Sorted, de-duplicated copy of a detail-level ladder.
[[nodiscard]] std::vector<std::size_t> normalized_ladder(std::vector<std::size_t> levels);

// Ladder level closest to `target_points`; ties resolve to the smaller level.
// `levels` must be sorted ascending.  Throws std::invalid_argument when empty.
[[nodiscard]] std::size_t resolve_level(std::span<const std::size_t> levels,
                                        std::size_t                  target_points);

// Level a request for `target_points` is served at: the closest level, or
// the largest level not above `target_points` when the closest one exceeds
// it.  std::nullopt when every level exceeds `target_points`.
[[nodiscard]] std::optional<std::size_t> serving_level(std::span<const std::size_t> levels,
                                                       std::size_t target_points);

}   // namespace decima::lod
