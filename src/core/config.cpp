#include <algorithm>
#include <cmath>
#include <decima/config.hpp>
#include <sstream>
#include <stdexcept>

namespace decima
{

UpdateFrequency UpdateFrequency::custom(double fps)
{
    if (!std::isfinite(fps) || fps <= 0.0)
        throw std::invalid_argument("update frequency must be positive and finite, got "
                                    + std::to_string(fps));

    // The interval has to be representable as a positive count of nanoseconds.
    const double seconds = 1.0 / fps;
    const double longest = std::chrono::duration<double>(std::chrono::nanoseconds::max()).count();
    if (seconds < 1e-9 || seconds >= longest)
        throw std::invalid_argument("update frequency out of range, got " + std::to_string(fps));
    return UpdateFrequency(fps);
}

std::array<UpdateFrequency, 4> UpdateFrequency::presets()
{
    return {fps15(), fps30(), fps60(), fps120()};
}

std::chrono::nanoseconds UpdateFrequency::interval() const
{
    return std::chrono::round<std::chrono::nanoseconds>(std::chrono::duration<double>(1.0 / fps_));
}

bool UpdateFrequency::is_preset() const
{
    const auto all = presets();
    return std::find(all.begin(), all.end(), *this) != all.end();
}

void StreamConfig::validate() const
{
    if (window_size == 0)
        throw std::invalid_argument("stream window size must be positive");
    if (!std::isfinite(update_frequency.fps()) || update_frequency.fps() <= 0.0)
        throw std::invalid_argument("stream update frequency must be positive and finite");
}

void SpatialIndexConfig::validate() const
{
    if (grid_size == 0)
        throw std::invalid_argument("spatial index grid size must be positive");
}

void EngineConfig::validate() const
{
    if (lod_levels.empty())
        throw std::invalid_argument("LOD ladder must contain at least one level");
    for (std::size_t level : lod_levels)
    {
        if (level < 2)
            throw std::invalid_argument("LOD level must be at least 2 points, got "
                                        + std::to_string(level));
    }
    if (command_queue_capacity < 2)
        throw std::invalid_argument("command queue capacity must be at least 2");
    spatial.validate();
}

std::string describe(const StreamConfig& config)
{
    std::ostringstream ss;
    ss << "window=" << config.window_size << " fps=" << config.update_frequency.fps();
    return ss.str();
}

std::string describe(const EngineConfig& config)
{
    std::ostringstream ss;
    ss << "levels=[";
    for (std::size_t i = 0; i < config.lod_levels.size(); ++i)
        ss << (i ? "," : "") << config.lod_levels[i];
    ss << "] eager_threshold=" << config.eager_threshold
       << " eager=" << (config.eager_precompute ? "on" : "off")
       << " grid=" << config.spatial.grid_size;
    return ss.str();
}

}   // namespace decima
