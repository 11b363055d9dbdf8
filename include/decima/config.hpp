#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace decima
{

// ─── Update Frequency ───────────────────────────────────────────────────────
// Flush cadence of a StreamBuffer: one of the display-rate presets or any
// positive, finite custom rate.

class UpdateFrequency
{
   public:
    static UpdateFrequency fps15() { return UpdateFrequency(15.0); }
    static UpdateFrequency fps30() { return UpdateFrequency(30.0); }
    static UpdateFrequency fps60() { return UpdateFrequency(60.0); }
    static UpdateFrequency fps120() { return UpdateFrequency(120.0); }

    // Throws std::invalid_argument unless fps is positive and finite.
    static UpdateFrequency custom(double fps);

    static std::array<UpdateFrequency, 4> presets();

    double                   fps() const { return fps_; }
    std::chrono::nanoseconds interval() const;
    bool                     is_preset() const;

    bool operator==(const UpdateFrequency&) const = default;

   private:
    explicit UpdateFrequency(double fps) : fps_(fps) {}

    double fps_;
};

// ─── Component Configuration ────────────────────────────────────────────────
// Each core component takes its configuration explicitly at construction.
// validate() throws std::invalid_argument describing the first bad field.

struct StreamConfig
{
    std::size_t     window_size      = 100;
    UpdateFrequency update_frequency = UpdateFrequency::fps30();

    void validate() const;
};

struct SpatialIndexConfig
{
    static constexpr std::size_t DEFAULT_GRID_SIZE = 100;

    std::size_t grid_size = DEFAULT_GRID_SIZE;

    void validate() const;
};

struct EngineConfig
{
    static constexpr std::size_t DEFAULT_EAGER_THRESHOLD = 10'000;

    static std::vector<std::size_t> default_lod_levels() { return {100, 500, 1000, 5000, 10000}; }

    // Detail-level ladder used as LOD cache keys.
    std::vector<std::size_t> lod_levels = default_lod_levels();

    // Series strictly larger than this get every ladder level precomputed
    // in the background.
    std::size_t eager_threshold  = DEFAULT_EAGER_THRESHOLD;
    bool        eager_precompute = true;

    // Capacity of each worker -> owner result queue.
    std::size_t command_queue_capacity = 64;

    SpatialIndexConfig spatial;

    void validate() const;
};

std::string describe(const StreamConfig& config);
std::string describe(const EngineConfig& config);

}   // namespace decima
