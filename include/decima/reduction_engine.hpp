#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <decima/command_queue.hpp>
#include <decima/config.hpp>
#include <decima/geometry.hpp>
#include <decima/lod.hpp>
#include <decima/logger.hpp>
#include <decima/render_metrics.hpp>
#include <decima/sampling.hpp>
#include <decima/series.hpp>
#include <decima/spatial_grid.hpp>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace decima
{

// ─── Reduction Engine ───────────────────────────────────────────────────────
// Owns one raw series and the active sampling strategy, and serves reduced
// views of it:
//
//   decima::ReductionEngine<double> engine(std::move(series),
//                                          decima::sampling::LargestTriangleThreeBuckets{1000});
//   auto overview = engine.optimized_data(std::nullopt, 1000);
//   auto visible  = engine.data_for_viewport(t0, t1, 1920, accessor);
//
// Threading: every member function must be called from the owning thread.
// Background work (eager LOD precompute, spatial index construction) runs on
// worker threads and hands its results back through CommandQueues; they only
// become visible after the owner calls process_pending().

template <typename T>
class ReductionEngine
{
   public:
    using ValueAccessor = std::function<Point(const T&)>;

    static constexpr std::size_t DEFAULT_TARGET_POINTS = 1000;

    explicit ReductionEngine(EngineConfig config = {})
        : ReductionEngine(Series<T>{}, sampling::LargestTriangleThreeBuckets{}, std::move(config))
    {
    }

    ReductionEngine(Series<T>        data,
                    SamplingStrategy strategy = sampling::LargestTriangleThreeBuckets{},
                    EngineConfig     config   = {})
        : config_(validated(std::move(config))),
          ladder_(lod::normalized_ladder(config_.lod_levels)),
          data_(std::move(data)),
          strategy_(std::move(strategy)),
          precompute_queue_(config_.command_queue_capacity),
          index_queue_(config_.command_queue_capacity)
    {
        validate(strategy_);
        DECIMA_LOG_DEBUG("engine",
                         "Created engine with {} points, strategy {}, {}",
                         data_.size(),
                         strategy_name(strategy_),
                         describe(config_));
        maybe_start_precompute();
    }

    ~ReductionEngine() { stop_workers(); }

    ReductionEngine(const ReductionEngine&)            = delete;
    ReductionEngine& operator=(const ReductionEngine&) = delete;

    // ── Queries ──

    // Reduced view of `range` (whole series by default), never longer than
    // `target_points`.  Slices no larger than that are returned as is.
    // Otherwise the request is served at the ladder level chosen by
    // lod::serving_level(), or at `target_points` itself when every level is
    // larger.  Only whole-series levels are memoized; other ranges are
    // recomputed on each call.
    Series<T> optimized_data(std::optional<IndexRange> range         = std::nullopt,
                             std::size_t               target_points = DEFAULT_TARGET_POINTS)
    {
        require_target(target_points);
        const IndexRange r = range.value_or(IndexRange{0, data_.size()});
        if (r.first > r.last || r.last > data_.size())
        {
            throw std::out_of_range("optimized_data: range [" + std::to_string(r.first) + ", "
                                    + std::to_string(r.last) + ") outside series of size "
                                    + std::to_string(data_.size()));
        }

        QueryTimer timer(metrics_);

        if (data_.empty())
            return {};

        Series<T> slice = data_.slice(r);
        if (slice.size() <= target_points)
            return slice;

        const auto level = lod::serving_level(ladder_, target_points);
        if (!level || r.size() != data_.size())
            return reduce(slice, level.value_or(target_points), strategy_);

        if (auto it = cache_.find(*level); it != cache_.end())
            return it->second;

        DECIMA_LOG_DEBUG("engine", "LOD miss: level {} ({})", *level, strategy_name(strategy_));

        Series<T> reduced = reduce(slice, *level, strategy_);
        store(*level, reduced);
        return reduced;
    }

    // Elements whose accessor x lies in [min_x, max_x], reduced to at most
    // one point per pixel (or `target_points`).  Never cached.
    Series<T> data_for_viewport(double                     min_x,
                                double                     max_x,
                                double                     pixel_width,
                                const ValueAccessor&       accessor,
                                std::optional<std::size_t> target_points = std::nullopt)
    {
        if (!accessor)
            throw std::invalid_argument("data_for_viewport: value accessor is empty");
        if (!target_points && (!std::isfinite(pixel_width) || pixel_width < 0.0))
            throw std::invalid_argument("data_for_viewport: pixel width must be finite and >= 0");

        std::size_t target = 0;
        if (target_points)
            target = *target_points;
        else
        {
            // Widths beyond the series length reduce nothing; capping keeps
            // the conversion in range.
            const double cap = static_cast<double>(std::max<std::size_t>(data_.size(), 2));
            target           = static_cast<std::size_t>(std::min(pixel_width, cap));
        }
        require_target(target);

        QueryTimer timer(metrics_);

        std::vector<T> visible;
        for (const T& element : data_)
        {
            const Point p = accessor(element);
            if (p.x >= min_x && p.x <= max_x)
                visible.push_back(element);
        }

        Series<T> filtered(std::move(visible));
        if (filtered.size() <= target)
            return filtered;
        return reduce(filtered, target, strategy_);
    }

    // ── Data and strategy ──

    // Replaces the raw series.  Drops every cached level and the spatial
    // index; results still in flight for the old series are discarded.
    void set_data(Series<T> data)
    {
        data_ = std::move(data);
        invalidate_index();
        invalidate_cache();
        DECIMA_LOG_DEBUG("engine", "Data replaced: {} points", data_.size());
        maybe_start_precompute();
    }

    const Series<T>& data() const { return data_; }
    std::size_t      original_count() const { return data_.size(); }

    void set_sampling_strategy(SamplingStrategy strategy)
    {
        validate(strategy);
        strategy_ = std::move(strategy);
        invalidate_cache();
        DECIMA_LOG_DEBUG("engine", "Sampling strategy set to {}", strategy_name(strategy_));
        maybe_start_precompute();
    }

    const SamplingStrategy& sampling_strategy() const { return strategy_; }

    // ── Spatial index ──

    // Builds a SpatialGrid over the full raw series on a worker thread.
    // Until it is published (see process_pending), points_near() reports
    // std::nullopt.  A new build or set_data() supersedes a running one.
    void build_spatial_index(ValueAccessor accessor, const Rect& bounds)
    {
        if (!accessor)
            throw std::invalid_argument("build_spatial_index: value accessor is empty");
        // Bad bounds throw here, on the caller's thread.
        GridGeometry check(bounds, config_.spatial.grid_size);
        (void)check;

        invalidate_index();
        // One producer per queue: the superseded build must be gone first.
        index_worker_  = std::jthread{};
        index_pending_ = true;

        const std::uint64_t generation = index_generation_;
        const std::size_t   grid_size  = config_.spatial.grid_size;

        index_worker_ = std::jthread(
            [this, data = data_, accessor = std::move(accessor), bounds, grid_size, generation](
                std::stop_token stop)
            {
                auto grid = std::make_shared<SpatialGrid<T>>(bounds, grid_size);
                grid->reserve(data.size());
                try
                {
                    for (std::size_t i = 0; i < data.size(); ++i)
                    {
                        if ((i & 0xFFFF) == 0 && stop.stop_requested())
                            return;
                        grid->insert(data[i], accessor(data[i]));
                    }
                }
                catch (const std::exception& e)
                {
                    DECIMA_LOG_ERROR("engine", "Spatial index build failed: {}", e.what());
                    grid.reset();
                }
                catch (...)
                {
                    DECIMA_LOG_ERROR("engine", "Spatial index build failed: unknown exception");
                    grid.reset();
                }

                post(index_queue_,
                     stop,
                     [this, generation, grid = std::shared_ptr<const SpatialGrid<T>>(grid)]
                     { publish_index(generation, grid); });
            });
    }

    bool spatial_index_ready() const { return index_ != nullptr; }
    bool spatial_index_pending() const { return index_pending_; }

    // Published index, or nullptr while none is available.
    std::shared_ptr<const SpatialGrid<T>> spatial_index() const { return index_; }

    // Elements within `radius` of `center`; std::nullopt while the index is
    // not yet available.
    std::optional<std::vector<T>> points_near(const Point& center, double radius) const
    {
        if (!index_)
            return std::nullopt;
        return index_->query(center, radius);
    }

    // ── Background results ──

    // Applies every result posted by the workers.  Returns how many were applied.
    std::size_t process_pending() { return precompute_queue_.drain() + index_queue_.drain(); }

    bool precompute_in_flight() const { return precompute_in_flight_; }

    // ── Introspection ──

    // Ladder level a whole-series request for `target_points` is served
    // at; std::nullopt when every level is larger.
    std::optional<std::size_t> resolve_level(std::size_t target_points) const
    {
        return lod::serving_level(ladder_, target_points);
    }

    const std::vector<std::size_t>& lod_ladder() const { return ladder_; }

    // Ladder levels currently cached, ascending.
    std::vector<std::size_t> cached_levels() const
    {
        std::vector<std::size_t> levels;
        levels.reserve(cache_.size());
        for (const auto& entry : cache_)
            levels.push_back(entry.first);
        return levels;
    }

    bool has_cached_level(std::size_t level) const { return cache_.contains(level); }

    std::size_t cache_entry_count() const { return cache_.size(); }

    const RenderMetrics& metrics() const { return metrics_; }
    const EngineConfig&  config() const { return config_; }

    // Drops data, cache, spatial index and metrics.
    void reset()
    {
        stop_workers();
        data_ = Series<T>{};
        invalidate_index();
        invalidate_cache();
        metrics_.reset();
    }

   private:
    static EngineConfig validated(EngineConfig config)
    {
        config.validate();
        return config;
    }

    static void require_target(std::size_t target_points)
    {
        if (target_points < 2)
        {
            throw std::invalid_argument("target point count must be at least 2, got "
                                        + std::to_string(target_points));
        }
    }

    static std::size_t payload_bytes(const Series<T>& series) { return series.size() * sizeof(T); }

    void store(std::size_t level, const Series<T>& reduced)
    {
        auto [it, inserted] = cache_.emplace(level, reduced);
        if (inserted)
            metrics_.memory_usage_bytes += payload_bytes(reduced);
    }

    void invalidate_cache()
    {
        ++generation_;
        cache_.clear();
        metrics_.memory_usage_bytes = 0;
        precompute_in_flight_       = false;
        precompute_worker_.request_stop();
    }

    void invalidate_index()
    {
        ++index_generation_;
        index_.reset();
        index_pending_ = false;
        index_worker_.request_stop();
    }

    void stop_workers()
    {
        // Assigning an empty jthread requests stop on the old one and joins it.
        precompute_worker_    = std::jthread{};
        index_worker_         = std::jthread{};
        precompute_in_flight_ = false;
        index_pending_        = false;
    }

    void maybe_start_precompute()
    {
        if (!config_.eager_precompute || data_.size() <= config_.eager_threshold)
            return;

        std::vector<std::size_t> levels;
        for (std::size_t level : ladder_)
        {
            if (level < data_.size())
                levels.push_back(level);
        }
        if (levels.empty())
            return;

        // One producer per queue: the superseded worker must be gone first.
        precompute_worker_ = std::jthread{};

        const std::uint64_t generation = generation_;
        precompute_in_flight_          = true;

        DECIMA_LOG_INFO("engine",
                        "Precomputing {} LOD levels for {} points ({})",
                        levels.size(),
                        data_.size(),
                        strategy_name(strategy_));

        precompute_worker_ = std::jthread(
            [this, data = data_, strategy = strategy_, levels = std::move(levels), generation](
                std::stop_token stop)
            {
                try
                {
                    for (std::size_t level : levels)
                    {
                        if (stop.stop_requested())
                            return;
                        Series<T> reduced = reduce(data, level, strategy);
                        post(precompute_queue_,
                             stop,
                             [this, generation, level, reduced = std::move(reduced)]
                             { publish_level(generation, level, reduced); });
                    }
                }
                catch (const std::exception& e)
                {
                    DECIMA_LOG_ERROR("engine", "LOD precompute failed: {}", e.what());
                }
                post(precompute_queue_,
                     stop,
                     [this, generation]
                     {
                         if (generation == generation_)
                             precompute_in_flight_ = false;
                     });
            });
    }

    // Worker side: keep offering the command until the owner makes room or
    // the worker is told to stop.  A stopped worker posts nothing.
    static void post(CommandQueue&                queue,
                     const std::stop_token&       stop,
                     const CommandQueue::Command& cmd)
    {
        if (stop.stop_requested())
            return;
        while (!queue.push(cmd))
        {
            if (stop.stop_requested())
            {
                DECIMA_LOG_WARN("engine",
                                "Dropping background result: worker stopped while queue full");
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    // Owner side.
    void publish_level(std::uint64_t generation, std::size_t level, const Series<T>& reduced)
    {
        if (generation != generation_)
        {
            DECIMA_LOG_DEBUG("engine", "Discarding stale LOD level {}", level);
            return;
        }
        store(level, reduced);
    }

    void publish_index(std::uint64_t generation, std::shared_ptr<const SpatialGrid<T>> grid)
    {
        if (generation != index_generation_)
        {
            DECIMA_LOG_DEBUG("engine", "Discarding stale spatial index");
            return;
        }
        index_pending_ = false;
        index_         = std::move(grid);
        if (index_)
            DECIMA_LOG_DEBUG("engine", "Spatial index ready: {} points", index_->size());
    }

    EngineConfig             config_;
    std::vector<std::size_t> ladder_;
    Series<T>                data_;
    SamplingStrategy         strategy_;
    RenderMetrics            metrics_;

    std::map<std::size_t, Series<T>> cache_;   // whole-series level -> reduction
    std::uint64_t                    generation_           = 0;
    bool                             precompute_in_flight_ = false;

    std::shared_ptr<const SpatialGrid<T>> index_;
    std::uint64_t                         index_generation_ = 0;
    bool                                  index_pending_    = false;

    CommandQueue precompute_queue_;
    CommandQueue index_queue_;

    // Declared last: destroyed (stopped and joined) before the queues they post to.
    std::jthread precompute_worker_;
    std::jthread index_worker_;
};

}   // namespace decima
