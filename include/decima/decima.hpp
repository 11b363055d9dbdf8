#pragma once

#include <decima/command_queue.hpp>
#include <decima/config.hpp>
#include <decima/flush_timer.hpp>
#include <decima/fwd.hpp>
#include <decima/geometry.hpp>
#include <decima/lod.hpp>
#include <decima/logger.hpp>
#include <decima/reduction_engine.hpp>
#include <decima/render_metrics.hpp>
#include <decima/sampling.hpp>
#include <decima/series.hpp>
#include <decima/simulated_source.hpp>
#include <decima/spatial_grid.hpp>
#include <decima/stream_buffer.hpp>
#include <decima/time_series.hpp>
