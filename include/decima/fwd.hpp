#pragma once

#include <cstddef>

namespace decima
{

struct Point;
struct Rect;
struct IndexRange;

template <typename T>
class Series;

template <typename T>
class SpatialGrid;
class GridGeometry;

template <typename T>
class ReductionEngine;
struct RenderMetrics;

template <typename T>
class StreamBuffer;
class FlushTimer;
class UpdateFrequency;

class CommandQueue;
class SimulatedSource;

struct EngineConfig;
struct StreamConfig;
struct SpatialIndexConfig;

template <typename T>
struct TimeSeriesPoint;

}   // namespace decima
