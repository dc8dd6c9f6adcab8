#pragma once

// Standard library
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Project
#include "geofence_raster/geometry.hpp"
#include "geofence_raster/sample_grid.hpp"

namespace geofence_raster
{

// Inside means interior of some polygon. Points on an edge or vertex are
// outside. Bulk and prepared classification give identical results.

struct Edge {
  Point a;
  Point b;
  std::size_t polygon;
};

std::vector<Edge> collect_edges(const MultiPolygon& polygons);

inline bool on_edge(const Edge& e, double x, double y)
{
  if (x < std::min(e.a.x, e.b.x) || x > std::max(e.a.x, e.b.x) ||
    y < std::min(e.a.y, e.b.y) || y > std::max(e.a.y, e.b.y))
  {
    return false;
  }
  return (e.b.x - e.a.x) * (y - e.a.y) - (e.b.y - e.a.y) * (x - e.a.x) == 0.0;
}

// Half-open, so a vertex on the scanline is counted once.
inline bool spans(const Edge& e, double y)
{
  return (e.a.y > y) != (e.b.y > y);
}

inline double crossing_x(const Edge& e, double y)
{
  return (e.b.x - e.a.x) * (y - e.a.y) / (e.b.y - e.a.y) + e.a.x;
}

inline int winding_direction(const Edge& e)
{
  return e.b.y > e.a.y ? 1 : -1;
}

// Consecutive points with the same y share one scanline.
void contains_xy(
  const MultiPolygon& polygons, const std::vector<double>& x, const std::vector<double>& y,
  std::vector<std::uint8_t>& out);

class PreparedPolygon
{
public:
  explicit PreparedPolygon(const MultiPolygon& polygons);

  bool contains(double x, double y) const;

private:
  std::size_t band_index(double y) const;

  std::vector<Edge> edges_;
  // Edge indices per band, sorted by polygon so each polygon is one run.
  std::vector<std::vector<std::size_t>> bands_;
  Bounds bounds_;
  double band_height_;
};

enum class ContainmentMode
{
  Auto,
  Bulk,
  Prepared
};

ContainmentMode parse_containment_mode(const std::string& name);
const char* to_string(ContainmentMode mode);

// Bulk materializes the cross-product of the sample axes.
struct ContainmentCapabilities {
  std::size_t max_bulk_points = std::size_t{1} << 24;
};

using ClassifyFn = void (*)(
  const MultiPolygon& polygons, const SampleGrid& grid, std::vector<std::uint8_t>& cells);

struct ContainmentStrategy {
  const char* name;
  ClassifyFn classify;
};

void classify_bulk(
  const MultiPolygon& polygons, const SampleGrid& grid, std::vector<std::uint8_t>& cells);
void classify_prepared(
  const MultiPolygon& polygons, const SampleGrid& grid, std::vector<std::uint8_t>& cells);

ContainmentStrategy select_strategy(
  ContainmentMode mode, std::size_t point_count, const ContainmentCapabilities& capabilities);

}  // namespace geofence_raster
