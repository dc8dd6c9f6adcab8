#pragma once

// Standard library
#include <cstddef>
#include <cstdint>
#include <vector>

// Project
#include "geofence_raster/containment.hpp"
#include "geofence_raster/geometry.hpp"
#include "geofence_raster/sample_grid.hpp"

namespace geofence_raster
{

// Row-major, row 0 north, col 0 west.
struct Mask {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> cells;

  std::uint8_t at(int row, int col) const
  {
    return cells[static_cast<std::size_t>(row) * width + col];
  }

  std::size_t count_inside() const;
};

// Throws GeometryError if there is no polygonal part.
MultiPolygon ensure_polygonal(const Geometry& geometry);

Mask rasterize(
  const MultiPolygon& polygons, const SampleGrid& grid, const ContainmentStrategy& strategy);

void invert(Mask& mask);

}  // namespace geofence_raster
