#include "geofence_raster/rasterizer.hpp"

#include <algorithm>
#include <string>

#include "geofence_raster/errors.hpp"

namespace geofence_raster
{

std::size_t Mask::count_inside() const
{
  return static_cast<std::size_t>(std::count(cells.begin(), cells.end(), std::uint8_t{1}));
}

MultiPolygon ensure_polygonal(const Geometry& geometry)
{
  if (geometry.polygons.empty()) {
    throw GeometryError(
            std::string("No polygonal geometry found in ") + to_string(geometry.type) +
            " (" + std::to_string(geometry.lines.size()) + " line(s), " +
            std::to_string(geometry.points.size()) + " point(s))");
  }
  return geometry.polygons;
}

Mask rasterize(
  const MultiPolygon& polygons, const SampleGrid& grid, const ContainmentStrategy& strategy)
{
  Mask mask;
  mask.width = grid.width();
  mask.height = grid.height();
  strategy.classify(polygons, grid, mask.cells);
  return mask;
}

void invert(Mask& mask)
{
  for (auto& cell : mask.cells) {
    cell = static_cast<std::uint8_t>(1 - cell);
  }
}

}  // namespace geofence_raster
