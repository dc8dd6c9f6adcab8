#include "geofence_raster/sample_grid.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace geofence_raster
{

namespace
{

// count cell centres over [min, max): left edges at min + i * step, shifted by
// half a cell.
std::vector<double> cell_centres(double min, double max, int count)
{
  const double step = (max - min) / count;
  const double half = (max - min) / (2.0 * count);
  std::vector<double> centres(count);
  for (int i = 0; i < count; ++i) {
    centres[i] = (min + i * step) + half;
  }
  return centres;
}

}  // namespace

SampleGrid build_sample_grid(const Bounds& bounds, int width, int height)
{
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument(
            "Raster size must be positive, got " + std::to_string(width) + "x" +
            std::to_string(height));
  }

  SampleGrid grid;
  grid.xs = cell_centres(bounds.min_x, bounds.max_x, width);
  grid.ys = cell_centres(bounds.min_y, bounds.max_y, height);
  // Raster row 0 is north.
  std::reverse(grid.ys.begin(), grid.ys.end());
  return grid;
}

}  // namespace geofence_raster
