#pragma once

// Standard library
#include <vector>

// Project
#include "geofence_raster/geometry.hpp"

namespace geofence_raster
{

// Cell-centre coordinates. xs run west to east, ys north to south.
struct SampleGrid {
  std::vector<double> xs;
  std::vector<double> ys;

  int width() const {return static_cast<int>(xs.size());}
  int height() const {return static_cast<int>(ys.size());}
};

SampleGrid build_sample_grid(const Bounds& bounds, int width, int height);

}  // namespace geofence_raster
