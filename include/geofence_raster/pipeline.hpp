#pragma once

// Standard library
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Project
#include "geofence_raster/containment.hpp"
#include "geofence_raster/geometry.hpp"
#include "geofence_raster/mask_writer.hpp"
#include "geofence_raster/projection.hpp"
#include "geofence_raster/rasterizer.hpp"

namespace geofence_raster
{

struct PipelineConfig {
  std::string input_file;
  std::string out_prefix = "mask";
  int width = 50;
  int height = 50;
  std::string format = "png";
  bool project_utm = false;
  bool invert = false;
  std::string containment_strategy = "auto";
  std::size_t max_bulk_points = ContainmentCapabilities{}.max_bulk_points;
};

struct PipelineResult {
  Mask mask;  // after inversion
  Bounds bounds;
  std::string crs;
  std::string strategy;
  OutputPaths outputs;
  std::vector<ProjectionWarning> warnings;
};

// Narrows an integer parameter to a raster dimension in [1, INT_MAX].
// Throws std::invalid_argument otherwise.
int to_dimension(const std::string& name, std::int64_t value);

// load -> normalize -> sample grid -> rasterize -> invert -> write.
// Configuration is checked before the input is read and nothing is written
// unless the whole mask was produced.
PipelineResult run_pipeline(const PipelineConfig& config);

}  // namespace geofence_raster
