#include "geofence_raster/pipeline.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

#include <rclcpp/rclcpp.hpp>

#include "geofence_raster/geojson_loader.hpp"
#include "geofence_raster/sample_grid.hpp"

namespace geofence_raster
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("geofence_raster");
}

}  // namespace

int to_dimension(const std::string& name, std::int64_t value)
{
  if (value <= 0 || value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(
            name + " must be in [1, " + std::to_string(std::numeric_limits<int>::max()) +
            "], got " + std::to_string(value));
  }
  return static_cast<int>(value);
}

PipelineResult run_pipeline(const PipelineConfig& config)
{
  if (config.width <= 0 || config.height <= 0) {
    throw std::invalid_argument(
            "width and height must be positive, got " + std::to_string(config.width) + "x" +
            std::to_string(config.height));
  }
  const ImageFormat format = parse_image_format(config.format);
  const ContainmentMode mode = parse_containment_mode(config.containment_strategy);

  LoadedGeometry loaded = load_geojson(config.input_file);

  PipelineResult result;
  NormalizedGeometry normalized =
    normalize_coordinates(std::move(loaded.geometry), loaded.crs, config.project_utm);
  if (normalized.warning) {
    RCLCPP_WARN(logger(), "%s", normalized.warning->message.c_str());
    result.warnings.push_back(*normalized.warning);
  }

  const MultiPolygon polygons = ensure_polygonal(normalized.geometry);
  result.bounds = compute_bounds(polygons);
  result.crs = normalized.crs;
  RCLCPP_INFO(
    logger(), "Grid bounds (%s): [%.6f, %.6f] x [%.6f, %.6f]", result.crs.c_str(),
    result.bounds.min_x, result.bounds.max_x, result.bounds.min_y, result.bounds.max_y);

  const SampleGrid grid = build_sample_grid(result.bounds, config.width, config.height);

  ContainmentCapabilities capabilities;
  capabilities.max_bulk_points = config.max_bulk_points;
  const std::size_t total_cells =
    static_cast<std::size_t>(config.width) * static_cast<std::size_t>(config.height);
  const ContainmentStrategy strategy = select_strategy(mode, total_cells, capabilities);
  result.strategy = strategy.name;
  RCLCPP_INFO(
    logger(), "Generating grid: %dx%d cells (%s containment)", config.width, config.height,
    strategy.name);

  result.mask = rasterize(polygons, grid, strategy);

  const std::size_t cells_inside = result.mask.count_inside();
  RCLCPP_INFO(
    logger(), "Cells inside zone: %zu / %zu (%.1f%%)", cells_inside, total_cells,
    100.0 * static_cast<double>(cells_inside) / static_cast<double>(total_cells));

  if (config.invert) {
    invert(result.mask);
  }

  MaskMetadata metadata;
  metadata.source_path = config.input_file;
  metadata.bounds = result.bounds;
  metadata.crs = result.crs;
  metadata.crs_wkt = crs_to_wkt(result.crs);
  metadata.inverted = config.invert;
  metadata.containment_strategy = result.strategy;

  result.outputs = write_outputs(result.mask, metadata, config.out_prefix, format);
  return result;
}

}  // namespace geofence_raster
