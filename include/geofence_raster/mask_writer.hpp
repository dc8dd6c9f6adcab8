#pragma once

// Standard library
#include <cstdint>
#include <string>
#include <vector>

// Third-party
#include <nlohmann/json.hpp>

// Project
#include "geofence_raster/geometry.hpp"
#include "geofence_raster/rasterizer.hpp"

namespace geofence_raster
{

enum class ImageFormat
{
  Png,
  Jpeg,
  Pgm
};

ImageFormat parse_image_format(const std::string& name);
const char* image_extension(ImageFormat format);

struct MaskMetadata {
  std::string source_path;
  Bounds bounds;
  std::string crs;
  std::string crs_wkt;
  bool inverted = false;
  std::string containment_strategy;
};

struct OutputPaths {
  std::string npy;
  std::string image;
  std::string metadata;
};

OutputPaths output_paths(const std::string& out_prefix, ImageFormat format);

// Writes all three files or none of them. Returns absolute paths.
OutputPaths write_outputs(
  const Mask& mask, const MaskMetadata& metadata, const std::string& out_prefix,
  ImageFormat format);

void write_npy_file(const std::string& path, const Mask& mask);
void write_pgm_file(
  const std::string& path, const std::vector<uint8_t>& data, int width, int height);
void write_gdal_image(
  const std::string& path, const std::vector<uint8_t>& data, int width, int height,
  ImageFormat format);

nlohmann::ordered_json build_metadata(
  const MaskMetadata& metadata, const OutputPaths& paths, ImageFormat format,
  int width, int height);

std::vector<uint8_t> to_grayscale(const Mask& mask);

}  // namespace geofence_raster
