#pragma once

// Standard library
#include <cstddef>
#include <string>

// Third-party
#include <nlohmann/json.hpp>

// Project
#include "geofence_raster/geometry.hpp"

namespace geofence_raster
{

// Assumed when the GeoJSON does not name a CRS.
constexpr const char kDefaultCrs[] = "EPSG:4326";

struct LoadedGeometry {
  Geometry geometry;
  std::string crs;
  bool crs_assumed = false;
  std::size_t feature_count = 0;
};

// FeatureCollection, Feature or bare geometry, dissolved into one geometry.
// Throws InputError when unreadable, malformed or empty.
LoadedGeometry load_geojson(const std::string& path);
LoadedGeometry parse_geojson(const nlohmann::json& document);

Geometry parse_geometry(const nlohmann::json& geometry);

}  // namespace geofence_raster
