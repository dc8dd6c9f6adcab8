#pragma once

// Standard library
#include <optional>
#include <string>
#include <vector>

// Third-party
#include <proj.h>

// Project
#include "geofence_raster/geometry.hpp"

namespace geofence_raster
{

struct ProjectionWarning {
  std::string message;
};

struct NormalizedGeometry {
  Geometry geometry;
  std::string crs;
  bool reprojected = false;
  std::optional<ProjectionWarning> warning;
};

// Axis order is normalized to x = easting/longitude, y = northing/latitude.
class ProjTransform
{
public:
  ProjTransform(const std::string& source_crs, const std::string& target_crs);
  ~ProjTransform();

  ProjTransform(const ProjTransform&) = delete;
  ProjTransform& operator=(const ProjTransform&) = delete;

  bool valid() const {return proj_ != nullptr;}
  const std::string& error() const {return error_;}

  bool forward(std::vector<double>& x, std::vector<double>& y);

private:
  std::string last_error();

  PJ_CONTEXT* ctx_;
  PJ* proj_;
  std::string error_;
};

// "EPSG:326zz" / "EPSG:327zz", including the Norway and Svalbard zones.
// Fails outside latitude [-80, 84].
bool utm_crs_for_lonlat(double lon, double lat, std::string& utm_crs, std::string& error);

bool estimate_utm_crs(
  const Bounds& bounds, const std::string& crs, std::string& utm_crs, std::string& error);

// Leaves the geometry untouched on failure.
bool reproject(
  Geometry& geometry, const std::string& source_crs, const std::string& target_crs,
  std::string& error);

// Either the reprojected geometry, or the original one plus a warning.
NormalizedGeometry normalize_coordinates(
  Geometry geometry, const std::string& crs, bool project_to_utm);

// WKT2, or "UNKNOWN".
std::string crs_to_wkt(const std::string& crs);

}  // namespace geofence_raster
