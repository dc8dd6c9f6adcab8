#include "geofence_raster/projection.hpp"

#include <cmath>
#include <utility>

#include <rclcpp/rclcpp.hpp>

namespace geofence_raster
{

namespace
{

constexpr char kGeographicCrs[] = "EPSG:4326";

// UTM is only defined between these latitudes; beyond them UPS applies.
constexpr double kUtmMinLatitude = -80.0;
constexpr double kUtmMaxLatitude = 84.0;

rclcpp::Logger logger()
{
  return rclcpp::get_logger("geofence_raster.projection");
}

template<typename Fn>
void for_each_point(Geometry& geometry, Fn fn)
{
  for (auto& polygon : geometry.polygons) {
    for (auto& p : polygon.exterior) {
      fn(p);
    }
    for (auto& hole : polygon.holes) {
      for (auto& p : hole) {
        fn(p);
      }
    }
  }
  for (auto& line : geometry.lines) {
    for (auto& p : line) {
      fn(p);
    }
  }
  for (auto& p : geometry.points) {
    fn(p);
  }
}

}  // namespace

ProjTransform::ProjTransform(const std::string& source_crs, const std::string& target_crs)
: ctx_(proj_context_create()),
  proj_(nullptr)
{
  PJ* raw = proj_create_crs_to_crs(ctx_, source_crs.c_str(), target_crs.c_str(), nullptr);
  if (!raw) {
    error_ = "Failed to initialize projection from " + source_crs + " to " + target_crs +
      ": " + last_error();
    return;
  }
  proj_ = proj_normalize_for_visualization(ctx_, raw);
  proj_destroy(raw);
  if (!proj_) {
    error_ = "Failed to normalize axis order for " + source_crs + " -> " + target_crs +
      ": " + last_error();
  }
}

ProjTransform::~ProjTransform()
{
  if (proj_) {
    proj_destroy(proj_);
    proj_ = nullptr;
  }
  proj_context_destroy(ctx_);
}

std::string ProjTransform::last_error()
{
  const int err = proj_context_errno(ctx_);
  if (err == 0) {
    return "unknown PROJ error";
  }
  const char* message = proj_context_errno_string(ctx_, err);
  return message ? message : "PROJ error " + std::to_string(err);
}

bool ProjTransform::forward(std::vector<double>& x, std::vector<double>& y)
{
  if (!proj_) {
    return false;
  }
  if (x.size() != y.size()) {
    error_ = "coordinate arrays differ in length";
    return false;
  }

  const std::size_t count = x.size();
  const std::size_t done = proj_trans_generic(
    proj_, PJ_FWD,
    x.data(), sizeof(double), count,
    y.data(), sizeof(double), count,
    nullptr, 0, 0,
    nullptr, 0, 0);
  if (done != count) {
    error_ = "transformed " + std::to_string(done) + " of " + std::to_string(count) +
      " coordinates: " + last_error();
    return false;
  }
  // Failed points come back as HUGE_VAL rather than as an error count.
  for (std::size_t i = 0; i < count; ++i) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
      error_ = "coordinate " + std::to_string(i) + " could not be transformed: " + last_error();
      return false;
    }
  }
  return true;
}

bool utm_crs_for_lonlat(double lon, double lat, std::string& utm_crs, std::string& error)
{
  if (!std::isfinite(lon) || !std::isfinite(lat)) {
    error = "non-finite centre coordinate";
    return false;
  }
  if (lon < -180.0 || lon > 180.0) {
    error = "longitude " + std::to_string(lon) + " is outside [-180, 180]";
    return false;
  }
  if (lat < kUtmMinLatitude || lat > kUtmMaxLatitude) {
    error = "latitude " + std::to_string(lat) + " is outside UTM coverage [-80, 84]";
    return false;
  }

  int zone_number = static_cast<int>(std::floor((lon + 180.0) / 6.0)) + 1;
  if (zone_number > 60) {
    zone_number = 60;
  }
  if (lat >= 56.0 && lat < 64.0 && lon >= 3.0 && lon < 12.0) {
    zone_number = 32;
  } else if (lat >= 72.0 && lon >= 0.0 && lon < 42.0) {
    if (lon < 9.0) {
      zone_number = 31;
    } else if (lon < 21.0) {
      zone_number = 33;
    } else if (lon < 33.0) {
      zone_number = 35;
    } else {
      zone_number = 37;
    }
  }

  bool is_northern = lat >= 0;
  int epsg_code = is_northern ? 32600 + zone_number : 32700 + zone_number;
  utm_crs = "EPSG:" + std::to_string(epsg_code);
  return true;
}

bool estimate_utm_crs(
  const Bounds& bounds, const std::string& crs, std::string& utm_crs, std::string& error)
{
  std::vector<double> x{0.5 * (bounds.min_x + bounds.max_x)};
  std::vector<double> y{0.5 * (bounds.min_y + bounds.max_y)};

  ProjTransform to_lonlat(crs, kGeographicCrs);
  if (!to_lonlat.valid()) {
    error = to_lonlat.error();
    return false;
  }
  if (!to_lonlat.forward(x, y)) {
    error = "centre of bounds not convertible to lon/lat: " + to_lonlat.error();
    return false;
  }
  return utm_crs_for_lonlat(x[0], y[0], utm_crs, error);
}

bool reproject(
  Geometry& geometry, const std::string& source_crs, const std::string& target_crs,
  std::string& error)
{
  std::vector<double> x;
  std::vector<double> y;
  for_each_point(geometry, [&](Point& p) {
      x.push_back(p.x);
      y.push_back(p.y);
    });

  ProjTransform transform(source_crs, target_crs);
  if (!transform.valid()) {
    error = transform.error();
    return false;
  }
  if (!transform.forward(x, y)) {
    error = transform.error();
    return false;
  }

  std::size_t i = 0;
  for_each_point(geometry, [&](Point& p) {
      p.x = x[i];
      p.y = y[i];
      ++i;
    });
  for (auto& polygon : geometry.polygons) {
    polygon = orient(std::move(polygon));
  }
  return true;
}

NormalizedGeometry normalize_coordinates(
  Geometry geometry, const std::string& crs, bool project_to_utm)
{
  NormalizedGeometry result;
  result.crs = crs;
  if (!project_to_utm) {
    result.geometry = std::move(geometry);
    return result;
  }

  std::string utm_crs;
  std::string error;
  if (!estimate_utm_crs(compute_bounds(geometry), crs, utm_crs, error)) {
    result.warning = ProjectionWarning{
      "Could not estimate a UTM CRS: " + error + ". Proceeding in original CRS " + crs + "."};
    result.geometry = std::move(geometry);
    return result;
  }
  RCLCPP_INFO(logger(), "Using UTM zone: %s", utm_crs.c_str());

  if (!reproject(geometry, crs, utm_crs, error)) {
    result.warning = ProjectionWarning{
      "Could not project to " + utm_crs + ": " + error + ". Proceeding in original CRS " +
      crs + "."};
    result.geometry = std::move(geometry);
    return result;
  }

  result.geometry = std::move(geometry);
  result.crs = utm_crs;
  result.reprojected = true;
  return result;
}

std::string crs_to_wkt(const std::string& crs)
{
  PJ_CONTEXT* ctx = proj_context_create();
  std::string wkt = "UNKNOWN";
  PJ* pj = proj_create(ctx, crs.c_str());
  if (pj) {
    const char* text = proj_as_wkt(ctx, pj, PJ_WKT2_2019, nullptr);
    if (text) {
      wkt = text;
    }
    proj_destroy(pj);
  }
  proj_context_destroy(ctx);
  return wkt;
}

}  // namespace geofence_raster
