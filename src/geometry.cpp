#include "geofence_raster/geometry.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "geofence_raster/polygon_union.hpp"

namespace geofence_raster
{

namespace
{

void extend(Bounds& bounds, const Point& p)
{
  bounds.min_x = std::min(bounds.min_x, p.x);
  bounds.max_x = std::max(bounds.max_x, p.x);
  bounds.min_y = std::min(bounds.min_y, p.y);
  bounds.max_y = std::max(bounds.max_y, p.y);
}

Bounds empty_bounds()
{
  const double inf = std::numeric_limits<double>::infinity();
  return Bounds{inf, inf, -inf, -inf};
}

bool is_empty(const Bounds& bounds)
{
  return bounds.min_x > bounds.max_x || bounds.min_y > bounds.max_y;
}

void extend(Bounds& bounds, const MultiPolygon& polygons)
{
  for (const auto& polygon : polygons) {
    for (const auto& p : polygon.exterior) {
      extend(bounds, p);
    }
    // Holes lie within the exterior of a valid polygon, but invalid input
    // must not produce a box that cuts off coordinates.
    for (const auto& hole : polygon.holes) {
      for (const auto& p : hole) {
        extend(bounds, p);
      }
    }
  }
}

}  // namespace

const char* to_string(GeometryType type)
{
  switch (type) {
    case GeometryType::Point:
      return "Point";
    case GeometryType::MultiPoint:
      return "MultiPoint";
    case GeometryType::LineString:
      return "LineString";
    case GeometryType::MultiLineString:
      return "MultiLineString";
    case GeometryType::Polygon:
      return "Polygon";
    case GeometryType::MultiPolygon:
      return "MultiPolygon";
    case GeometryType::GeometryCollection:
      return "GeometryCollection";
  }
  return "Unknown";
}

double signed_area2(const Ring& ring)
{
  const std::size_t n = ring.size();
  double area = 0.0;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    area += (ring[j].x * ring[i].y) - (ring[i].x * ring[j].y);
  }
  return area;
}

Ring normalize_ring(Ring ring)
{
  Ring out;
  out.reserve(ring.size());
  for (const auto& p : ring) {
    if (!out.empty() && out.back().x == p.x && out.back().y == p.y) {
      continue;
    }
    out.push_back(p);
  }
  while (out.size() > 1 && out.front().x == out.back().x && out.front().y == out.back().y) {
    out.pop_back();
  }
  return out;
}

Polygon orient(Polygon polygon)
{
  if (signed_area2(polygon.exterior) < 0.0) {
    std::reverse(polygon.exterior.begin(), polygon.exterior.end());
  }
  for (auto& hole : polygon.holes) {
    if (signed_area2(hole) > 0.0) {
      std::reverse(hole.begin(), hole.end());
    }
  }
  return polygon;
}

Bounds compute_bounds(const MultiPolygon& polygons)
{
  Bounds bounds = empty_bounds();
  extend(bounds, polygons);
  if (is_empty(bounds)) {
    throw std::invalid_argument("cannot compute bounds of an empty geometry");
  }
  return bounds;
}

Bounds compute_bounds(const Geometry& geometry)
{
  Bounds bounds = empty_bounds();
  extend(bounds, geometry.polygons);
  for (const auto& line : geometry.lines) {
    for (const auto& p : line) {
      extend(bounds, p);
    }
  }
  for (const auto& p : geometry.points) {
    extend(bounds, p);
  }
  if (is_empty(bounds)) {
    throw std::invalid_argument("cannot compute bounds of an empty geometry");
  }
  return bounds;
}

Geometry dissolve(const std::vector<Geometry>& geometries)
{
  Geometry merged;
  for (const auto& geometry : geometries) {
    for (const auto& polygon : geometry.polygons) {
      merged.polygons.push_back(orient(polygon));
    }
    merged.lines.insert(merged.lines.end(), geometry.lines.begin(), geometry.lines.end());
    merged.points.insert(merged.points.end(), geometry.points.begin(), geometry.points.end());
  }
  merged.polygons = union_polygons(merged.polygons);

  const int dimensions = (merged.polygons.empty() ? 0 : 1) +
    (merged.lines.empty() ? 0 : 1) + (merged.points.empty() ? 0 : 1);
  if (dimensions != 1) {
    merged.type = GeometryType::GeometryCollection;
  } else if (!merged.polygons.empty()) {
    merged.type = merged.polygons.size() == 1 ?
      GeometryType::Polygon : GeometryType::MultiPolygon;
  } else if (!merged.lines.empty()) {
    merged.type = merged.lines.size() == 1 ?
      GeometryType::LineString : GeometryType::MultiLineString;
  } else {
    merged.type = merged.points.size() == 1 ?
      GeometryType::Point : GeometryType::MultiPoint;
  }
  return merged;
}

}  // namespace geofence_raster
