#pragma once

// Standard library
#include <string>
#include <vector>

namespace geofence_raster
{

struct Point {
  double x;
  double y;
};

// The closing vertex is not repeated.
using Ring = std::vector<Point>;
using LineString = std::vector<Point>;

// After orient() the exterior is counter-clockwise and holes are clockwise.
struct Polygon {
  Ring exterior;
  std::vector<Ring> holes;
};

using MultiPolygon = std::vector<Polygon>;

struct Bounds {
  double min_x;
  double min_y;
  double max_x;
  double max_y;
};

enum class GeometryType
{
  Point,
  MultiPoint,
  LineString,
  MultiLineString,
  Polygon,
  MultiPolygon,
  GeometryCollection
};

// Parts are kept flat by dimension.
struct Geometry {
  GeometryType type = GeometryType::GeometryCollection;
  MultiPolygon polygons;
  std::vector<LineString> lines;
  std::vector<Point> points;

  bool empty() const
  {
    return polygons.empty() && lines.empty() && points.empty();
  }
};

const char* to_string(GeometryType type);

// Twice the signed area, positive for counter-clockwise rings.
double signed_area2(const Ring& ring);

Ring normalize_ring(Ring ring);
Polygon orient(Polygon polygon);

// Throws std::invalid_argument if there is no coordinate at all.
Bounds compute_bounds(const Geometry& geometry);
Bounds compute_bounds(const MultiPolygon& polygons);

// Merges many geometries into one. Polygon parts are unioned into disjoint
// polygons; a single dimension keeps its own type, mixed dimensions give a
// GeometryCollection.
Geometry dissolve(const std::vector<Geometry>& geometries);

}  // namespace geofence_raster
