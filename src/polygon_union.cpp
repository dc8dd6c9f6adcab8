#include "geofence_raster/polygon_union.hpp"

#include <cstddef>
#include <string>
#include <utility>

#include <cpl_error.h>
#include <ogr_geometry.h>
#include <rclcpp/rclcpp.hpp>

#include "geofence_raster/errors.hpp"

namespace geofence_raster
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("geofence_raster.union");
}

OGRLinearRing to_ogr_ring(const Ring& ring)
{
  OGRLinearRing out;
  for (const auto& p : ring) {
    out.addPoint(p.x, p.y);
  }
  out.closeRings();
  return out;
}

OGRPolygon to_ogr_polygon(const Polygon& polygon)
{
  OGRPolygon out;
  OGRLinearRing exterior = to_ogr_ring(polygon.exterior);
  out.addRing(&exterior);
  for (const auto& hole : polygon.holes) {
    OGRLinearRing interior = to_ogr_ring(hole);
    out.addRing(&interior);
  }
  return out;
}

Ring from_ogr_ring(const OGRLinearRing* ring)
{
  Ring out;
  if (!ring) {
    return out;
  }
  out.reserve(static_cast<std::size_t>(ring->getNumPoints()));
  for (int i = 0; i < ring->getNumPoints(); ++i) {
    out.push_back(Point{ring->getX(i), ring->getY(i)});
  }
  return normalize_ring(std::move(out));
}

void append_polygons(const OGRGeometry* geometry, MultiPolygon& out)
{
  switch (wkbFlatten(geometry->getGeometryType())) {
    case wkbPolygon: {
        const OGRPolygon* polygon = geometry->toPolygon();
        Polygon part;
        part.exterior = from_ogr_ring(polygon->getExteriorRing());
        if (part.exterior.size() < 3) {
          return;
        }
        for (int i = 0; i < polygon->getNumInteriorRings(); ++i) {
          Ring hole = from_ogr_ring(polygon->getInteriorRing(i));
          if (hole.size() >= 3) {
            part.holes.push_back(std::move(hole));
          }
        }
        out.push_back(orient(std::move(part)));
        break;
      }
    case wkbMultiPolygon:
    case wkbGeometryCollection: {
        const OGRGeometryCollection* collection = geometry->toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
          append_polygons(collection->getGeometryRef(i), out);
        }
        break;
      }
    default:
      // Parts that collapsed to lines or points have no interior.
      break;
  }
}

}  // namespace

MultiPolygon union_polygons(const MultiPolygon& polygons)
{
  if (polygons.size() < 2) {
    return polygons;
  }

  OGRMultiPolygon parts;
  for (const auto& polygon : polygons) {
    OGRPolygon part = to_ogr_polygon(polygon);
    if (parts.addGeometry(&part) != OGRERR_NONE) {
      throw GeometryError("Failed to collect polygon parts for the union");
    }
  }

  CPLErrorReset();
  OGRGeometryUniquePtr merged(parts.UnionCascaded());
  if (!merged) {
    throw GeometryError(
            "Failed to dissolve " + std::to_string(polygons.size()) + " polygon parts: " +
            CPLGetLastErrorMsg());
  }

  MultiPolygon result;
  append_polygons(merged.get(), result);
  RCLCPP_INFO(
    logger(), "Dissolved %zu polygon part(s) into %zu", polygons.size(), result.size());
  return result;
}

}  // namespace geofence_raster
