#pragma once

// Project
#include "geofence_raster/geometry.hpp"

namespace geofence_raster
{

// Merges possibly overlapping or adjacent parts into disjoint oriented
// polygons. Edges shared by two parts become interior.
// Throws GeometryError when GDAL/GEOS cannot compute the union.
MultiPolygon union_polygons(const MultiPolygon& polygons);

}  // namespace geofence_raster
