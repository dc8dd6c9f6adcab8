#include "geofence_raster/geojson_loader.hpp"

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "geofence_raster/errors.hpp"

namespace geofence_raster
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("geofence_raster.loader");
}

const nlohmann::json& require_array(const nlohmann::json& node, const char* what)
{
  if (!node.is_array()) {
    throw InputError(std::string("Expected an array for ") + what);
  }
  return node;
}

Point parse_position(const nlohmann::json& coord)
{
  require_array(coord, "position");
  if (coord.size() < 2 || !coord[0].is_number() || !coord[1].is_number()) {
    throw InputError("Position needs at least two numbers: " + coord.dump());
  }
  return Point{coord[0].get<double>(), coord[1].get<double>()};
}

std::vector<Point> parse_positions(const nlohmann::json& coords)
{
  require_array(coords, "position list");
  std::vector<Point> points;
  points.reserve(coords.size());
  for (const auto& coord : coords) {
    points.push_back(parse_position(coord));
  }
  return points;
}

Ring parse_ring(const nlohmann::json& coords)
{
  Ring ring = normalize_ring(parse_positions(coords));
  if (ring.size() < 3) {
    throw InputError("Polygon ring has fewer than 3 distinct positions");
  }
  return ring;
}

// An empty coordinate array is an empty polygon, not an error.
void parse_polygon(const nlohmann::json& rings, MultiPolygon& out)
{
  require_array(rings, "polygon rings");
  if (rings.empty()) {
    return;
  }
  Polygon polygon;
  polygon.exterior = parse_ring(rings[0]);
  for (std::size_t i = 1; i < rings.size(); ++i) {
    polygon.holes.push_back(parse_ring(rings[i]));
  }
  out.push_back(orient(std::move(polygon)));
}

std::string parse_crs(const nlohmann::json& document)
{
  if (!document.is_object() || !document.contains("crs") || document["crs"].is_null()) {
    return "";
  }
  const auto& crs = document["crs"];
  const auto& properties = crs.value("properties", nlohmann::json::object());
  const std::string type = crs.value("type", "");
  if (type == "name" && properties.contains("name") && properties["name"].is_string()) {
    return properties["name"].get<std::string>();
  }
  if (type == "EPSG" && properties.contains("code")) {
    const auto& code = properties["code"];
    return "EPSG:" + (code.is_string() ? code.get<std::string>() : std::to_string(code.get<int>()));
  }
  RCLCPP_WARN(logger(), "Ignoring unsupported crs member: %s", crs.dump().c_str());
  return "";
}

}  // namespace

Geometry parse_geometry(const nlohmann::json& geometry)
{
  if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
    throw InputError("Geometry object without a type");
  }
  const std::string type = geometry["type"].get<std::string>();

  Geometry out;
  if (type == "GeometryCollection") {
    const nlohmann::json members_json = geometry.value("geometries", nlohmann::json());
    std::vector<Geometry> members;
    for (const auto& member : require_array(members_json, "geometries")) {
      members.push_back(parse_geometry(member));
    }
    out = dissolve(members);
    out.type = GeometryType::GeometryCollection;
    return out;
  }

  if (!geometry.contains("coordinates")) {
    throw InputError(type + " geometry without coordinates");
  }
  const auto& coords = geometry["coordinates"];

  if (type == "Point") {
    out.type = GeometryType::Point;
    // Empty points are allowed by the format and carry nothing.
    if (!require_array(coords, "Point coordinates").empty()) {
      out.points.push_back(parse_position(coords));
    }
  } else if (type == "MultiPoint") {
    out.type = GeometryType::MultiPoint;
    out.points = parse_positions(coords);
  } else if (type == "LineString") {
    out.type = GeometryType::LineString;
    auto line = parse_positions(coords);
    if (!line.empty()) {
      out.lines.push_back(std::move(line));
    }
  } else if (type == "MultiLineString") {
    out.type = GeometryType::MultiLineString;
    for (const auto& line : require_array(coords, "MultiLineString coordinates")) {
      out.lines.push_back(parse_positions(line));
    }
  } else if (type == "Polygon") {
    out.type = GeometryType::Polygon;
    parse_polygon(coords, out.polygons);
  } else if (type == "MultiPolygon") {
    out.type = GeometryType::MultiPolygon;
    for (const auto& rings : require_array(coords, "MultiPolygon coordinates")) {
      parse_polygon(rings, out.polygons);
    }
  } else {
    throw InputError("Unsupported geometry type: " + type);
  }
  return out;
}

LoadedGeometry parse_geojson(const nlohmann::json& document)
{
  if (!document.is_object()) {
    throw InputError("GeoJSON root must be an object");
  }

  std::vector<Geometry> parts;
  std::size_t feature_count = 0;
  const std::string type = document.value("type", "");
  if (type == "FeatureCollection") {
    const nlohmann::json features = document.value("features", nlohmann::json());
    for (const auto& feature : require_array(features, "features")) {
      ++feature_count;
      if (feature.is_object() && feature.contains("geometry") && !feature["geometry"].is_null()) {
        parts.push_back(parse_geometry(feature["geometry"]));
      }
    }
  } else if (type == "Feature") {
    feature_count = 1;
    if (document.contains("geometry") && !document["geometry"].is_null()) {
      parts.push_back(parse_geometry(document["geometry"]));
    }
  } else {
    parts.push_back(parse_geometry(document));
    feature_count = 1;
  }

  LoadedGeometry loaded;
  loaded.feature_count = feature_count;
  loaded.geometry = dissolve(parts);
  if (loaded.geometry.empty()) {
    throw InputError("No geometry found in the GeoJSON.");
  }

  loaded.crs = parse_crs(document);
  if (loaded.crs.empty()) {
    // Plain GeoJSON is lon/lat by definition; a missing crs member is the norm.
    loaded.crs = kDefaultCrs;
    loaded.crs_assumed = true;
  }
  return loaded;
}

LoadedGeometry load_geojson(const std::string& path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    throw InputError("Failed to open GeoJSON file: " + path);
  }

  nlohmann::json geojson_data;
  try {
    file >> geojson_data;
  } catch (const nlohmann::json::exception& e) {
    throw InputError("Failed to parse GeoJSON file " + path + ": " + e.what());
  }

  LoadedGeometry loaded;
  try {
    loaded = parse_geojson(geojson_data);
  } catch (const nlohmann::json::exception& e) {
    throw InputError("Malformed GeoJSON in " + path + ": " + e.what());
  }

  RCLCPP_INFO(
    logger(), "Loaded %zu feature(s) from %s as %s (%zu polygon part(s)), CRS %s%s",
    loaded.feature_count, path.c_str(), to_string(loaded.geometry.type),
    loaded.geometry.polygons.size(), loaded.crs.c_str(),
    loaded.crs_assumed ? " (assumed)" : "");
  return loaded;
}

}  // namespace geofence_raster
