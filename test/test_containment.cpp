#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "geofence_raster/containment.hpp"
#include "geofence_raster/sample_grid.hpp"
#include "test_utils.hpp"

using geofence_raster::Bounds;
using geofence_raster::ContainmentCapabilities;
using geofence_raster::ContainmentMode;
using geofence_raster::MultiPolygon;
using geofence_raster::Polygon;
using geofence_raster::PreparedPolygon;
using geofence_raster::SampleGrid;
using geofence_raster::test::rectangle;

namespace
{

MultiPolygon oriented(MultiPolygon polygons)
{
  for (auto& polygon : polygons) {
    polygon = geofence_raster::orient(polygon);
  }
  return polygons;
}

MultiPolygon star()
{
  Polygon polygon;
  const double pi = std::acos(-1.0);
  for (int i = 0; i < 10; ++i) {
    const double r = (i % 2 == 0) ? 10.0 : 4.0;
    const double a = pi / 2 + i * pi / 5;
    polygon.exterior.push_back({r * std::cos(a), r * std::sin(a)});
  }
  return oriented({polygon});
}

MultiPolygon square_with_hole()
{
  Polygon polygon = rectangle(0, 0, 10, 10);
  polygon.holes.push_back({{3, 3}, {7, 3}, {7, 7}, {3, 7}});
  return oriented({polygon});
}

MultiPolygon overlapping_parts()
{
  Polygon with_hole = rectangle(0, 0, 6, 6);
  with_hole.holes.push_back({{1, 1}, {3, 1}, {3, 3}, {1, 3}});
  return oriented({with_hole, rectangle(2, 2, 8, 8), rectangle(20, 20, 21, 21)});
}

std::vector<std::uint8_t> classify(
  geofence_raster::ClassifyFn fn, const MultiPolygon& polygons, const SampleGrid& grid)
{
  std::vector<std::uint8_t> cells;
  fn(polygons, grid, cells);
  return cells;
}

}  // namespace

TEST(Containment, InteriorExteriorAndHole)
{
  const PreparedPolygon prepared(square_with_hole());
  EXPECT_TRUE(prepared.contains(1, 1));
  EXPECT_TRUE(prepared.contains(9.5, 5));
  EXPECT_FALSE(prepared.contains(5, 5));
  EXPECT_FALSE(prepared.contains(11, 5));
  EXPECT_FALSE(prepared.contains(-1, -1));
}

TEST(Containment, PointOnBoundaryIsOutside)
{
  const MultiPolygon square = oriented({rectangle(0, 0, 1, 1)});
  const PreparedPolygon prepared(square);

  // Vertical edges, horizontal edges and vertices.
  EXPECT_FALSE(prepared.contains(0.0, 0.5));
  EXPECT_FALSE(prepared.contains(1.0, 0.5));
  EXPECT_FALSE(prepared.contains(0.5, 0.0));
  EXPECT_FALSE(prepared.contains(0.5, 1.0));
  EXPECT_FALSE(prepared.contains(0.0, 0.0));
  EXPECT_FALSE(prepared.contains(1.0, 1.0));
  EXPECT_TRUE(prepared.contains(0.5, 0.5));

  std::vector<std::uint8_t> out;
  geofence_raster::contains_xy(square, {0.0, 1.0, 0.5, 0.5}, {0.5, 0.5, 0.0, 0.5}, out);
  EXPECT_EQ(out, (std::vector<std::uint8_t>{0, 0, 0, 1}));
}

TEST(Containment, OverlappingPartsAreUnioned)
{
  const MultiPolygon parts = overlapping_parts();
  const PreparedPolygon prepared(parts);

  // Inside the hole of the first part but covered by the second.
  EXPECT_TRUE(prepared.contains(2.5, 2.5));
  // Inside the hole and outside the second part.
  EXPECT_FALSE(prepared.contains(1.5, 1.5));
  // Overlap of both parts.
  EXPECT_TRUE(prepared.contains(4, 4));
  // On the edge of the second part, inside the first.
  EXPECT_TRUE(prepared.contains(2.0, 4.0));
  // Disjoint part.
  EXPECT_TRUE(prepared.contains(20.5, 20.5));
  EXPECT_FALSE(prepared.contains(15, 15));
}

TEST(Containment, BulkAndPreparedAgree)
{
  const std::vector<MultiPolygon> shapes = {star(), square_with_hole(), overlapping_parts()};
  for (const auto& shape : shapes) {
    for (int size : {1, 2, 7, 33, 64}) {
      const SampleGrid grid =
        geofence_raster::build_sample_grid(geofence_raster::compute_bounds(shape), size, size + 3);
      EXPECT_EQ(
        classify(&geofence_raster::classify_bulk, shape, grid),
        classify(&geofence_raster::classify_prepared, shape, grid));
    }
  }
}

TEST(Containment, BulkAndPreparedAgreeOnEdgesAndVertices)
{
  // Samples on the integer lattice hit every edge and vertex of the shapes.
  SampleGrid grid;
  for (int i = -1; i <= 11; ++i) {
    grid.xs.push_back(i);
  }
  for (int i = 11; i >= -1; --i) {
    grid.ys.push_back(i);
  }

  for (const auto& shape : {square_with_hole(), overlapping_parts()}) {
    EXPECT_EQ(
      classify(&geofence_raster::classify_bulk, shape, grid),
      classify(&geofence_raster::classify_prepared, shape, grid));
  }
}

TEST(Containment, DegenerateShapeContainsNothing)
{
  Polygon flat;
  flat.exterior = {{0, 0}, {1, 0}, {2, 0}};
  const MultiPolygon shape = {flat};
  const SampleGrid grid = geofence_raster::build_sample_grid(Bounds{0, 0, 2, 0}, 4, 3);

  const auto bulk = classify(&geofence_raster::classify_bulk, shape, grid);
  EXPECT_EQ(bulk, std::vector<std::uint8_t>(12, 0));
  EXPECT_EQ(bulk, classify(&geofence_raster::classify_prepared, shape, grid));
}

TEST(Containment, ContainsXyRejectsMismatchedArrays)
{
  std::vector<std::uint8_t> out;
  EXPECT_THROW(
    geofence_raster::contains_xy(square_with_hole(), {1.0, 2.0}, {1.0}, out),
    std::invalid_argument);
}

TEST(Containment, StrategySelection)
{
  ContainmentCapabilities capabilities;
  capabilities.max_bulk_points = 100;

  EXPECT_STREQ(geofence_raster::select_strategy(ContainmentMode::Auto, 100, capabilities).name, "bulk");
  EXPECT_STREQ(
    geofence_raster::select_strategy(ContainmentMode::Auto, 101, capabilities).name, "prepared");
  EXPECT_STREQ(
    geofence_raster::select_strategy(ContainmentMode::Prepared, 1, capabilities).name, "prepared");
  EXPECT_THROW(
    geofence_raster::select_strategy(ContainmentMode::Bulk, 101, capabilities),
    std::invalid_argument);
}

TEST(Containment, ParseMode)
{
  EXPECT_EQ(geofence_raster::parse_containment_mode("auto"), ContainmentMode::Auto);
  EXPECT_EQ(geofence_raster::parse_containment_mode("bulk"), ContainmentMode::Bulk);
  EXPECT_EQ(geofence_raster::parse_containment_mode("prepared"), ContainmentMode::Prepared);
  EXPECT_THROW(geofence_raster::parse_containment_mode("vectorized"), std::invalid_argument);
}
