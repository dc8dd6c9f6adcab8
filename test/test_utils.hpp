#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include "geofence_raster/geometry.hpp"

namespace geofence_raster
{
namespace test
{

// Fresh directory under the system temp dir, removed with the fixture.
class TempDirTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    static std::atomic<int> counter{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() /
      ("geofence_raster_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
      std::to_string(counter++));
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string path(const std::string& name) const
  {
    return (dir_ / name).string();
  }

  std::string write_file(const std::string& name, const std::string& contents) const
  {
    const std::string file_path = path(name);
    std::ofstream out(file_path);
    out << contents;
    return file_path;
  }

  std::filesystem::path dir_;
};

inline Polygon rectangle(double min_x, double min_y, double max_x, double max_y)
{
  Polygon polygon;
  polygon.exterior = {{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}};
  return polygon;
}

}  // namespace test
}  // namespace geofence_raster

