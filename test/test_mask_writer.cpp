#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geofence_raster/errors.hpp"
#include "geofence_raster/mask_writer.hpp"
#include "test_utils.hpp"

using geofence_raster::ImageFormat;
using geofence_raster::Mask;
using geofence_raster::MaskMetadata;
using geofence_raster::OutputPaths;

namespace
{

std::string read_all(const std::string& path)
{
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Mask sample_mask()
{
  Mask mask;
  mask.width = 3;
  mask.height = 2;
  mask.cells = {1, 0, 1, 0, 0, 1};
  return mask;
}

MaskMetadata sample_metadata(const std::string& source)
{
  MaskMetadata metadata;
  metadata.source_path = source;
  metadata.bounds = {1.0, 2.0, 3.0, 4.0};
  metadata.crs = "EPSG:4326";
  metadata.crs_wkt = "UNKNOWN";
  metadata.containment_strategy = "bulk";
  return metadata;
}

}  // namespace

class MaskWriterTest : public geofence_raster::test::TempDirTest {};

TEST_F(MaskWriterTest, NpyHeaderAndPayload)
{
  const std::string file = path("mask.npy");
  geofence_raster::write_npy_file(file, sample_mask());

  const std::string bytes = read_all(file);
  ASSERT_GE(bytes.size(), 10u);
  EXPECT_EQ(bytes.substr(0, 6), "\x93NUMPY");
  EXPECT_EQ(bytes[6], 1);
  EXPECT_EQ(bytes[7], 0);

  const std::size_t header_len =
    static_cast<unsigned char>(bytes[8]) | (static_cast<unsigned char>(bytes[9]) << 8);
  EXPECT_EQ((10 + header_len) % 64, 0u);
  const std::string header = bytes.substr(10, header_len);
  EXPECT_NE(header.find("'descr': '|u1'"), std::string::npos);
  EXPECT_NE(header.find("'fortran_order': False"), std::string::npos);
  EXPECT_NE(header.find("'shape': (2, 3)"), std::string::npos);
  EXPECT_EQ(header.back(), '\n');

  EXPECT_EQ(bytes.substr(10 + header_len), std::string("\x01\x00\x01\x00\x00\x01", 6));
}

TEST_F(MaskWriterTest, PgmUsesFullScaleGray)
{
  const std::string file = path("mask.pgm");
  const Mask mask = sample_mask();
  geofence_raster::write_pgm_file(file, geofence_raster::to_grayscale(mask), 3, 2);

  const std::string bytes = read_all(file);
  EXPECT_EQ(bytes.substr(0, 3), "P5\n");
  EXPECT_NE(bytes.find("3 2\n255\n"), std::string::npos);
  EXPECT_EQ(bytes.substr(bytes.size() - 6), std::string("\xff\x00\xff\x00\x00\xff", 6));
}

TEST_F(MaskWriterTest, WritesAllThreeArtifactsWithMetadata)
{
  const std::string source = write_file("in.geojson", "{}");
  const OutputPaths paths = geofence_raster::write_outputs(
    sample_mask(), sample_metadata(source), path("out"), ImageFormat::Pgm);

  EXPECT_TRUE(std::filesystem::exists(path("out.npy")));
  EXPECT_TRUE(std::filesystem::exists(path("out.pgm")));
  EXPECT_TRUE(std::filesystem::exists(path("out.meta.txt")));
  EXPECT_TRUE(std::filesystem::path(paths.npy).is_absolute());
  EXPECT_FALSE(std::filesystem::exists(path("out.npy.part")));

  const auto meta = nlohmann::json::parse(read_all(path("out.meta.txt")));
  EXPECT_EQ(meta["image_format"], "pgm");
  EXPECT_EQ(meta["width"], 3);
  EXPECT_EQ(meta["height"], 2);
  EXPECT_EQ(meta["bounds"]["minx"], 1.0);
  EXPECT_EQ(meta["bounds"]["maxy"], 4.0);
  EXPECT_EQ(meta["crs"], "EPSG:4326");
  EXPECT_EQ(meta["crs_wkt"], "UNKNOWN");
  EXPECT_EQ(meta["inside_value"], 1);
  EXPECT_EQ(meta["outside_value"], 0);
  EXPECT_EQ(meta["inverted"], false);
  EXPECT_EQ(meta["orientation"], "row 0 is North (top), col 0 is West (left)");
  EXPECT_EQ(meta["output_npy"], paths.npy);
  EXPECT_TRUE(std::filesystem::path(meta["source_geojson"].get<std::string>()).is_absolute());
}

TEST_F(MaskWriterTest, PngThroughGdal)
{
  const std::string source = write_file("in.geojson", "{}");
  const OutputPaths paths = geofence_raster::write_outputs(
    sample_mask(), sample_metadata(source), path("out"), ImageFormat::Png);

  const std::string bytes = read_all(path("out.png"));
  ASSERT_GE(bytes.size(), 8u);
  EXPECT_EQ(bytes.substr(0, 8), "\x89PNG\r\n\x1a\n");
  EXPECT_FALSE(std::filesystem::exists(path("out.png.aux.xml")));
  EXPECT_EQ(std::filesystem::path(paths.image).extension().string(), ".png");
}

TEST_F(MaskWriterTest, JpegExtensionIsJpg)
{
  const std::string source = write_file("in.geojson", "{}");
  const OutputPaths paths = geofence_raster::write_outputs(
    sample_mask(), sample_metadata(source), path("out"),
    geofence_raster::parse_image_format("jpeg"));

  EXPECT_TRUE(std::filesystem::exists(path("out.jpg")));
  const std::string bytes = read_all(path("out.jpg"));
  ASSERT_GE(bytes.size(), 2u);
  EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0xFF);
  EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0xD8);
  EXPECT_EQ(nlohmann::json::parse(read_all(paths.metadata))["image_format"], "jpg");
}

TEST_F(MaskWriterTest, FailureLeavesNoFiles)
{
  const std::string prefix = path("missing_dir/out");
  EXPECT_THROW(
    geofence_raster::write_outputs(
      sample_mask(), sample_metadata(path("in.geojson")), prefix, ImageFormat::Pgm),
    geofence_raster::OutputError);
  EXPECT_TRUE(std::filesystem::is_empty(dir_));
}

TEST_F(MaskWriterTest, UnserializableMetadataLeavesNoFiles)
{
  // Legal on Linux, but not representable in JSON.
  const std::string source = path("zone_\xff.geojson");
  EXPECT_THROW(
    geofence_raster::write_outputs(
      sample_mask(), sample_metadata(source), path("out"), ImageFormat::Pgm),
    geofence_raster::OutputError);
  EXPECT_TRUE(std::filesystem::is_empty(dir_));
}

TEST(MaskWriter, ImageFormats)
{
  EXPECT_EQ(geofence_raster::parse_image_format("png"), ImageFormat::Png);
  EXPECT_EQ(geofence_raster::parse_image_format("jpg"), ImageFormat::Jpeg);
  EXPECT_EQ(geofence_raster::parse_image_format("pgm"), ImageFormat::Pgm);
  EXPECT_STREQ(geofence_raster::image_extension(ImageFormat::Jpeg), "jpg");
  EXPECT_THROW(geofence_raster::parse_image_format("tiff"), std::invalid_argument);
}
