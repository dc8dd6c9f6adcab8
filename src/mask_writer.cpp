#include "geofence_raster/mask_writer.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <gdal_priv.h>
#include <rclcpp/rclcpp.hpp>

#include "geofence_raster/errors.hpp"

namespace fs = std::filesystem;

namespace geofence_raster
{

namespace
{

constexpr char kOrientation[] = "row 0 is North (top), col 0 is West (left)";
constexpr char kTempSuffix[] = ".part";

rclcpp::Logger logger()
{
  return rclcpp::get_logger("geofence_raster.writer");
}

struct GdalDatasetCloser {
  void operator()(GDALDataset* dataset) const
  {
    GDALClose(dataset);
  }
};

using GdalDatasetPtr = std::unique_ptr<GDALDataset, GdalDatasetCloser>;

// Restores a CPL config option on scope exit.
class ScopedConfigOption
{
public:
  ScopedConfigOption(const char* key, const char* value)
  : key_(key)
  {
    const char* old = CPLGetConfigOption(key, nullptr);
    if (old) {
      had_value_ = true;
      old_value_ = old;
    }
    CPLSetConfigOption(key, value);
  }

  ~ScopedConfigOption()
  {
    CPLSetConfigOption(key_, had_value_ ? old_value_.c_str() : nullptr);
  }

  ScopedConfigOption(const ScopedConfigOption&) = delete;
  ScopedConfigOption& operator=(const ScopedConfigOption&) = delete;

private:
  const char* key_;
  bool had_value_ = false;
  std::string old_value_;
};

std::string absolute_path(const std::string& path)
{
  std::error_code ec;
  const fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    return path;
  }
  const fs::path canonical = fs::weakly_canonical(absolute, ec);
  return ec ? absolute.string() : canonical.string();
}

void remove_quietly(const std::string& path)
{
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    RCLCPP_WARN(logger(), "Could not remove %s: %s", path.c_str(), ec.message().c_str());
  }
}

}  // namespace

ImageFormat parse_image_format(const std::string& name)
{
  if (name == "png") {
    return ImageFormat::Png;
  }
  if (name == "jpg" || name == "jpeg") {
    return ImageFormat::Jpeg;
  }
  if (name == "pgm") {
    return ImageFormat::Pgm;
  }
  throw std::invalid_argument("Unsupported image format '" + name + "' (png, jpg, jpeg, pgm)");
}

const char* image_extension(ImageFormat format)
{
  switch (format) {
    case ImageFormat::Png:
      return "png";
    case ImageFormat::Jpeg:
      return "jpg";
    case ImageFormat::Pgm:
      return "pgm";
  }
  return "png";
}

OutputPaths output_paths(const std::string& out_prefix, ImageFormat format)
{
  OutputPaths paths;
  paths.npy = out_prefix + ".npy";
  paths.image = out_prefix + "." + image_extension(format);
  paths.metadata = out_prefix + ".meta.txt";
  return paths;
}

std::vector<uint8_t> to_grayscale(const Mask& mask)
{
  std::vector<uint8_t> pixels(mask.cells.size());
  for (std::size_t i = 0; i < mask.cells.size(); ++i) {
    pixels[i] = mask.cells[i] ? 255 : 0;
  }
  return pixels;
}

void write_npy_file(const std::string& path, const Mask& mask)
{
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw OutputError("Failed to open NPY file for writing: " + path);
  }

  std::string header = "{'descr': '|u1', 'fortran_order': False, 'shape': (" +
    std::to_string(mask.height) + ", " + std::to_string(mask.width) + "), }";
  // magic (6) + version (2) + header length (2) + header, padded to 64 bytes
  // and terminated by a newline.
  const std::size_t unpadded = 10 + header.size() + 1;
  header.append((64 - unpadded % 64) % 64, ' ');
  header.push_back('\n');

  const uint16_t header_len = static_cast<uint16_t>(header.size());
  file.write("\x93NUMPY", 6);
  file.put(1);
  file.put(0);
  file.put(static_cast<char>(header_len & 0xff));
  file.put(static_cast<char>((header_len >> 8) & 0xff));
  file << header;
  file.write(reinterpret_cast<const char*>(mask.cells.data()), mask.cells.size());
  if (!file) {
    throw OutputError("Failed to write NPY file: " + path);
  }
}

void write_pgm_file(
  const std::string& path, const std::vector<uint8_t>& data, int width, int height)
{
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw OutputError("Failed to open PGM file for writing: " + path);
  }

  // Write PGM header (P5 = binary grayscale)
  file << "P5\n";
  file << "# Generated by geofence_raster mask_rasterizer\n";
  file << width << " " << height << "\n";
  file << "255\n";

  file.write(reinterpret_cast<const char*>(data.data()), data.size());
  if (!file) {
    throw OutputError("Failed to write PGM file: " + path);
  }
}

void write_gdal_image(
  const std::string& path, const std::vector<uint8_t>& data, int width, int height,
  ImageFormat format)
{
  GDALAllRegister();

  const char* driver_name = format == ImageFormat::Jpeg ? "JPEG" : "PNG";
  GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
  GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name);
  if (!mem_driver || !driver) {
    throw OutputError(std::string("GDAL driver not available: ") + (driver ? "MEM" : driver_name));
  }

  GdalDatasetPtr source(mem_driver->Create("", width, height, 1, GDT_Byte, nullptr));
  if (!source) {
    throw OutputError(std::string("Failed to create in-memory raster: ") + CPLGetLastErrorMsg());
  }
  std::vector<uint8_t> buffer(data);
  const CPLErr err = source->GetRasterBand(1)->RasterIO(
    GF_Write, 0, 0, width, height, buffer.data(), width, height, GDT_Byte, 0, 0);
  if (err != CE_None) {
    throw OutputError(std::string("Failed to fill in-memory raster: ") + CPLGetLastErrorMsg());
  }

  char** options = nullptr;
  if (format == ImageFormat::Jpeg) {
    options = CSLSetNameValue(options, "QUALITY", "95");
  } else {
    options = CSLSetNameValue(options, "ZLEVEL", "9");
  }

  // No .aux.xml sidecar next to the image.
  ScopedConfigOption pam("GDAL_PAM_ENABLED", "NO");
  GdalDatasetPtr written(
    driver->CreateCopy(path.c_str(), source.get(), FALSE, options, nullptr, nullptr));
  CSLDestroy(options);
  if (!written) {
    throw OutputError(
            std::string("Failed to write ") + driver_name + " file " + path + ": " +
            CPLGetLastErrorMsg());
  }
}

nlohmann::ordered_json build_metadata(
  const MaskMetadata& metadata, const OutputPaths& paths, ImageFormat format,
  int width, int height)
{
  nlohmann::ordered_json meta;
  meta["source_geojson"] = metadata.source_path;
  meta["output_npy"] = paths.npy;
  meta["output_image"] = paths.image;
  meta["image_format"] = image_extension(format);
  meta["height"] = height;
  meta["width"] = width;
  meta["bounds"] = {
    {"minx", metadata.bounds.min_x},
    {"miny", metadata.bounds.min_y},
    {"maxx", metadata.bounds.max_x},
    {"maxy", metadata.bounds.max_y}};
  meta["crs"] = metadata.crs;
  meta["crs_wkt"] = metadata.crs_wkt;
  // Documents the classification itself; "inverted" says whether the stored
  // cells were flipped afterwards.
  meta["inside_value"] = 1;
  meta["outside_value"] = 0;
  meta["inverted"] = metadata.inverted;
  meta["containment_strategy"] = metadata.containment_strategy;
  meta["orientation"] = kOrientation;
  return meta;
}

OutputPaths write_outputs(
  const Mask& mask, const MaskMetadata& metadata, const std::string& out_prefix,
  ImageFormat format)
{
  const OutputPaths targets = output_paths(out_prefix, format);
  const OutputPaths temps{
    targets.npy + kTempSuffix, targets.image + kTempSuffix, targets.metadata + kTempSuffix};

  OutputPaths absolute;
  absolute.npy = absolute_path(targets.npy);
  absolute.image = absolute_path(targets.image);
  absolute.metadata = absolute_path(targets.metadata);

  MaskMetadata described = metadata;
  described.source_path = absolute_path(metadata.source_path);

  std::vector<std::string> pending{temps.npy, temps.image, temps.metadata};
  auto discard = [&pending]() {
      for (const auto& path : pending) {
        remove_quietly(path);
      }
    };

  try {
    write_npy_file(temps.npy, mask);

    const std::vector<uint8_t> pixels = to_grayscale(mask);
    if (format == ImageFormat::Pgm) {
      write_pgm_file(temps.image, pixels, mask.width, mask.height);
    } else {
      write_gdal_image(temps.image, pixels, mask.width, mask.height, format);
    }

    std::ofstream file(temps.metadata);
    if (!file.is_open()) {
      throw OutputError("Failed to open metadata file for writing: " + temps.metadata);
    }
    file << build_metadata(described, absolute, format, mask.width, mask.height).dump(2);
    file.close();
    if (!file) {
      throw OutputError("Failed to write metadata file: " + temps.metadata);
    }

    // A target already moved into place is tracked too, so a later failure
    // takes it back out.
    fs::rename(temps.npy, targets.npy);
    pending[0] = targets.npy;
    fs::rename(temps.image, targets.image);
    pending[1] = targets.image;
    fs::rename(temps.metadata, targets.metadata);
  } catch (const fs::filesystem_error& e) {
    discard();
    throw OutputError(std::string("Failed to move outputs into place: ") + e.what());
  } catch (const nlohmann::json::exception& e) {
    // e.g. a source path that is not valid UTF-8
    discard();
    throw OutputError(std::string("Failed to serialize metadata: ") + e.what());
  } catch (const OutputError&) {
    discard();
    throw;
  }

  RCLCPP_INFO(logger(), "Saved: %s", targets.npy.c_str());
  RCLCPP_INFO(logger(), "Saved: %s", targets.image.c_str());
  RCLCPP_INFO(logger(), "Saved: %s", targets.metadata.c_str());
  return absolute;
}

}  // namespace geofence_raster
