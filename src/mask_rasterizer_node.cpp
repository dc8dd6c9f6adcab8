#include "geofence_raster/mask_rasterizer_node.hpp"

#include <exception>
#include <stdexcept>

#include "geofence_raster/errors.hpp"

namespace geofence_raster
{

MaskRasterizerNode::MaskRasterizerNode(const rclcpp::NodeOptions& options)
: Node("mask_rasterizer", options)
{
  this->declare_parameter<std::string>("input_file", "boundary.geojson");
  this->declare_parameter<std::string>("out_prefix", "mask");
  this->declare_parameter<int64_t>("width", 50);
  this->declare_parameter<int64_t>("height", 50);
  this->declare_parameter<std::string>("format", "png");
  this->declare_parameter<bool>("project_utm", false);
  this->declare_parameter<bool>("invert", false);
  this->declare_parameter<std::string>("containment_strategy", "auto");
  this->declare_parameter<int64_t>(
    "max_bulk_points", static_cast<int64_t>(ContainmentCapabilities{}.max_bulk_points));

  RCLCPP_INFO(this->get_logger(), "Mask Rasterizer initialized");
  RCLCPP_INFO(this->get_logger(), "  Input: %s",
    this->get_parameter("input_file").as_string().c_str());
  RCLCPP_INFO(this->get_logger(), "  Output prefix: %s",
    this->get_parameter("out_prefix").as_string().c_str());
  RCLCPP_INFO(this->get_logger(), "  Size: %ldx%ld (%s)",
    static_cast<long>(this->get_parameter("width").as_int()),
    static_cast<long>(this->get_parameter("height").as_int()),
    this->get_parameter("format").as_string().c_str());
  RCLCPP_INFO(this->get_logger(), "  Project to UTM: %s",
    this->get_parameter("project_utm").as_bool() ? "yes" : "no");
  RCLCPP_INFO(this->get_logger(), "  Invert: %s",
    this->get_parameter("invert").as_bool() ? "yes" : "no");
  RCLCPP_INFO(this->get_logger(), "  Containment: %s",
    this->get_parameter("containment_strategy").as_string().c_str());
}

PipelineConfig MaskRasterizerNode::read_config() const
{
  PipelineConfig config;
  config.input_file = this->get_parameter("input_file").as_string();
  config.out_prefix = this->get_parameter("out_prefix").as_string();
  config.width = to_dimension("width", this->get_parameter("width").as_int());
  config.height = to_dimension("height", this->get_parameter("height").as_int());
  config.format = this->get_parameter("format").as_string();
  config.project_utm = this->get_parameter("project_utm").as_bool();
  config.invert = this->get_parameter("invert").as_bool();
  config.containment_strategy = this->get_parameter("containment_strategy").as_string();

  const int64_t max_bulk_points = this->get_parameter("max_bulk_points").as_int();
  if (max_bulk_points < 0) {
    throw std::invalid_argument(
            "max_bulk_points must not be negative, got " + std::to_string(max_bulk_points));
  }
  config.max_bulk_points = static_cast<std::size_t>(max_bulk_points);
  return config;
}

bool MaskRasterizerNode::generate()
{
  RCLCPP_INFO(this->get_logger(), "Starting mask generation...");

  try {
    const PipelineResult result = run_pipeline(read_config());
    RCLCPP_INFO(
      this->get_logger(), "Mask generation completed successfully (%zu warning(s))",
      result.warnings.size());
    return true;
  } catch (const InputError& e) {
    RCLCPP_ERROR(this->get_logger(), "Failed to load boundary: %s", e.what());
  } catch (const GeometryError& e) {
    RCLCPP_ERROR(this->get_logger(), "Nothing to rasterize: %s", e.what());
  } catch (const std::invalid_argument& e) {
    RCLCPP_ERROR(this->get_logger(), "Invalid configuration: %s", e.what());
  } catch (const std::exception& e) {
    RCLCPP_ERROR(this->get_logger(), "Failed to generate mask: %s", e.what());
  }
  return false;
}

}  // namespace geofence_raster

int main(int argc, char * argv[])
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<geofence_raster::MaskRasterizerNode>();

  bool success = node->generate();

  rclcpp::shutdown();
  return success ? 0 : 1;
}
