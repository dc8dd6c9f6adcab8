#pragma once

// Standard library
#include <string>

// ROS 2
#include <rclcpp/rclcpp.hpp>

// Project
#include "geofence_raster/pipeline.hpp"

namespace geofence_raster
{

class MaskRasterizerNode : public rclcpp::Node
{
public:
  explicit MaskRasterizerNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

  // Runs the pipeline once. Failures are logged and reported as false.
  bool generate();

private:
  PipelineConfig read_config() const;
};

}  // namespace geofence_raster
