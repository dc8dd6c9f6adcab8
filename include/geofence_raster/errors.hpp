#pragma once

// Standard library
#include <stdexcept>
#include <string>

namespace geofence_raster
{

class InputError : public std::runtime_error
{
public:
  explicit InputError(const std::string& what)
  : std::runtime_error(what) {}
};

// No polygonal geometry to rasterize, or its parts could not be merged.
class GeometryError : public std::runtime_error
{
public:
  explicit GeometryError(const std::string& what)
  : std::runtime_error(what) {}
};

class OutputError : public std::runtime_error
{
public:
  explicit OutputError(const std::string& what)
  : std::runtime_error(what) {}
};

}  // namespace geofence_raster
