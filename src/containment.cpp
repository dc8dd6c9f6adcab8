#include "geofence_raster/containment.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace geofence_raster
{

namespace
{

bool outside_bounds(const Bounds& bounds, double x, double y)
{
  return x < bounds.min_x || x > bounds.max_x || y < bounds.min_y || y > bounds.max_y;
}

void append_ring_edges(const Ring& ring, std::size_t polygon, std::vector<Edge>& edges)
{
  const std::size_t n = ring.size();
  for (std::size_t i = 0; i < n; ++i) {
    edges.push_back(Edge{ring[i], ring[(i + 1) % n], polygon});
  }
}

// Crossings of one horizontal line, per polygon, sorted by x with suffix
// sums of their winding directions.
class Scanline
{
public:
  Scanline(const std::vector<Edge>& edges, std::size_t polygon_count, const Bounds& bounds)
  : edges_(edges), bounds_(bounds), parts_(polygon_count) {}

  void reset(double y)
  {
    y_ = y;
    for (auto& part : parts_) {
      part.crossings.clear();
      part.touching.clear();
    }
    for (const auto& e : edges_) {
      auto& part = parts_[e.polygon];
      if (y >= std::min(e.a.y, e.b.y) && y <= std::max(e.a.y, e.b.y)) {
        part.touching.push_back(&e);
      }
      if (spans(e, y)) {
        part.crossings.emplace_back(crossing_x(e, y), winding_direction(e));
      }
    }
    for (auto& part : parts_) {
      std::sort(part.crossings.begin(), part.crossings.end());
      part.suffix.assign(part.crossings.size() + 1, 0);
      for (std::size_t k = part.crossings.size(); k-- > 0; ) {
        part.suffix[k] = part.suffix[k + 1] + part.crossings[k].second;
      }
    }
  }

  double y() const {return y_;}

  bool contains(double x) const
  {
    if (outside_bounds(bounds_, x, y_)) {
      return false;
    }
    for (const auto& part : parts_) {
      const bool boundary = std::any_of(
        part.touching.begin(), part.touching.end(),
        [&](const Edge* e) {return on_edge(*e, x, y_);});
      if (boundary) {
        continue;
      }
      // First crossing strictly to the right of x.
      const auto it = std::upper_bound(
        part.crossings.begin(), part.crossings.end(), x,
        [](double value, const std::pair<double, int>& c) {return value < c.first;});
      if (part.suffix[it - part.crossings.begin()] != 0) {
        return true;
      }
    }
    return false;
  }

private:
  struct Part {
    std::vector<std::pair<double, int>> crossings;
    std::vector<int> suffix;
    std::vector<const Edge*> touching;
  };

  const std::vector<Edge>& edges_;
  Bounds bounds_;
  std::vector<Part> parts_;
  double y_ = 0.0;
};

}  // namespace

std::vector<Edge> collect_edges(const MultiPolygon& polygons)
{
  std::vector<Edge> edges;
  for (std::size_t p = 0; p < polygons.size(); ++p) {
    append_ring_edges(polygons[p].exterior, p, edges);
    for (const auto& hole : polygons[p].holes) {
      append_ring_edges(hole, p, edges);
    }
  }
  return edges;
}

void contains_xy(
  const MultiPolygon& polygons, const std::vector<double>& x, const std::vector<double>& y,
  std::vector<std::uint8_t>& out)
{
  if (x.size() != y.size()) {
    throw std::invalid_argument("contains_xy: x and y differ in length");
  }
  out.assign(x.size(), 0);
  if (x.empty() || polygons.empty()) {
    return;
  }

  const std::vector<Edge> edges = collect_edges(polygons);
  Scanline scanline(edges, polygons.size(), compute_bounds(polygons));
  bool primed = false;
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (!primed || y[i] != scanline.y()) {
      scanline.reset(y[i]);
      primed = true;
    }
    out[i] = scanline.contains(x[i]) ? 1 : 0;
  }
}

PreparedPolygon::PreparedPolygon(const MultiPolygon& polygons)
: edges_(collect_edges(polygons)),
  bounds_(compute_bounds(polygons)),
  band_height_(0.0)
{
  const std::size_t band_count =
    std::min<std::size_t>(std::max<std::size_t>(edges_.size() / 2, 1), 4096);
  const double extent = bounds_.max_y - bounds_.min_y;
  if (extent > 0.0) {
    band_height_ = extent / static_cast<double>(band_count);
    bands_.resize(band_count);
  } else {
    bands_.resize(1);
  }

  // band_index() is monotone in y, so every y an edge covers maps into
  // [band_index(low), band_index(high)].
  for (std::size_t i = 0; i < edges_.size(); ++i) {
    const Edge& e = edges_[i];
    const std::size_t lo = band_index(std::min(e.a.y, e.b.y));
    const std::size_t hi = band_index(std::max(e.a.y, e.b.y));
    for (std::size_t band = lo; band <= hi; ++band) {
      bands_[band].push_back(i);
    }
  }
}

std::size_t PreparedPolygon::band_index(double y) const
{
  if (band_height_ <= 0.0) {
    return 0;
  }
  const double t = (y - bounds_.min_y) / band_height_;
  if (!(t > 0.0)) {
    return 0;
  }
  return std::min(static_cast<std::size_t>(t), bands_.size() - 1);
}

bool PreparedPolygon::contains(double x, double y) const
{
  if (outside_bounds(bounds_, x, y)) {
    return false;
  }

  const auto& band = bands_[band_index(y)];
  std::size_t i = 0;
  while (i < band.size()) {
    const std::size_t polygon = edges_[band[i]].polygon;
    int winding = 0;
    bool boundary = false;
    for (; i < band.size() && edges_[band[i]].polygon == polygon; ++i) {
      const Edge& e = edges_[band[i]];
      if (on_edge(e, x, y)) {
        boundary = true;
      } else if (spans(e, y) && crossing_x(e, y) > x) {
        winding += winding_direction(e);
      }
    }
    if (!boundary && winding != 0) {
      return true;
    }
  }
  return false;
}

ContainmentMode parse_containment_mode(const std::string& name)
{
  if (name == "auto") {
    return ContainmentMode::Auto;
  }
  if (name == "bulk") {
    return ContainmentMode::Bulk;
  }
  if (name == "prepared") {
    return ContainmentMode::Prepared;
  }
  throw std::invalid_argument(
          "Unknown containment strategy '" + name + "' (expected auto, bulk or prepared)");
}

const char* to_string(ContainmentMode mode)
{
  switch (mode) {
    case ContainmentMode::Auto:
      return "auto";
    case ContainmentMode::Bulk:
      return "bulk";
    case ContainmentMode::Prepared:
      return "prepared";
  }
  return "unknown";
}

void classify_bulk(
  const MultiPolygon& polygons, const SampleGrid& grid, std::vector<std::uint8_t>& cells)
{
  const std::size_t width = grid.xs.size();
  const std::size_t height = grid.ys.size();

  // Full cross-product of the sample axes, row-major like the mask.
  std::vector<double> x(width * height);
  std::vector<double> y(width * height);
  for (std::size_t row = 0; row < height; ++row) {
    std::copy(grid.xs.begin(), grid.xs.end(), x.begin() + row * width);
    std::fill_n(y.begin() + row * width, width, grid.ys[row]);
  }
  contains_xy(polygons, x, y, cells);
}

void classify_prepared(
  const MultiPolygon& polygons, const SampleGrid& grid, std::vector<std::uint8_t>& cells)
{
  const std::size_t width = grid.xs.size();
  const std::size_t height = grid.ys.size();
  cells.assign(width * height, 0);
  if (polygons.empty()) {
    return;
  }

  PreparedPolygon prepared(polygons);
  for (std::size_t row = 0; row < height; ++row) {
    for (std::size_t col = 0; col < width; ++col) {
      if (prepared.contains(grid.xs[col], grid.ys[row])) {
        cells[row * width + col] = 1;
      }
    }
  }
}

ContainmentStrategy select_strategy(
  ContainmentMode mode, std::size_t point_count, const ContainmentCapabilities& capabilities)
{
  const ContainmentStrategy bulk{"bulk", &classify_bulk};
  const ContainmentStrategy prepared{"prepared", &classify_prepared};
  const bool bulk_available = point_count <= capabilities.max_bulk_points;

  switch (mode) {
    case ContainmentMode::Bulk:
      if (!bulk_available) {
        throw std::invalid_argument(
                "Bulk containment supports at most " +
                std::to_string(capabilities.max_bulk_points) + " points, grid has " +
                std::to_string(point_count));
      }
      return bulk;
    case ContainmentMode::Prepared:
      return prepared;
    case ContainmentMode::Auto:
      break;
  }
  return bulk_available ? bulk : prepared;
}

}  // namespace geofence_raster
