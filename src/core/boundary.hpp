#pragma once

#include "field_error.hpp"
#include "geo_math.hpp"
#include "sample.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace field_mapper
{

using ring_t = std::vector<geo::lon_lat_t>;

struct boundary_result_t;

// Axis aligned extent used when no usable study-area polygon is available
class rect_boundary_t
{
public:
  explicit rect_boundary_t(const geo::bounds_t &bounds);

  auto contains(double lon, double lat) const -> bool;
  auto bounds() const -> const geo::bounds_t &;

private:
  geo::bounds_t m_bounds;
};

// Closed rings of (lon, lat). Inclusion is even-odd over all rings, so inner rings
// act as holes and disjoint outer rings form a multi-polygon.
class polygon_boundary_t
{
public:
  auto contains(double lon, double lat) const -> bool;
  auto bounds() const -> const geo::bounds_t &;
  auto rings() const -> const std::vector<ring_t> &;

  // Sum of |ring area| with holes subtracted, in degrees squared
  auto area() const -> double;

private:
  friend auto make_polygon_boundary(std::vector<ring_t> rings) -> boundary_result_t;

  polygon_boundary_t(std::vector<ring_t> rings, const geo::bounds_t &bounds);

  std::vector<ring_t> m_rings;
  geo::bounds_t m_bounds;
};

// Immutable study-area region. Rendering only relies on contains() and bounds(),
// so the rectangle fallback and real polygons are interchangeable.
class boundary_t
{
public:
  boundary_t(rect_boundary_t rect);
  boundary_t(polygon_boundary_t polygon);

  auto contains(double lon, double lat) const -> bool;
  auto contains(const geo::lon_lat_t &p) const -> bool { return contains(p.lon, p.lat); }
  auto bounds() const -> const geo::bounds_t &;
  auto is_fallback() const -> bool;

private:
  std::variant<rect_boundary_t, polygon_boundary_t> m_region;
};

struct boundary_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  std::optional<polygon_boundary_t> polygon;
};

// Fails with INVALID_BOUNDARY for unclosed rings, rings with fewer than 4 points,
// zero enclosed area or an extent that collapses to a point or a line.
auto make_polygon_boundary(std::vector<ring_t> rings) -> boundary_result_t;

// Bounding box of the samples, padded so a single station still gives an area
auto sample_extent(const std::vector<station_sample_t> &samples, double min_span_deg = 0.01) -> std::optional<geo::bounds_t>;

// Picks the polygon when it is valid, otherwise the rectangular fallback extent.
// A rejected polygon is reported in `issues` as INVALID_BOUNDARY.
auto resolve_boundary(std::optional<std::vector<ring_t>> rings, const geo::bounds_t &fallback, issue_list_t &issues) -> boundary_t;

} // namespace field_mapper
