#include "boundary.hpp"
#include <cmath>
#include <format>
#include <iostream>
#include <limits>

namespace field_mapper
{

// Rings smaller than this (degrees squared) are treated as having no area
constexpr double MIN_AREA = 1e-12;

rect_boundary_t::rect_boundary_t(const geo::bounds_t &bounds) : m_bounds(bounds)
{
}

auto rect_boundary_t::contains(double lon, double lat) const -> bool
{
  return lon >= m_bounds.min_lon && lon <= m_bounds.max_lon && lat >= m_bounds.min_lat && lat <= m_bounds.max_lat;
}

auto rect_boundary_t::bounds() const -> const geo::bounds_t &
{
  return m_bounds;
}

polygon_boundary_t::polygon_boundary_t(std::vector<ring_t> rings, const geo::bounds_t &bounds) : m_rings(std::move(rings)), m_bounds(bounds)
{
}

auto polygon_boundary_t::contains(double lon, double lat) const -> bool
{
  if (lon < m_bounds.min_lon || lon > m_bounds.max_lon || lat < m_bounds.min_lat || lat > m_bounds.max_lat)
    return false;

  bool inside = false;
  for (const auto &ring : m_rings)
  {
    if (geo::ring_contains(ring, lon, lat))
      inside = !inside;
  }
  return inside;
}

auto polygon_boundary_t::bounds() const -> const geo::bounds_t &
{
  return m_bounds;
}

auto polygon_boundary_t::rings() const -> const std::vector<ring_t> &
{
  return m_rings;
}

auto polygon_boundary_t::area() const -> double
{
  // A ring nested in an odd number of other rings is a hole
  double total = 0.0;
  for (size_t i = 0; i < m_rings.size(); ++i)
  {
    int depth = 0;
    const auto &probe = m_rings[i].front();
    for (size_t j = 0; j < m_rings.size(); ++j)
    {
      if (i != j && geo::ring_contains(m_rings[j], probe.lon, probe.lat))
        ++depth;
    }
    double a = std::abs(geo::signed_ring_area(m_rings[i]));
    total += (depth % 2 == 0) ? a : -a;
  }
  return total;
}

boundary_t::boundary_t(rect_boundary_t rect) : m_region(std::move(rect))
{
}

boundary_t::boundary_t(polygon_boundary_t polygon) : m_region(std::move(polygon))
{
}

auto boundary_t::contains(double lon, double lat) const -> bool
{
  return std::visit([&](const auto &region) { return region.contains(lon, lat); }, m_region);
}

auto boundary_t::bounds() const -> const geo::bounds_t &
{
  return std::visit([](const auto &region) -> const geo::bounds_t & { return region.bounds(); }, m_region);
}

auto boundary_t::is_fallback() const -> bool
{
  return std::holds_alternative<rect_boundary_t>(m_region);
}

auto make_polygon_boundary(std::vector<ring_t> rings) -> boundary_result_t
{
  boundary_result_t result;
  result.error = field_error_e::INVALID_BOUNDARY;

  if (rings.empty())
  {
    result.error_message = "polygon has no rings";
    return result;
  }

  geo::bounds_t bounds{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};

  for (size_t i = 0; i < rings.size(); ++i)
  {
    const auto &ring = rings[i];
    if (ring.size() < 4)
    {
      result.error_message = std::format("ring {} has {} points, a closed ring needs at least 4", i, ring.size());
      return result;
    }

    const auto &first = ring.front();
    const auto &last = ring.back();
    if (first.lon != last.lon || first.lat != last.lat)
    {
      result.error_message = std::format("ring {} is not closed", i);
      return result;
    }

    for (const auto &p : ring)
    {
      if (!std::isfinite(p.lon) || !std::isfinite(p.lat))
      {
        result.error_message = std::format("ring {} has a non-numeric vertex", i);
        return result;
      }
      bounds.expand(p);
    }
  }

  if (bounds.is_empty())
  {
    result.error_message = "polygon degenerates to a point or a line";
    return result;
  }

  polygon_boundary_t polygon(std::move(rings), bounds);
  if (!(polygon.area() > MIN_AREA))
  {
    result.error_message = "polygon encloses no area";
    return result;
  }

  result.success = true;
  result.error = field_error_e::NONE;
  result.polygon = std::move(polygon);
  return result;
}

auto sample_extent(const std::vector<station_sample_t> &samples, double min_span_deg) -> std::optional<geo::bounds_t>
{
  if (samples.empty())
    return std::nullopt;

  geo::bounds_t bounds{samples.front().longitude, samples.front().latitude, samples.front().longitude, samples.front().latitude};
  for (const auto &s : samples)
    bounds.expand({s.longitude, s.latitude});

  // Pad collapsed axes around their centre
  if (bounds.width() < min_span_deg)
  {
    double c = (bounds.min_lon + bounds.max_lon) * 0.5;
    bounds.min_lon = c - min_span_deg * 0.5;
    bounds.max_lon = c + min_span_deg * 0.5;
  }
  if (bounds.height() < min_span_deg)
  {
    double c = (bounds.min_lat + bounds.max_lat) * 0.5;
    bounds.min_lat = c - min_span_deg * 0.5;
    bounds.max_lat = c + min_span_deg * 0.5;
  }
  return bounds;
}

auto resolve_boundary(std::optional<std::vector<ring_t>> rings, const geo::bounds_t &fallback, issue_list_t &issues) -> boundary_t
{
  if (rings)
  {
    auto result = make_polygon_boundary(std::move(*rings));
    if (result.success)
      return boundary_t(std::move(*result.polygon));

    std::cerr << "[WARN] Invalid boundary (" << result.error_message << "), using rectangular extent" << std::endl;
    issues.push_back({"boundary", field_error_e::INVALID_BOUNDARY, result.error_message});
  }
  return boundary_t(rect_boundary_t(fallback));
}

} // namespace field_mapper
