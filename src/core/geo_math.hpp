#pragma once

#include <algorithm>
#include <cmath>

namespace field_mapper
{
namespace geo
{
// Mean length of one degree of latitude, used to turn km bandwidths into degrees
constexpr double KM_PER_DEGREE = 111.0;

// Geographic point, x = longitude, y = latitude (GeoJSON order)
struct lon_lat_t
{
  double lon = 0.0;
  double lat = 0.0;
};

struct bounds_t
{
  double min_lon = 0.0;
  double min_lat = 0.0;
  double max_lon = 0.0;
  double max_lat = 0.0;

  auto width() const -> double { return max_lon - min_lon; }
  auto height() const -> double { return max_lat - min_lat; }
  auto is_empty() const -> bool { return !(width() > 0.0) || !(height() > 0.0); }

  auto expand(const lon_lat_t &p) -> void
  {
    min_lon = std::min(min_lon, p.lon);
    max_lon = std::max(max_lon, p.lon);
    min_lat = std::min(min_lat, p.lat);
    max_lat = std::max(max_lat, p.lat);
  }

  // Grow every side by `fraction` of the box size
  auto inflated(double fraction) const -> bounds_t
  {
    double dx = width() * fraction;
    double dy = height() * fraction;
    return {min_lon - dx, min_lat - dy, max_lon + dx, max_lat + dy};
  }

  auto operator==(const bounds_t &other) const -> bool = default;
};

// Planar distance in degree space, used for IDW weights
inline auto planar_distance(double lon1, double lat1, double lon2, double lat2) -> double
{
  double dx = lon2 - lon1;
  double dy = lat2 - lat1;
  return std::sqrt(dx * dx + dy * dy);
}

inline auto km_to_degrees(double km) -> double
{
  return km / KM_PER_DEGREE;
}

// Signed shoelace area of a ring (degrees squared). Positive for counter-clockwise.
template <typename Ring> inline auto signed_ring_area(const Ring &ring) -> double
{
  double area = 0.0;
  size_t n = ring.size();
  if (n < 3)
    return 0.0;

  for (size_t i = 0, j = n - 1; i < n; j = i++)
  {
    area += (ring[j].lon * ring[i].lat) - (ring[i].lon * ring[j].lat);
  }
  return area * 0.5;
}

// Even-odd crossing test of a single ring
template <typename Ring> inline auto ring_contains(const Ring &ring, double lon, double lat) -> bool
{
  bool inside = false;
  size_t n = ring.size();
  if (n < 3)
    return false;

  for (size_t i = 0, j = n - 1; i < n; j = i++)
  {
    if (((ring[i].lat > lat) != (ring[j].lat > lat)) && (lon < (ring[j].lon - ring[i].lon) * (lat - ring[i].lat) / (ring[j].lat - ring[i].lat) + ring[i].lon))
    {
      inside = !inside;
    }
  }
  return inside;
}

} // namespace geo
} // namespace field_mapper
