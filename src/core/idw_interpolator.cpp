#include "idw_interpolator.hpp"
#include "geo_math.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace field_mapper
{

auto idw_at(const std::vector<station_sample_t> &samples, double lon, double lat, double power) -> double
{
  if (samples.size() == 1)
    return samples.front().value;

  // Nearest station first: an exact hit short-circuits, and its distance scales the
  // weights to (d_min / d_i)^power so large exponents can not overflow.
  double d_min = std::numeric_limits<double>::max();
  size_t nearest = 0;
  for (size_t i = 0; i < samples.size(); ++i)
  {
    double d = geo::planar_distance(lon, lat, samples[i].longitude, samples[i].latitude);
    if (d < d_min)
    {
      d_min = d;
      nearest = i;
    }
  }

  if (d_min <= EXACT_MATCH_TOLERANCE)
    return samples[nearest].value;

  double weighted_sum = 0.0;
  double weight_total = 0.0;
  for (const auto &s : samples)
  {
    double d = geo::planar_distance(lon, lat, s.longitude, s.latitude);
    double w = std::pow(d_min / d, power);
    weighted_sum += w * s.value;
    weight_total += w;
  }
  return weighted_sum / weight_total;
}

auto interpolate_idw(const std::vector<station_sample_t> &samples, const raster_grid_t &grid, double power) -> idw_result_t
{
  idw_result_t result;

  if (samples.empty())
  {
    result.error = field_error_e::INSUFFICIENT_STATIONS;
    result.error_message = "no stations to interpolate from";
    return result;
  }

  if (!(power > 0.0) || !std::isfinite(power))
  {
    std::cerr << "[WARN] IDW power " << power << " is not positive, using " << DEFAULT_IDW_POWER << std::endl;
    power = DEFAULT_IDW_POWER;
  }

  result.field.rows = grid.rows;
  result.field.cols = grid.cols;
  result.field.values.resize(grid.cell_count());

  for (int row = 0; row < grid.rows; ++row)
  {
    double lat = grid.lat_at(row);
    for (int col = 0; col < grid.cols; ++col)
    {
      result.field.values[grid.index(row, col)] = idw_at(samples, grid.lon_at(col), lat, power);
    }
  }

  result.success = true;
  return result;
}

} // namespace field_mapper
