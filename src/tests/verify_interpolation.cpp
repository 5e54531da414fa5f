#include "../core/colormap.hpp"
#include "../core/field_smoother.hpp"
#include "../core/global_normalizer.hpp"
#include "../core/idw_interpolator.hpp"
#include "../core/raster_grid.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <numeric>

using namespace field_mapper;

static auto make_sample(double lat, double lon, double value) -> station_sample_t
{
  station_sample_t s;
  s.latitude = lat;
  s.longitude = lon;
  s.parameter = "pH";
  s.timestamp = "Jan-24";
  s.value = value;
  return s;
}

static auto test_grid(int rows, int cols) -> raster_grid_t
{
  auto grid = make_grid(geo::bounds_t{85.30, 19.64, 85.36, 19.70}, grid_resolution_t{rows, cols, 0.0}, 0.0);
  assert(grid);
  return *grid;
}

static auto variance(const scalar_field_t &field) -> double
{
  double mean = std::accumulate(field.values.begin(), field.values.end(), 0.0) / field.values.size();
  double acc = 0.0;
  for (double v : field.values)
    acc += (v - mean) * (v - mean);
  return acc / field.values.size();
}

void test_insufficient_stations()
{
  std::cout << "Testing IDW without stations..." << std::endl;
  auto result = interpolate_idw({}, test_grid(10, 10));
  assert(!result.success);
  assert(result.error == field_error_e::INSUFFICIENT_STATIONS);
}

void test_single_station()
{
  std::cout << "Testing IDW with one station..." << std::endl;
  auto result = interpolate_idw({make_sample(19.66, 85.31, 4.2)}, test_grid(20, 20));
  assert(result.success);
  for (double v : result.field.values)
    assert(v == 4.2);
}

void test_exact_station_value()
{
  std::cout << "Testing cells on a station take its value..." << std::endl;
  auto grid = test_grid(6, 6);
  auto c = grid.center(grid.index(2, 3));
  std::vector<station_sample_t> samples = {make_sample(c.lat, c.lon, 3.0), make_sample(19.69, 85.35, 9.0), make_sample(19.645, 85.305, 1.0)};

  auto result = interpolate_idw(samples, grid);
  assert(result.success);
  assert(result.field.at(2, 3) == 3.0);
}

void test_convex_bounds()
{
  std::cout << "Testing IDW stays within the station values..." << std::endl;
  std::vector<station_sample_t> samples = {make_sample(19.65, 85.31, 2.0), make_sample(19.69, 85.35, 8.0), make_sample(19.66, 85.34, 5.5)};
  auto result = interpolate_idw(samples, test_grid(40, 40), 3.0);
  assert(result.success);
  assert(result.field.min_value() >= 2.0);
  assert(result.field.max_value() <= 8.0);

  // Same input, same output
  auto again = interpolate_idw(samples, test_grid(40, 40), 3.0);
  assert(again.field == result.field);
}

void test_midpoint_scenario()
{
  std::cout << "Testing two-station midpoint maps to the middle of the scale..." << std::endl;
  std::vector<station_sample_t> samples = {make_sample(19.65, 85.31, 2.0), make_sample(19.69, 85.35, 8.0)};

  double mid = idw_at(samples, 85.33, 19.67);
  std::cout << "  midpoint value: " << mid << std::endl;
  assert(std::abs(mid - 5.0) < 1e-9);

  global_range_builder_t builder;
  builder.include(samples);
  auto range = builder.build();
  assert(range);
  assert(range->min() == 2.0 && range->max() == 8.0);

  double t = range->normalize(mid);
  assert(std::abs(t - 0.5) < 1e-9);
  assert(colormap_t::index_of(t) == (COLORMAP_SIZE - 1) / 2);

  // Closer to the low station, lower value
  assert(idw_at(samples, 85.315, 19.655) < 5.0);
  assert(idw_at(samples, 85.345, 19.685) > 5.0);
}

void test_invalid_power()
{
  std::cout << "Testing non-positive power falls back to the default..." << std::endl;
  std::vector<station_sample_t> samples = {make_sample(19.65, 85.31, 2.0), make_sample(19.69, 85.35, 8.0)};
  auto grid = test_grid(8, 8);
  auto bad = interpolate_idw(samples, grid, -1.0);
  auto good = interpolate_idw(samples, grid, DEFAULT_IDW_POWER);
  assert(bad.success);
  assert(bad.field == good.field);
}

void test_kernel()
{
  std::cout << "Testing Gaussian kernel..." << std::endl;
  auto k = gaussian_kernel(1.5);
  assert(k.size() % 2 == 1);
  assert(k.size() == 2 * 6 + 1);
  double sum = std::accumulate(k.begin(), k.end(), 0.0);
  assert(std::abs(sum - 1.0) < 1e-12);
  for (size_t i = 0; i < k.size() / 2; ++i)
    assert(std::abs(k[i] - k[k.size() - 1 - i]) < 1e-15);
  assert(*std::max_element(k.begin(), k.end()) == k[k.size() / 2]);
}

void test_smoothing()
{
  std::cout << "Testing field smoothing..." << std::endl;
  scalar_field_t spike;
  spike.rows = 21;
  spike.cols = 21;
  spike.values.assign(21 * 21, 1.0);
  spike.values[10 * 21 + 10] = 50.0;

  // Bandwidth 0 is the identity
  assert(smooth_field(spike, 0.0) == spike);

  auto smoothed = smooth_field(spike, 2.0);
  assert(smoothed.rows == spike.rows && smoothed.cols == spike.cols);
  assert(variance(smoothed) < variance(spike));
  assert(smoothed.max_value() < spike.max_value());
  assert(smoothed.min_value() >= spike.min_value() - 1e-12);

  // A flat field stays flat, edges included
  scalar_field_t flat;
  flat.rows = 7;
  flat.cols = 13;
  flat.values.assign(7 * 13, 3.25);
  auto flat_smoothed = smooth_field(flat, 3.0);
  for (double v : flat_smoothed.values)
    assert(std::abs(v - 3.25) < 1e-12);
}

void test_wide_bandwidth()
{
  std::cout << "Testing very wide bandwidths..." << std::endl;
  auto k = gaussian_kernel(1e12);
  assert(k.size() == 2 * MAX_KERNEL_RADIUS + 1);
  assert(std::abs(std::accumulate(k.begin(), k.end(), 0.0) - 1.0) < 1e-9);

  assert(gaussian_kernel(3e8, 10).size() == 21);
  assert(gaussian_kernel(1.5, 2).size() == 5);

  scalar_field_t spike;
  spike.rows = 10;
  spike.cols = 10;
  spike.values.assign(100, 0.0);
  spike.values[5 * 10 + 5] = 100.0;

  // Every cell sees the spike once per axis: a flat field at the mean of the window
  for (double sigma : {3e8, 1e12, 1e300})
  {
    auto smoothed = smooth_field(spike, sigma);
    assert(smoothed.rows == 10 && smoothed.cols == 10);
    for (double v : smoothed.values)
    {
      assert(std::isfinite(v));
      assert(std::abs(v - 100.0 / 441.0) < 1e-9);
    }
  }
}

void test_bandwidth_km()
{
  std::cout << "Testing bandwidth conversion from km..." << std::endl;
  auto grid = test_grid(60, 60); // 0.001 degree cells
  double sigma = bandwidth_km_to_cells(0.111, grid);
  assert(std::abs(sigma - 1.0) < 1e-9);
  assert(bandwidth_km_to_cells(0.0, grid) == 0.0);
}

int main()
{
  test_insufficient_stations();
  test_single_station();
  test_exact_station_value();
  test_convex_bounds();
  test_midpoint_scenario();
  test_invalid_power();
  test_kernel();
  test_smoothing();
  test_wide_bandwidth();
  test_bandwidth_km();
  std::cout << "Interpolation Verification Passed" << std::endl;
  return 0;
}
