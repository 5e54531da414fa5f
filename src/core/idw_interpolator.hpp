#pragma once

#include "field_error.hpp"
#include "raster_grid.hpp"
#include "sample.hpp"
#include <string>
#include <vector>

namespace field_mapper
{

constexpr double DEFAULT_IDW_POWER = 2.0;

// Cells closer than this (degrees) to a station take the station value exactly
constexpr double EXACT_MATCH_TOLERANCE = 1e-9;

struct idw_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  scalar_field_t field;
};

// Inverse Distance Weighting over every grid cell:
//   v(p) = sum(w_i * v_i) / sum(w_i),  w_i = 1 / dist(p, station_i)^power
// A cell coinciding with a station takes that station's value. Fails with
// INSUFFICIENT_STATIONS when `samples` is empty. O(cells * stations).
auto interpolate_idw(const std::vector<station_sample_t> &samples, const raster_grid_t &grid, double power = DEFAULT_IDW_POWER) -> idw_result_t;

// Single-point form of the same estimator
auto idw_at(const std::vector<station_sample_t> &samples, double lon, double lat, double power = DEFAULT_IDW_POWER) -> double;

} // namespace field_mapper
