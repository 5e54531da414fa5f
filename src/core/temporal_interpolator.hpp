#pragma once

#include "field_error.hpp"
#include "sample.hpp"
#include <string>
#include <vector>

namespace field_mapper
{

// Station values for one intermediate animation step between two real timestamps.
// Synthetic: never measured, never used to build a global range.
struct synthetic_step_t
{
  int step_index = 0;     // 1..k; 0 and k + 1 are the real endpoints
  double fraction = 0.0;  // step_index / (k + 1)
  std::string label;      // e.g. "Jan-24 > Feb-24 [1/4]"
  std::vector<station_sample_t> samples;
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
};

// Label used for the synthetic step `step` of `steps` between `start` and `end`
auto synthetic_label(const std::string &start, const std::string &end, int step, int steps) -> std::string;

// Linear interpolation v(f) = v0 + f * (v1 - v0) for every station present at both
// endpoints, for f = 1/(k+1) ... k/(k+1). Stations are matched on (latitude, longitude).
// A step left without stations fails with MISSING_STATION_ACROSS_INTERPOLATION_WINDOW;
// the other steps are unaffected.
auto interpolate_steps(const std::string &start_label, const std::vector<station_sample_t> &start, const std::string &end_label, const std::vector<station_sample_t> &end, int intermediate_count)
    -> std::vector<synthetic_step_t>;

} // namespace field_mapper
