#include "temporal_interpolator.hpp"
#include <cmath>
#include <format>
#include <map>
#include <utility>

namespace field_mapper
{

auto synthetic_label(const std::string &start, const std::string &end, int step, int steps) -> std::string
{
  return std::format("{} > {} [{}/{}]", start, end, step, steps + 1);
}

auto interpolate_steps(const std::string &start_label, const std::vector<station_sample_t> &start, const std::string &end_label, const std::vector<station_sample_t> &end, int intermediate_count)
    -> std::vector<synthetic_step_t>
{
  std::vector<synthetic_step_t> steps;
  if (intermediate_count <= 0)
    return steps;

  using location_t = std::pair<double, double>;
  std::map<location_t, const station_sample_t *> end_by_location;
  for (const auto &s : end)
    end_by_location[{s.latitude, s.longitude}] = &s;

  // Stations missing at either endpoint are left out of every step
  std::vector<std::pair<const station_sample_t *, const station_sample_t *>> pairs;
  for (const auto &s : start)
  {
    auto it = end_by_location.find({s.latitude, s.longitude});
    if (it != end_by_location.end())
      pairs.emplace_back(&s, it->second);
  }

  for (int i = 1; i <= intermediate_count; ++i)
  {
    synthetic_step_t step;
    step.step_index = i;
    step.fraction = static_cast<double>(i) / (intermediate_count + 1);
    step.label = synthetic_label(start_label, end_label, i, intermediate_count);

    for (const auto &[s0, s1] : pairs)
    {
      double v = s0->value + step.fraction * (s1->value - s0->value);
      if (!std::isfinite(v))
        continue;

      station_sample_t sample = *s0;
      sample.timestamp = step.label;
      sample.value = v;
      step.samples.push_back(std::move(sample));
    }

    if (step.samples.empty())
    {
      step.error = field_error_e::MISSING_STATION_ACROSS_INTERPOLATION_WINDOW;
      step.error_message = std::format("no station is present at both {} and {}", start_label, end_label);
    }
    else
    {
      step.success = true;
    }
    steps.push_back(std::move(step));
  }

  return steps;
}

} // namespace field_mapper
