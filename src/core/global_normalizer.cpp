#include "global_normalizer.hpp"
#include <algorithm>
#include <cmath>

namespace field_mapper
{

global_range_t::global_range_t(double min, double max) : m_min(min), m_max(max), m_degenerate(!(max > min))
{
}

auto global_range_t::normalize(double value) const -> double
{
  if (m_degenerate)
    return DEGENERATE_MID_SCALE;
  return std::clamp((value - m_min) / (m_max - m_min), 0.0, 1.0);
}

auto global_range_t::normalize(const scalar_field_t &field) const -> std::vector<double>
{
  std::vector<double> out(field.values.size());
  std::transform(field.values.begin(), field.values.end(), out.begin(), [this](double v) { return normalize(v); });
  return out;
}

auto global_range_builder_t::include(double value) -> void
{
  if (!std::isfinite(value))
    return;

  if (m_count == 0)
  {
    m_min = value;
    m_max = value;
  }
  else
  {
    m_min = std::min(m_min, value);
    m_max = std::max(m_max, value);
  }
  ++m_count;
}

auto global_range_builder_t::include(const scalar_field_t &field) -> void
{
  for (double v : field.values)
    include(v);
}

auto global_range_builder_t::include(const std::vector<station_sample_t> &samples) -> void
{
  for (const auto &s : samples)
    include(s.value);
}

auto global_range_builder_t::build() const -> std::optional<global_range_t>
{
  if (m_count == 0)
    return std::nullopt;
  return global_range_t(m_min, m_max);
}

auto restore_global_range(double min, double max) -> global_range_t
{
  if (max < min)
    std::swap(min, max);
  return global_range_t(min, max);
}

} // namespace field_mapper
