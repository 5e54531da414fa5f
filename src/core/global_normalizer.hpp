#pragma once

#include "raster_grid.hpp"
#include "sample.hpp"
#include <optional>
#include <vector>

namespace field_mapper
{

class global_range_builder_t;

// One min/max for a parameter across every measured timestamp of a batch.
// Only global_range_builder_t can create one, so a range always covers the whole batch.
class global_range_t
{
public:
  auto min() const -> double { return m_min; }
  auto max() const -> double { return m_max; }

  // max == min: normalize() returns the mid-scale constant for every value
  auto is_degenerate() const -> bool { return m_degenerate; }

  // (value - min) / (max - min), clamped to [0, 1]; 0.5 when degenerate
  auto normalize(double value) const -> double;

  auto normalize(const scalar_field_t &field) const -> std::vector<double>;

  auto operator==(const global_range_t &other) const -> bool = default;

private:
  friend class global_range_builder_t;
  friend auto restore_global_range(double min, double max) -> global_range_t;

  global_range_t(double min, double max);

  double m_min = 0.0;
  double m_max = 0.0;
  bool m_degenerate = false;
};

constexpr double DEGENERATE_MID_SCALE = 0.5;

// Accumulates the extremes of every real field (and the raw samples they came from).
// Synthetic animation fields must never be fed in.
class global_range_builder_t
{
public:
  auto include(const scalar_field_t &field) -> void;
  auto include(const std::vector<station_sample_t> &samples) -> void;
  auto include(double value) -> void;

  auto has_values() const -> bool { return m_count > 0; }

  // nullopt when nothing was included
  auto build() const -> std::optional<global_range_t>;

private:
  double m_min = 0.0;
  double m_max = 0.0;
  size_t m_count = 0;
};

// Rebuilds a range previously reported to a caller, e.g. from a saved batch result
auto restore_global_range(double min, double max) -> global_range_t;

} // namespace field_mapper
