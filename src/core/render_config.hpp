#pragma once

#include "colormap.hpp"
#include "idw_interpolator.hpp"
#include "raster_grid.hpp"
#include <optional>
#include <string>
#include <utility>

namespace field_mapper
{

struct render_config_t
{
  double bandwidth = 0.0;                // Gaussian sigma in grid cells, <= 0 disables smoothing
  std::optional<double> bandwidth_km;    // Overrides `bandwidth` when set
  double opacity = 0.8;                  // Uniform alpha multiplier, [0, 1]
  double power = DEFAULT_IDW_POWER;      // IDW exponent
  grid_resolution_t grid;
  double margin_fraction = DEFAULT_GRID_MARGIN;
  legend_style_t legend;
  colormap_e colormap = colormap_e::TURBO;

  // Caller supplied range instead of the one computed from the batch
  std::optional<std::pair<double, double>> range_override;

  bool verbose = false;
};

struct animation_config_t
{
  std::string start_timestamp;
  std::string end_timestamp;
  int intermediate_frame_count = 8;
};

// Label attached to every animation result; interior frames are not measurements
constexpr const char *EXPERIMENTAL_ANIMATION_NOTICE = "Experimental: intermediate frames are linearly interpolated between two measured timestamps and are not measured data.";

} // namespace field_mapper
