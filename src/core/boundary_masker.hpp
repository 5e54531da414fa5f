#pragma once

#include "boundary.hpp"
#include "colormap.hpp"
#include "field_error.hpp"
#include "raster_grid.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace field_mapper
{

// Inside/outside flag per grid cell centre. The boundary is immutable for a session,
// so one mask serves every frame rendered on the same grid.
struct boundary_mask_t
{
  int rows = 0;
  int cols = 0;
  std::vector<std::uint8_t> inside;
  size_t inside_count = 0;
};

auto build_mask(const raster_grid_t &grid, const boundary_t &boundary) -> boundary_mask_t;

struct mask_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  size_t inside_count = 0;
};

// Sets alpha to 0 for every cell outside the boundary; inside cells keep their alpha.
// Fails with OUT_OF_BOUNDS_GRID, leaving the image untouched, when no cell is inside.
auto apply_mask(rgba_image_t &image, const boundary_mask_t &mask) -> mask_result_t;

inline auto mask_frame(rgba_image_t &image, const raster_grid_t &grid, const boundary_t &boundary) -> mask_result_t
{
  return apply_mask(image, build_mask(grid, boundary));
}

} // namespace field_mapper
