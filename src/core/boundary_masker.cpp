#include "boundary_masker.hpp"
#include <format>

namespace field_mapper
{

auto build_mask(const raster_grid_t &grid, const boundary_t &boundary) -> boundary_mask_t
{
  boundary_mask_t mask;
  mask.rows = grid.rows;
  mask.cols = grid.cols;
  mask.inside.resize(grid.cell_count(), 0);

  for (int row = 0; row < grid.rows; ++row)
  {
    double lat = grid.lat_at(row);
    for (int col = 0; col < grid.cols; ++col)
    {
      if (boundary.contains(grid.lon_at(col), lat))
      {
        mask.inside[grid.index(row, col)] = 1;
        ++mask.inside_count;
      }
    }
  }
  return mask;
}

auto apply_mask(rgba_image_t &image, const boundary_mask_t &mask) -> mask_result_t
{
  mask_result_t result;

  if (image.width != mask.cols || image.height != mask.rows)
  {
    result.error = field_error_e::OUT_OF_BOUNDS_GRID;
    result.error_message = std::format("image {}x{} does not match mask {}x{}", image.width, image.height, mask.cols, mask.rows);
    return result;
  }

  if (mask.inside_count == 0)
  {
    result.error = field_error_e::OUT_OF_BOUNDS_GRID;
    result.error_message = "no grid cell lies inside the boundary";
    return result;
  }

  for (size_t i = 0; i < mask.inside.size(); ++i)
  {
    if (!mask.inside[i])
      image.pixels[i * 4 + 3] = 0;
  }

  result.success = true;
  result.inside_count = mask.inside_count;
  return result;
}

} // namespace field_mapper
