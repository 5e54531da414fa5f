#include "raster_grid.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace field_mapper
{

auto scalar_field_t::min_value() const -> double
{
  return values.empty() ? 0.0 : *std::min_element(values.begin(), values.end());
}

auto scalar_field_t::max_value() const -> double
{
  return values.empty() ? 0.0 : *std::max_element(values.begin(), values.end());
}

auto make_grid(const geo::bounds_t &extent, const grid_resolution_t &resolution, double margin_fraction) -> std::optional<raster_grid_t>
{
  if (extent.is_empty())
  {
    std::cerr << "[ERROR] Grid extent is empty" << std::endl;
    return std::nullopt;
  }

  raster_grid_t grid;
  grid.bounds = extent.inflated(std::max(0.0, margin_fraction));

  if (resolution.cell_size_deg > 0.0)
  {
    double cols = std::ceil(grid.bounds.width() / resolution.cell_size_deg);
    double rows = std::ceil(grid.bounds.height() / resolution.cell_size_deg);
    if (!(cols >= 1.0 && cols <= MAX_GRID_DIMENSION && rows >= 1.0 && rows <= MAX_GRID_DIMENSION))
    {
      std::cerr << "[ERROR] Cell size " << resolution.cell_size_deg << " gives a " << rows << "x" << cols << " grid, outside 1.." << MAX_GRID_DIMENSION << std::endl;
      return std::nullopt;
    }
    grid.cols = static_cast<int>(cols);
    grid.rows = static_cast<int>(rows);
  }
  else
  {
    grid.rows = resolution.rows;
    grid.cols = resolution.cols;
  }

  if (grid.rows < 1 || grid.cols < 1 || grid.rows > MAX_GRID_DIMENSION || grid.cols > MAX_GRID_DIMENSION)
  {
    std::cerr << "[ERROR] Grid resolution " << grid.rows << "x" << grid.cols << " outside 1.." << MAX_GRID_DIMENSION << std::endl;
    return std::nullopt;
  }

  grid.cell_width = grid.bounds.width() / grid.cols;
  grid.cell_height = grid.bounds.height() / grid.rows;
  return grid;
}

} // namespace field_mapper
