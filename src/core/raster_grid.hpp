#pragma once

#include "boundary.hpp"
#include "geo_math.hpp"
#include <optional>
#include <vector>

namespace field_mapper
{

// Either an explicit rows x cols count, or a linear cell size in degrees
struct grid_resolution_t
{
  int rows = 400;
  int cols = 400;
  double cell_size_deg = 0.0; // When > 0, rows/cols are derived from the extent
};

// Evenly spaced cell centres over an extent.
// Storage is row-major with row 0 at the northern edge, so a field maps directly onto a north-up image.
struct raster_grid_t
{
  int rows = 0;
  int cols = 0;
  geo::bounds_t bounds; // Outer edges of the cells
  double cell_width = 0.0;  // Degrees of longitude
  double cell_height = 0.0; // Degrees of latitude

  auto cell_count() const -> size_t { return static_cast<size_t>(rows) * static_cast<size_t>(cols); }
  auto index(int row, int col) const -> size_t { return static_cast<size_t>(row) * static_cast<size_t>(cols) + static_cast<size_t>(col); }

  auto lon_at(int col) const -> double { return bounds.min_lon + (col + 0.5) * cell_width; }
  auto lat_at(int row) const -> double { return bounds.max_lat - (row + 0.5) * cell_height; }

  auto center(size_t idx) const -> geo::lon_lat_t
  {
    int row = static_cast<int>(idx / static_cast<size_t>(cols));
    int col = static_cast<int>(idx % static_cast<size_t>(cols));
    return {lon_at(col), lat_at(row)};
  }

  auto operator==(const raster_grid_t &other) const -> bool = default;
};

// One value per grid cell, same layout as raster_grid_t
struct scalar_field_t
{
  int rows = 0;
  int cols = 0;
  std::vector<double> values;

  auto at(int row, int col) const -> double { return values[static_cast<size_t>(row) * static_cast<size_t>(cols) + static_cast<size_t>(col)]; }
  auto min_value() const -> double;
  auto max_value() const -> double;

  auto operator==(const scalar_field_t &other) const -> bool = default;
};

constexpr int MAX_GRID_DIMENSION = 4096;
constexpr double DEFAULT_GRID_MARGIN = 0.02;

// Builds the grid over the region's bounding box inflated by `margin_fraction` on each side.
// Returns nullopt for a non-positive or oversized resolution or an empty extent.
auto make_grid(const geo::bounds_t &extent, const grid_resolution_t &resolution, double margin_fraction = DEFAULT_GRID_MARGIN) -> std::optional<raster_grid_t>;

inline auto make_grid(const boundary_t &boundary, const grid_resolution_t &resolution, double margin_fraction = DEFAULT_GRID_MARGIN) -> std::optional<raster_grid_t>
{
  return make_grid(boundary.bounds(), resolution, margin_fraction);
}

} // namespace field_mapper
