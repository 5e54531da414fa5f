#pragma once

#include "raster_grid.hpp"
#include <vector>

namespace field_mapper
{

// Kernel is truncated at this many standard deviations
constexpr double GAUSSIAN_TRUNCATE = 4.0;

// Widest kernel radius ever built; no grid axis is longer than this
constexpr int MAX_KERNEL_RADIUS = MAX_GRID_DIMENSION;

// Normalised 1D Gaussian weights for `sigma` (cells), length 2 * radius + 1.
// The radius is capped at `max_radius`, so very wide kernels turn into a box.
auto gaussian_kernel(double sigma, int max_radius = MAX_KERNEL_RADIUS) -> std::vector<double>;

// Separable 2D Gaussian blur of raw scalar values. Samples beyond the grid edge
// replicate the nearest edge cell. Returns the input unchanged when sigma <= 0.
auto smooth_field(const scalar_field_t &field, double sigma) -> scalar_field_t;

// Converts a physical bandwidth to a sigma in cells using the mean cell size
auto bandwidth_km_to_cells(double bandwidth_km, const raster_grid_t &grid) -> double;

} // namespace field_mapper
