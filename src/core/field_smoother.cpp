#include "field_smoother.hpp"
#include "geo_math.hpp"
#include <algorithm>
#include <cmath>

namespace field_mapper
{

auto gaussian_kernel(double sigma, int max_radius) -> std::vector<double>
{
  if (!(sigma > 0.0))
    return {1.0};

  // Clamp in double before the cast; GAUSSIAN_TRUNCATE * sigma may not fit an int
  const double limit = std::clamp(max_radius, 1, MAX_KERNEL_RADIUS);
  const int radius = static_cast<int>(std::clamp(std::floor(GAUSSIAN_TRUNCATE * sigma + 0.5), 1.0, limit));

  std::vector<double> kernel(static_cast<size_t>(2 * radius + 1));
  double sum = 0.0;
  double denom = 2.0 * sigma * sigma;
  for (int i = -radius; i <= radius; ++i)
  {
    double w = std::exp(-(i * i) / denom);
    kernel[static_cast<size_t>(i + radius)] = w;
    sum += w;
  }

  for (auto &w : kernel)
    w /= sum;
  return kernel;
}

auto smooth_field(const scalar_field_t &field, double sigma) -> scalar_field_t
{
  if (!(sigma > 0.0) || field.values.empty())
    return field;

  // Taps past the far edge only repeat the edge value, so the grid size bounds the radius
  const auto kernel = gaussian_kernel(sigma, std::max(field.rows, field.cols));
  const int radius = static_cast<int>(kernel.size() / 2);
  const int rows = field.rows;
  const int cols = field.cols;

  auto clamp_index = [](int i, int n) { return std::clamp(i, 0, n - 1); };

  // Horizontal pass
  std::vector<double> tmp(field.values.size());
  for (int r = 0; r < rows; ++r)
  {
    const double *src = field.values.data() + static_cast<size_t>(r) * cols;
    double *dst = tmp.data() + static_cast<size_t>(r) * cols;
    for (int c = 0; c < cols; ++c)
    {
      double acc = 0.0;
      for (int k = -radius; k <= radius; ++k)
        acc += kernel[static_cast<size_t>(k + radius)] * src[clamp_index(c + k, cols)];
      dst[c] = acc;
    }
  }

  // Vertical pass
  scalar_field_t out;
  out.rows = rows;
  out.cols = cols;
  out.values.resize(field.values.size());
  for (int r = 0; r < rows; ++r)
  {
    for (int c = 0; c < cols; ++c)
    {
      double acc = 0.0;
      for (int k = -radius; k <= radius; ++k)
        acc += kernel[static_cast<size_t>(k + radius)] * tmp[static_cast<size_t>(clamp_index(r + k, rows)) * cols + c];
      out.values[static_cast<size_t>(r) * cols + c] = acc;
    }
  }

  return out;
}

auto bandwidth_km_to_cells(double bandwidth_km, const raster_grid_t &grid) -> double
{
  double cell_deg = 0.5 * (grid.cell_width + grid.cell_height);
  if (!(cell_deg > 0.0) || !(bandwidth_km > 0.0))
    return 0.0;
  return geo::km_to_degrees(bandwidth_km) / cell_deg;
}

} // namespace field_mapper
