#pragma once

#include "global_normalizer.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace field_mapper
{

enum class colormap_e
{
  TURBO,
  VIRIDIS
};

auto to_string(colormap_e map) -> const char *;
auto colormap_from_string(const std::string &name) -> std::optional<colormap_e>;

using rgba_t = std::array<std::uint8_t, 4>;

// Straight (non-premultiplied) RGBA8, row-major, row 0 at the top
struct rgba_image_t
{
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> pixels;

  auto pixel(int x, int y) const -> rgba_t
  {
    size_t i = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
    return {pixels[i], pixels[i + 1], pixels[i + 2], pixels[i + 3]};
  }
  auto alpha(size_t cell) const -> std::uint8_t { return pixels[cell * 4 + 3]; }

  auto operator==(const rgba_image_t &other) const -> bool = default;
};

// Odd size so the centre of the scale has its own entry
constexpr int COLORMAP_SIZE = 255;

class colormap_t
{
public:
  explicit colormap_t(colormap_e kind = colormap_e::TURBO);

  auto kind() const -> colormap_e { return m_kind; }

  // Table position of a normalised value; monotonic non-decreasing in `t`
  static auto index_of(double t) -> int;

  auto entry(int index) const -> const rgba_t &;

  // Opaque colour for a normalised value
  auto map(double t) const -> const rgba_t &;

  // Full raster at grid resolution, alpha 255 everywhere
  auto colorize(const std::vector<double> &normalized, int rows, int cols) const -> rgba_image_t;

private:
  colormap_e m_kind;
  std::array<rgba_t, COLORMAP_SIZE> m_table;
};

// Multiplies every alpha by `opacity` (clamped to [0, 1]); RGB is left untouched
auto apply_opacity(rgba_image_t &image, double opacity) -> void;

struct legend_style_t
{
  int width = 80;
  int height = 300;
  int ticks = 7; // Including both ends; 2 gives min and max only
};

struct legend_tick_t
{
  double value = 0.0;
  std::string label;
  int y = 0;
};

struct legend_t
{
  rgba_image_t image;
  std::vector<legend_tick_t> ticks;
};

// Vertical colour bar, max at the top, labelled with values of `range`
auto render_legend(const colormap_t &colormap, const global_range_t &range, const legend_style_t &style = {}) -> legend_t;

} // namespace field_mapper
