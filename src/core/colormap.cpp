#include "colormap.hpp"
#include <algorithm>
#include <cmath>
#include <format>

#include "stb_easy_font.h"

namespace field_mapper
{

auto to_string(colormap_e map) -> const char *
{
  switch (map)
  {
  case colormap_e::TURBO:
    return "turbo";
  case colormap_e::VIRIDIS:
    return "viridis";
  }
  return "turbo";
}

auto colormap_from_string(const std::string &name) -> std::optional<colormap_e>
{
  if (name == "turbo")
    return colormap_e::TURBO;
  if (name == "viridis")
    return colormap_e::VIRIDIS;
  return std::nullopt;
}

static auto to_byte(double c) -> std::uint8_t
{
  return static_cast<std::uint8_t>(std::lround(std::clamp(c, 0.0, 1.0) * 255.0));
}

// Polynomial fit of Google's Turbo colormap (Mikhailov, 2019)
static auto turbo(double x) -> rgba_t
{
  const double x2 = x * x;
  const double x3 = x2 * x;
  const double x4 = x2 * x2;
  const double x5 = x4 * x;

  double r = 0.13572138 + 4.61539260 * x - 42.66032258 * x2 + 132.13108234 * x3 - 152.94239396 * x4 + 59.28637943 * x5;
  double g = 0.09140261 + 2.19418839 * x + 4.84296658 * x2 - 14.18503333 * x3 + 4.27729857 * x4 + 2.82956604 * x5;
  double b = 0.10667330 + 12.64194608 * x - 60.58204836 * x2 + 110.36276771 * x3 - 89.90310912 * x4 + 27.34824973 * x5;
  return {to_byte(r), to_byte(g), to_byte(b), 255};
}

// Viridis sampled at tenths, linearly interpolated in between
static auto viridis(double x) -> rgba_t
{
  static const std::array<std::array<double, 3>, 11> stops = {{{68, 1, 84},
                                                              {72, 36, 117},
                                                              {65, 68, 135},
                                                              {53, 95, 141},
                                                              {42, 120, 142},
                                                              {33, 145, 140},
                                                              {34, 168, 132},
                                                              {68, 191, 112},
                                                              {122, 209, 81},
                                                              {189, 223, 38},
                                                              {253, 231, 37}}};

  double scaled = std::clamp(x, 0.0, 1.0) * (stops.size() - 1);
  size_t idx = std::min(static_cast<size_t>(scaled), stops.size() - 2);
  double t = scaled - static_cast<double>(idx);

  rgba_t out{0, 0, 0, 255};
  for (size_t c = 0; c < 3; ++c)
  {
    double v = stops[idx][c] + t * (stops[idx + 1][c] - stops[idx][c]);
    out[c] = static_cast<std::uint8_t>(std::lround(v));
  }
  return out;
}

colormap_t::colormap_t(colormap_e kind) : m_kind(kind)
{
  for (int i = 0; i < COLORMAP_SIZE; ++i)
  {
    double x = static_cast<double>(i) / (COLORMAP_SIZE - 1);
    m_table[static_cast<size_t>(i)] = (kind == colormap_e::VIRIDIS) ? viridis(x) : turbo(x);
  }
}

auto colormap_t::index_of(double t) -> int
{
  if (!(t > 0.0))
    return 0;
  if (t >= 1.0)
    return COLORMAP_SIZE - 1;
  return static_cast<int>(t * (COLORMAP_SIZE - 1) + 0.5);
}

auto colormap_t::entry(int index) const -> const rgba_t &
{
  return m_table[static_cast<size_t>(std::clamp(index, 0, COLORMAP_SIZE - 1))];
}

auto colormap_t::map(double t) const -> const rgba_t &
{
  return m_table[static_cast<size_t>(index_of(t))];
}

auto colormap_t::colorize(const std::vector<double> &normalized, int rows, int cols) const -> rgba_image_t
{
  rgba_image_t image;
  image.width = cols;
  image.height = rows;
  image.pixels.resize(normalized.size() * 4);

  for (size_t i = 0; i < normalized.size(); ++i)
  {
    const auto &c = map(normalized[i]);
    std::copy(c.begin(), c.end(), image.pixels.begin() + static_cast<std::ptrdiff_t>(i * 4));
  }
  return image;
}

auto apply_opacity(rgba_image_t &image, double opacity) -> void
{
  double k = std::clamp(opacity, 0.0, 1.0);
  for (size_t i = 3; i < image.pixels.size(); i += 4)
  {
    image.pixels[i] = static_cast<std::uint8_t>(std::lround(image.pixels[i] * k));
  }
}

static auto fill_rect(rgba_image_t &image, int x0, int y0, int x1, int y1, const rgba_t &color) -> void
{
  x0 = std::max(x0, 0);
  y0 = std::max(y0, 0);
  x1 = std::min(x1, image.width);
  y1 = std::min(y1, image.height);
  for (int y = y0; y < y1; ++y)
  {
    for (int x = x0; x < x1; ++x)
    {
      size_t i = (static_cast<size_t>(y) * image.width + x) * 4;
      std::copy(color.begin(), color.end(), image.pixels.begin() + static_cast<std::ptrdiff_t>(i));
    }
  }
}

// stb_easy_font emits axis aligned quads, 4 vertices of {x, y, z, rgba8} each
static auto draw_text(rgba_image_t &image, int x, int y, const std::string &text, const rgba_t &color) -> void
{
  struct vertex_t
  {
    float x, y, z;
    unsigned char rgba[4];
  };

  std::vector<vertex_t> buffer(text.size() * 70 * 4 + 4);
  std::string mutable_text = text;
  int quads = stb_easy_font_print(static_cast<float>(x), static_cast<float>(y), mutable_text.data(), nullptr, buffer.data(), static_cast<int>(buffer.size() * sizeof(vertex_t)));

  for (int q = 0; q < quads; ++q)
  {
    const vertex_t *v = &buffer[static_cast<size_t>(q) * 4];
    float qx0 = std::min({v[0].x, v[1].x, v[2].x, v[3].x});
    float qx1 = std::max({v[0].x, v[1].x, v[2].x, v[3].x});
    float qy0 = std::min({v[0].y, v[1].y, v[2].y, v[3].y});
    float qy1 = std::max({v[0].y, v[1].y, v[2].y, v[3].y});
    fill_rect(image, static_cast<int>(qx0), static_cast<int>(qy0), static_cast<int>(qx1), static_cast<int>(qy1), color);
  }
}

auto render_legend(const colormap_t &colormap, const global_range_t &range, const legend_style_t &style) -> legend_t
{
  constexpr int PAD_Y = 8;
  constexpr int BAR_X = 4;
  constexpr int BAR_WIDTH = 18;
  constexpr int TICK_LENGTH = 4;
  constexpr int GLYPH_HALF_HEIGHT = 3;
  const rgba_t ink = {32, 32, 32, 255};

  legend_t legend;
  auto &image = legend.image;
  image.width = std::max(style.width, BAR_X + BAR_WIDTH + TICK_LENGTH + 1);
  image.height = std::max(style.height, 2 * PAD_Y + 2);
  image.pixels.assign(static_cast<size_t>(image.width) * image.height * 4, 0);

  const int bar_top = PAD_Y;
  const int bar_bottom = image.height - PAD_Y - 1;
  const int bar_span = bar_bottom - bar_top;

  // Colour bar, same table as the rasters, 1.0 at the top
  for (int y = bar_top; y <= bar_bottom; ++y)
  {
    double t = 1.0 - static_cast<double>(y - bar_top) / bar_span;
    fill_rect(image, BAR_X, y, BAR_X + BAR_WIDTH, y + 1, colormap.map(t));
  }

  int tick_count = range.is_degenerate() ? 1 : std::max(style.ticks, 2);
  for (int i = 0; i < tick_count; ++i)
  {
    legend_tick_t tick;
    if (range.is_degenerate())
    {
      tick.value = range.min();
      tick.y = bar_top + bar_span / 2;
    }
    else
    {
      double t = static_cast<double>(i) / (tick_count - 1);
      tick.value = range.min() + t * (range.max() - range.min());
      tick.y = bar_bottom - static_cast<int>(std::lround(t * bar_span));
    }
    tick.label = std::format("{:.2f}", tick.value);

    int tick_x = BAR_X + BAR_WIDTH;
    fill_rect(image, tick_x, tick.y, tick_x + TICK_LENGTH, tick.y + 1, ink);
    draw_text(image, tick_x + TICK_LENGTH + 2, tick.y - GLYPH_HALF_HEIGHT, tick.label, ink);

    legend.ticks.push_back(std::move(tick));
  }

  return legend;
}

} // namespace field_mapper
