#include "../core/colormap.hpp"
#include "../core/global_normalizer.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace field_mapper;

static auto field_of(std::vector<double> values) -> scalar_field_t
{
  scalar_field_t f;
  f.rows = 1;
  f.cols = static_cast<int>(values.size());
  f.values = std::move(values);
  return f;
}

void test_range_builder()
{
  std::cout << "Testing global range accumulation..." << std::endl;
  global_range_builder_t empty;
  assert(!empty.has_values());
  assert(!empty.build());

  global_range_builder_t builder;
  builder.include(field_of({3.0, 4.0, 5.0}));
  builder.include(field_of({2.5, 7.5}));
  builder.include(std::numeric_limits<double>::quiet_NaN());
  auto range = builder.build();
  assert(range);
  assert(range->min() == 2.5);
  assert(range->max() == 7.5);
  assert(!range->is_degenerate());

  assert(range->normalize(2.5) == 0.0);
  assert(range->normalize(7.5) == 1.0);
  assert(range->normalize(5.0) == 0.5);
  assert(range->normalize(-100.0) == 0.0);
  assert(range->normalize(100.0) == 1.0);

  auto n = range->normalize(field_of({2.5, 5.0, 7.5}));
  assert(n.size() == 3 && n[0] == 0.0 && n[1] == 0.5 && n[2] == 1.0);
}

void test_degenerate_range()
{
  std::cout << "Testing degenerate range..." << std::endl;
  global_range_builder_t builder;
  builder.include(field_of({4.0, 4.0, 4.0}));
  auto range = builder.build();
  assert(range);
  assert(range->is_degenerate());
  for (double v : {-1.0, 4.0, 10.0})
    assert(range->normalize(v) == DEGENERATE_MID_SCALE);
}

void test_restore_range()
{
  std::cout << "Testing restored ranges..." << std::endl;
  auto range = restore_global_range(9.0, 1.0);
  assert(range.min() == 1.0 && range.max() == 9.0);
  assert(range.normalize(5.0) == 0.5);
  assert(restore_global_range(1.0, 9.0) == range);
}

void test_colormap_table()
{
  std::cout << "Testing colormap table..." << std::endl;
  assert(colormap_t::index_of(0.0) == 0);
  assert(colormap_t::index_of(-3.0) == 0);
  assert(colormap_t::index_of(std::numeric_limits<double>::quiet_NaN()) == 0);
  assert(colormap_t::index_of(1.0) == COLORMAP_SIZE - 1);
  assert(colormap_t::index_of(7.0) == COLORMAP_SIZE - 1);
  assert(colormap_t::index_of(0.5) == (COLORMAP_SIZE - 1) / 2);

  int previous = 0;
  for (int i = 0; i <= 1000; ++i)
  {
    int idx = colormap_t::index_of(i / 1000.0);
    assert(idx >= previous);
    previous = idx;
  }

  for (auto kind : {colormap_e::TURBO, colormap_e::VIRIDIS})
  {
    colormap_t a(kind);
    colormap_t b(kind);
    for (int i = 0; i < COLORMAP_SIZE; ++i)
    {
      assert(a.entry(i) == b.entry(i));
      assert(a.entry(i)[3] == 255);
    }
    assert(a.map(0.0) != a.map(1.0));
    assert(a.map(0.5) == a.entry((COLORMAP_SIZE - 1) / 2));
  }

  // Viridis runs from dark purple to yellow
  colormap_t viridis(colormap_e::VIRIDIS);
  assert(viridis.map(0.0)[0] == 68 && viridis.map(0.0)[2] == 84);
  assert(viridis.map(1.0)[0] == 253 && viridis.map(1.0)[1] == 231);

  assert(colormap_from_string("turbo") == colormap_e::TURBO);
  assert(colormap_from_string("viridis") == colormap_e::VIRIDIS);
  assert(!colormap_from_string("jet"));
}

void test_colorize_and_opacity()
{
  std::cout << "Testing colorize and opacity..." << std::endl;
  colormap_t turbo(colormap_e::TURBO);
  std::vector<double> normalized = {0.0, 0.25, 0.5, 1.0, 0.75, 0.1};
  auto image = turbo.colorize(normalized, 2, 3);
  assert(image.width == 3 && image.height == 2);
  assert(image.pixels.size() == 2 * 3 * 4);
  assert(image.pixel(0, 0) == turbo.map(0.0));
  assert(image.pixel(2, 0) == turbo.map(0.5));
  assert(image.pixel(0, 1) == turbo.map(1.0));
  for (size_t i = 0; i < 6; ++i)
    assert(image.alpha(i) == 255);

  // Same input, byte identical output
  assert(turbo.colorize(normalized, 2, 3) == image);

  auto faded = image;
  apply_opacity(faded, 0.8);
  for (size_t i = 0; i < 6; ++i)
  {
    assert(faded.alpha(i) == 204);
    for (int c = 0; c < 3; ++c)
      assert(faded.pixels[i * 4 + c] == image.pixels[i * 4 + c]);
  }

  auto clear = image;
  apply_opacity(clear, -1.0);
  for (size_t i = 0; i < 6; ++i)
    assert(clear.alpha(i) == 0);

  auto opaque = image;
  apply_opacity(opaque, 1.0);
  assert(opaque == image);
}

static auto has_ink(const rgba_image_t &image, int x0, int y0, int x1, int y1) -> bool
{
  for (int y = std::max(y0, 0); y < std::min(y1, image.height); ++y)
  {
    for (int x = std::max(x0, 0); x < std::min(x1, image.width); ++x)
    {
      if (image.pixel(x, y)[3] != 0)
        return true;
    }
  }
  return false;
}

void test_legend()
{
  std::cout << "Testing legend..." << std::endl;
  colormap_t turbo(colormap_e::TURBO);
  auto range = restore_global_range(2.0, 8.0);
  auto legend = render_legend(turbo, range);

  assert(legend.image.width == 80 && legend.image.height == 300);
  assert(legend.ticks.size() == 7);
  assert(legend.ticks.front().label == "2.00");
  assert(legend.ticks[3].label == "5.00");
  assert(legend.ticks.back().label == "8.00");

  // Max at the top
  for (size_t i = 1; i < legend.ticks.size(); ++i)
    assert(legend.ticks[i].y < legend.ticks[i - 1].y);

  // The bar uses the same table as the rasters
  auto top = legend.image.pixel(10, 8);
  auto bottom = legend.image.pixel(10, legend.image.height - 9);
  assert(top == turbo.map(1.0));
  assert(bottom == turbo.map(0.0));

  // Labels are drawn to the right of the bar, corners stay transparent
  assert(has_ink(legend.image, 28, 0, legend.image.width, legend.image.height));
  assert(legend.image.pixel(legend.image.width - 1, 0)[3] == 0);

  assert(render_legend(turbo, range).image == legend.image);

  auto flat = render_legend(turbo, restore_global_range(4.0, 4.0));
  assert(flat.ticks.size() == 1);
  assert(flat.ticks.front().label == "4.00");
}

int main()
{
  test_range_builder();
  test_degenerate_range();
  test_restore_range();
  test_colormap_table();
  test_colorize_and_opacity();
  test_legend();
  std::cout << "Normalizer and Colormap Verification Passed" << std::endl;
  return 0;
}
