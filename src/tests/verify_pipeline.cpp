#include "../core/render_pipeline.hpp"
#include "../core/temporal_interpolator.hpp"
#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>

using namespace field_mapper;

static auto make_sample(double lat, double lon, const std::string &ts, double value, const std::string &param = "pH") -> station_sample_t
{
  station_sample_t s;
  s.latitude = lat;
  s.longitude = lon;
  s.parameter = param;
  s.timestamp = ts;
  s.value = value;
  return s;
}

static auto small_config() -> render_config_t
{
  render_config_t config;
  config.grid = {40, 40, 0.0};
  config.legend = {60, 120, 7};
  return config;
}

static auto two_month_samples() -> std::vector<station_sample_t>
{
  return {make_sample(19.65, 85.31, "Jan-24", 2.0), make_sample(19.69, 85.35, "Jan-24", 8.0), make_sample(19.67, 85.33, "Jan-24", 5.0),
          make_sample(19.65, 85.31, "Feb-24", 4.0), make_sample(19.69, 85.35, "Feb-24", 6.0)};
}

static auto study_area() -> std::vector<ring_t>
{
  return {{{85.30, 19.64}, {85.36, 19.64}, {85.36, 19.70}, {85.30, 19.70}, {85.30, 19.64}}};
}

static auto context_for(const std::vector<station_sample_t> &samples, const render_config_t &config) -> render_context_t
{
  issue_list_t issues;
  auto ctx = make_render_context(study_area(), samples, config, issues);
  assert(ctx.success);
  assert(issues.empty());
  return *ctx.context;
}

void test_context()
{
  std::cout << "Testing render context..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();

  auto ctx = context_for(samples, config);
  assert(ctx.grid.rows == 40 && ctx.grid.cols == 40);
  assert(!ctx.boundary.is_fallback());
  assert(ctx.mask.inside_count > 0);

  // Broken polygon: rectangle of the samples instead, reported
  issue_list_t issues;
  auto fallback = make_render_context(std::vector<ring_t>{{{85.30, 19.64}, {85.36, 19.64}}}, samples, config, issues);
  assert(fallback.success);
  assert(fallback.context->boundary.is_fallback());
  assert(issues.size() == 1 && issues.front().kind == field_error_e::INVALID_BOUNDARY);

  issues.clear();
  auto nothing = make_render_context(std::nullopt, {}, config, issues);
  assert(!nothing.success);
  assert(nothing.error == field_error_e::INVALID_BOUNDARY);
}

void test_global_range_and_frames()
{
  std::cout << "Testing one global range per batch..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();
  auto ctx = context_for(samples, config);

  auto batch = compute_fields(ctx, samples, "pH", {}, config);
  assert(batch.success);
  assert(batch.issues.empty());
  assert(batch.batch->range().min() == 2.0);
  assert(batch.batch->range().max() == 8.0);
  assert(batch.batch->total_points() == 5);
  assert((batch.batch->timestamps() == std::vector<std::string>{"Jan-24", "Feb-24"}));

  auto frames = render_frames(ctx, *batch.batch, config);
  assert(frames.success);
  assert(frames.frames.size() == 2);
  assert(frames.global_min == 2.0 && frames.global_max == 8.0);
  assert(!frames.degenerate);
  for (const auto &frame : frames.frames)
  {
    assert(frame.range_min == 2.0 && frame.range_max == 8.0);
    assert(!frame.synthetic);
    assert(frame.raster.width == 40 && frame.raster.height == 40);
    assert(frame.legend.ticks.size() == 7);
    assert(frame.legend.ticks.front().label == "2.00");
    assert(frame.legend.ticks.back().label == "8.00");
  }

  // Same legend for every frame of the batch
  assert(frames.frames[0].legend.image == frames.frames[1].legend.image);

  // Feb values only span 4..6, so Feb never reaches the extreme colours
  colormap_t turbo(config.colormap);
  const auto &feb = frames.frames[1].raster;
  for (int y = 0; y < feb.height; ++y)
  {
    for (int x = 0; x < feb.width; ++x)
    {
      auto p = feb.pixel(x, y);
      p[3] = 255;
      assert(p != turbo.map(0.0));
      assert(p != turbo.map(1.0));
    }
  }
}

void test_idempotence()
{
  std::cout << "Testing regeneration is byte identical..." << std::endl;
  auto config = small_config();
  config.bandwidth = 1.5;
  auto samples = two_month_samples();

  auto run = [&]()
  {
    auto ctx = context_for(samples, config);
    auto batch = compute_fields(ctx, samples, "pH", {}, config);
    assert(batch.success);
    return render_frames(ctx, *batch.batch, config);
  };

  auto a = run();
  auto b = run();
  assert(a.frames.size() == b.frames.size());
  for (size_t i = 0; i < a.frames.size(); ++i)
  {
    assert(a.frames[i].raster == b.frames[i].raster);
    assert(a.frames[i].legend.image == b.frames[i].legend.image);
  }
}

void test_masking_in_frames()
{
  std::cout << "Testing frames are clipped to the boundary..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();

  // Triangle covering the lower left half of the study area
  std::vector<ring_t> triangle = {{{85.30, 19.64}, {85.36, 19.64}, {85.30, 19.70}, {85.30, 19.64}}};
  issue_list_t issues;
  auto ctx = make_render_context(triangle, samples, config, issues);
  assert(ctx.success);

  auto batch = compute_fields(*ctx.context, samples, "pH", {"Jan-24"}, config);
  assert(batch.success);
  auto frames = render_frames(*ctx.context, *batch.batch, config);
  assert(frames.success);

  const auto &grid = ctx.context->grid;
  const auto &raster = frames.frames.front().raster;
  for (size_t i = 0; i < grid.cell_count(); ++i)
  {
    bool inside = ctx.context->boundary.contains(grid.center(i));
    assert(raster.alpha(i) == (inside ? 204 : 0));
  }
}

void test_missing_timestamp()
{
  std::cout << "Testing timestamps without stations..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();
  auto ctx = context_for(samples, config);

  auto batch = compute_fields(ctx, samples, "pH", {"Jan-24", "Mar-24"}, config);
  assert(batch.success);
  assert(batch.issues.size() == 1);
  assert(batch.issues.front().where == "Mar-24");
  assert(batch.issues.front().kind == field_error_e::INSUFFICIENT_STATIONS);
  assert(batch.batch->timestamps().size() == 1);

  auto none = compute_fields(ctx, samples, "DO", {}, config);
  assert(!none.success);
  assert(none.error == field_error_e::INSUFFICIENT_STATIONS);
}

void test_repeated_timestamps()
{
  std::cout << "Testing repeated timestamps render once..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();
  auto ctx = context_for(samples, config);

  auto batch = compute_fields(ctx, samples, "pH", {"Feb-24", "Jan-24", "Feb-24", "Jan-24"}, config);
  assert(batch.success);
  assert((batch.batch->timestamps() == std::vector<std::string>{"Feb-24", "Jan-24"}));
  assert(batch.batch->total_points() == 5);

  auto frames = render_frames(ctx, *batch.batch, config);
  assert(frames.success);
  assert(frames.frames.size() == 2);
  assert(frames.frames[0].timestamp == "Feb-24");
}

void test_deletion_changes_range()
{
  std::cout << "Testing deleting a sample changes the range..." << std::endl;
  auto config = small_config();
  sample_store_t store;
  store.add_batch(two_month_samples());
  auto ctx = context_for(store.samples(), config);

  auto before = compute_fields(ctx, store.samples(), "pH", {}, config);
  assert(before.success);
  assert(before.batch->range().min() == 2.0);

  assert(store.remove(19.65, 85.31, "pH", "Jan-24"));
  auto after = compute_fields(ctx, store.samples(), "pH", {}, config);
  assert(after.success);
  assert(after.batch->range().min() == 4.0);
  assert(after.batch->range().max() == 8.0);
  assert(!(after.batch->range() == before.batch->range()));
}

void test_degenerate_batch()
{
  std::cout << "Testing degenerate batch renders mid-scale..." << std::endl;
  auto config = small_config();
  std::vector<station_sample_t> samples = {make_sample(19.65, 85.31, "Jan-24", 4.0), make_sample(19.69, 85.35, "Jan-24", 4.0)};
  auto ctx = context_for(samples, config);

  auto batch = compute_fields(ctx, samples, "pH", {}, config);
  assert(batch.success);
  assert(batch.batch->range().is_degenerate());
  assert(batch.issues.size() == 1);
  assert(batch.issues.front().kind == field_error_e::DEGENERATE_RANGE);

  auto frames = render_frames(ctx, *batch.batch, config);
  assert(frames.success);
  assert(frames.degenerate);

  colormap_t turbo(config.colormap);
  auto mid = turbo.map(0.5);
  const auto &raster = frames.frames.front().raster;
  for (size_t i = 0; i < ctx.grid.cell_count(); ++i)
  {
    for (int c = 0; c < 3; ++c)
      assert(raster.pixels[i * 4 + c] == mid[c]);
  }
  assert(frames.frames.front().legend.ticks.size() == 1);
}

void test_range_override()
{
  std::cout << "Testing caller supplied range..." << std::endl;
  auto config = small_config();
  config.range_override = std::make_pair(0.0, 14.0);
  auto samples = two_month_samples();
  auto ctx = context_for(samples, config);

  auto batch = compute_fields(ctx, samples, "pH", {}, config);
  assert(batch.success);
  assert(batch.batch->range().min() == 0.0 && batch.batch->range().max() == 14.0);
}

void test_cancel()
{
  std::cout << "Testing cancellation..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();
  auto ctx = context_for(samples, config);

  std::atomic<bool> cancel{true};
  auto batch = compute_fields(ctx, samples, "pH", {}, config, &cancel);
  assert(!batch.success);
  assert(batch.error == field_error_e::CANCELLED);
}

void test_render_frame_mismatch()
{
  std::cout << "Testing field and grid size mismatch..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();
  auto ctx = context_for(samples, config);

  scalar_field_t wrong;
  wrong.rows = 3;
  wrong.cols = 3;
  wrong.values.assign(9, 1.0);
  auto frame = render_frame(ctx, wrong, "Jan-24", restore_global_range(0.0, 2.0), colormap_t(colormap_e::TURBO), config);
  assert(!frame.success);
  assert(frame.error == field_error_e::OUT_OF_BOUNDS_GRID);
}

void test_temporal_steps()
{
  std::cout << "Testing synthetic steps..." << std::endl;
  std::vector<station_sample_t> start = {make_sample(19.65, 85.31, "Jan-24", 2.0), make_sample(19.69, 85.35, "Jan-24", 8.0), make_sample(19.60, 85.30, "Jan-24", 1.0)};
  std::vector<station_sample_t> end = {make_sample(19.65, 85.31, "Feb-24", 6.0), make_sample(19.69, 85.35, "Feb-24", 4.0)};

  auto steps = interpolate_steps("Jan-24", start, "Feb-24", end, 3);
  assert(steps.size() == 3);
  for (size_t i = 0; i < steps.size(); ++i)
  {
    const auto &step = steps[i];
    assert(step.success);
    assert(step.step_index == static_cast<int>(i) + 1);
    assert(std::abs(step.fraction - (i + 1) / 4.0) < 1e-12);
    assert(step.samples.size() == 2); // station without a Feb value is dropped
    assert(step.label == synthetic_label("Jan-24", "Feb-24", step.step_index, 3));
  }
  assert(std::abs(steps[0].samples[0].value - 3.0) < 1e-12);
  assert(std::abs(steps[1].samples[0].value - 4.0) < 1e-12);
  assert(std::abs(steps[2].samples[1].value - 5.0) < 1e-12);
  assert(steps[0].samples[0].timestamp == steps[0].label);
  assert(steps[0].label == "Jan-24 > Feb-24 [1/4]");

  assert(interpolate_steps("Jan-24", start, "Feb-24", end, 0).empty());

  std::vector<station_sample_t> elsewhere = {make_sample(10.0, 80.0, "Feb-24", 6.0)};
  auto missing = interpolate_steps("Jan-24", start, "Feb-24", elsewhere, 2);
  assert(missing.size() == 2);
  for (const auto &step : missing)
  {
    assert(!step.success);
    assert(step.error == field_error_e::MISSING_STATION_ACROSS_INTERPOLATION_WINDOW);
  }
}

void test_animation()
{
  std::cout << "Testing animation..." << std::endl;
  auto config = small_config();
  auto samples = two_month_samples();
  auto ctx = context_for(samples, config);
  auto batch = compute_fields(ctx, samples, "pH", {}, config);
  assert(batch.success);
  auto frames = render_frames(ctx, *batch.batch, config);
  assert(frames.success);

  animation_config_t animation{"Jan-24", "Feb-24", 3};
  auto result = render_animation(ctx, *batch.batch, animation, config);
  assert(result.success);
  assert(result.experimental);
  assert(!result.notice.empty());
  assert(result.expected_length == 5);
  assert(result.frames.size() == 5);
  assert(result.issues.empty());

  for (size_t i = 0; i < result.frames.size(); ++i)
  {
    const auto &f = result.frames[i];
    assert(f.step_index == static_cast<int>(i));
    assert(f.frame.synthetic == (i != 0 && i != 4));
    assert(f.frame.range_min == 2.0 && f.frame.range_max == 8.0);
  }

  // Endpoints are the measured frames
  assert(result.frames.front().frame.raster == frames.frames[0].raster);
  assert(result.frames.back().frame.raster == frames.frames[1].raster);
  assert(result.frames.front().label == "Jan-24");
  assert(result.frames.back().label == "Feb-24");

  // The batch range is untouched by synthetic frames
  assert(batch.batch->range().min() == 2.0 && batch.batch->range().max() == 8.0);

  // Endpoints must be two distinct timestamps in batch order
  for (const auto &wrong : {animation_config_t{"Feb-24", "Jan-24", 2}, animation_config_t{"Jan-24", "Jan-24", 2}})
  {
    auto refused = render_animation(ctx, *batch.batch, wrong, config);
    assert(!refused.success);
    assert(refused.error == field_error_e::INSUFFICIENT_STATIONS);
    assert(refused.frames.empty());
  }

  // A declared order makes the reversed pair valid
  auto reversed_batch = compute_fields(ctx, samples, "pH", {"Feb-24", "Jan-24"}, config);
  assert(reversed_batch.success);
  auto reversed = render_animation(ctx, *reversed_batch.batch, animation_config_t{"Feb-24", "Jan-24", 1}, config);
  assert(reversed.success);
  assert(reversed.frames.size() == 3);
  assert(reversed.frames.front().label == "Feb-24");

  animation_config_t unknown{"Jan-24", "Mar-24", 3};
  auto bad = render_animation(ctx, *batch.batch, unknown, config);
  assert(!bad.success);
  assert(bad.error == field_error_e::INSUFFICIENT_STATIONS);
}

void test_animation_missing_stations()
{
  std::cout << "Testing animation steps without shared stations..." << std::endl;
  auto config = small_config();
  std::vector<station_sample_t> samples = {make_sample(19.65, 85.31, "Jan-24", 2.0), make_sample(19.69, 85.35, "Jan-24", 8.0), make_sample(19.66, 85.34, "Feb-24", 4.0),
                                           make_sample(19.68, 85.32, "Feb-24", 6.0)};
  auto ctx = context_for(samples, config);
  auto batch = compute_fields(ctx, samples, "pH", {}, config);
  assert(batch.success);

  auto result = render_animation(ctx, *batch.batch, animation_config_t{"Jan-24", "Feb-24", 2}, config);
  assert(result.success);
  assert(result.expected_length == 4);
  assert(result.frames.size() == 2);
  assert(result.frames.front().step_index == 0);
  assert(result.frames.back().step_index == 3);
  assert(result.issues.size() == 2);
  for (const auto &issue : result.issues)
    assert(issue.kind == field_error_e::MISSING_STATION_ACROSS_INTERPOLATION_WINDOW);
}

int main()
{
  test_context();
  test_global_range_and_frames();
  test_idempotence();
  test_masking_in_frames();
  test_missing_timestamp();
  test_repeated_timestamps();
  test_deletion_changes_range();
  test_degenerate_batch();
  test_range_override();
  test_cancel();
  test_render_frame_mismatch();
  test_temporal_steps();
  test_animation();
  test_animation_missing_stations();
  std::cout << "Pipeline Verification Passed" << std::endl;
  return 0;
}
