#include "render_pipeline.hpp"
#include "field_smoother.hpp"
#include "idw_interpolator.hpp"
#include "temporal_interpolator.hpp"
#include <algorithm>
#include <format>
#include <iostream>
#include <set>

namespace field_mapper
{

struct batch_builder_t
{
  static auto make(std::string parameter, global_range_t range) -> field_batch_t { return field_batch_t(std::move(parameter), range); }

  static auto add(field_batch_t &batch, const std::string &timestamp, scalar_field_t field, std::vector<station_sample_t> samples) -> void
  {
    batch.m_total_points += samples.size();
    batch.m_timestamps.push_back(timestamp);
    batch.m_fields.emplace(timestamp, std::move(field));
    batch.m_samples.emplace(timestamp, std::move(samples));
  }
};

field_batch_t::field_batch_t(std::string parameter, global_range_t range) : m_parameter(std::move(parameter)), m_range(range)
{
}

auto field_batch_t::field(const std::string &timestamp) const -> const scalar_field_t *
{
  auto it = m_fields.find(timestamp);
  return it == m_fields.end() ? nullptr : &it->second;
}

auto field_batch_t::samples(const std::string &timestamp) const -> const std::vector<station_sample_t> *
{
  auto it = m_samples.find(timestamp);
  return it == m_samples.end() ? nullptr : &it->second;
}

static auto is_cancelled(const std::atomic<bool> *cancel) -> bool
{
  return cancel && cancel->load();
}

auto make_render_context(std::optional<std::vector<ring_t>> rings, const std::vector<station_sample_t> &samples, const render_config_t &config, issue_list_t &issues) -> context_result_t
{
  context_result_t result;

  geo::bounds_t fallback;
  if (auto extent = sample_extent(samples))
    fallback = *extent;

  auto boundary = resolve_boundary(std::move(rings), fallback, issues);
  if (boundary.bounds().is_empty())
  {
    result.error = field_error_e::INVALID_BOUNDARY;
    result.error_message = "no boundary and no samples to derive an extent from";
    return result;
  }

  auto grid = make_grid(boundary, config.grid, config.margin_fraction);
  if (!grid)
  {
    result.error = field_error_e::INVALID_BOUNDARY;
    result.error_message = "could not build a raster grid for the boundary";
    return result;
  }

  auto mask = build_mask(*grid, boundary);

  if (config.verbose)
  {
    const auto &b = grid->bounds;
    double cell_m = geo::planar_distance(b.min_lon, b.min_lat, b.min_lon + grid->cell_width, b.min_lat) * geo::KM_PER_DEGREE * 1000.0;
    std::cout << "[INFO] Grid " << grid->rows << "x" << grid->cols << ", cell ~" << static_cast<int>(cell_m) << " m, " << mask.inside_count << " cells inside boundary"
              << (boundary.is_fallback() ? " (rectangular extent)" : "") << std::endl;
  }

  result.success = true;
  result.context = render_context_t{std::move(boundary), *grid, std::move(mask)};
  return result;
}

auto compute_field(const render_context_t &context, const std::vector<station_sample_t> &samples, const render_config_t &config) -> idw_result_t
{
  auto result = interpolate_idw(samples, context.grid, config.power);
  if (!result.success)
    return result;

  double sigma = config.bandwidth_km ? bandwidth_km_to_cells(*config.bandwidth_km, context.grid) : config.bandwidth;
  result.field = smooth_field(result.field, sigma);
  return result;
}

auto compute_fields(const render_context_t &context, const std::vector<station_sample_t> &samples, const std::string &parameter, const std::vector<std::string> &timestamps, const render_config_t &config,
                    const std::atomic<bool> *cancel) -> batch_result_t
{
  batch_result_t result;

  std::map<std::string, std::vector<station_sample_t>> by_timestamp;
  for (const auto &s : samples)
  {
    if (s.parameter == parameter)
      by_timestamp[s.timestamp].push_back(s);
  }

  // Caller order is kept, repeated labels are rendered once
  std::vector<std::string> order;
  std::set<std::string> seen;
  for (const auto &ts : timestamps)
  {
    if (seen.insert(ts).second)
      order.push_back(ts);
  }
  if (order.empty())
  {
    for (const auto &[ts, group] : by_timestamp)
      order.push_back(ts);
    std::sort(order.begin(), order.end(), timestamp_less);
  }

  std::vector<std::pair<std::string, scalar_field_t>> fields;
  global_range_builder_t range_builder;

  for (const auto &ts : order)
  {
    if (is_cancelled(cancel))
    {
      result.error = field_error_e::CANCELLED;
      result.error_message = "field computation cancelled";
      return result;
    }

    auto it = by_timestamp.find(ts);
    static const std::vector<station_sample_t> none;
    const auto &group = (it == by_timestamp.end()) ? none : it->second;

    if (config.verbose)
      std::cout << "[INFO] Interpolating " << parameter << " @ " << ts << " from " << group.size() << " stations" << std::endl;

    auto field = compute_field(context, group, config);
    if (!field.success)
    {
      std::cerr << "[WARN] " << parameter << " @ " << ts << ": " << field.error_message << std::endl;
      result.issues.push_back({ts, field.error, field.error_message});
      continue;
    }

    range_builder.include(field.field);
    range_builder.include(group);
    fields.emplace_back(ts, std::move(field.field));
  }

  std::optional<global_range_t> range;
  if (config.range_override)
    range = restore_global_range(config.range_override->first, config.range_override->second);
  else
    range = range_builder.build();

  if (fields.empty() || !range)
  {
    result.error = field_error_e::INSUFFICIENT_STATIONS;
    result.error_message = std::format("no timestamp of {} has stations to interpolate", parameter);
    return result;
  }

  if (range->is_degenerate())
  {
    std::cerr << "[WARN] " << parameter << ": every value equals " << range->min() << ", rendering mid-scale colour" << std::endl;
    result.issues.push_back({parameter, field_error_e::DEGENERATE_RANGE, std::format("global min == global max == {}", range->min())});
  }

  auto batch = batch_builder_t::make(parameter, *range);
  for (auto &[ts, field] : fields)
    batch_builder_t::add(batch, ts, std::move(field), by_timestamp[ts]);

  if (config.verbose)
    std::cout << "[INFO] " << parameter << ": " << batch.total_points() << " points, global min/max " << range->min() << " / " << range->max() << std::endl;

  result.success = true;
  result.batch = std::move(batch);
  return result;
}

auto render_frame(const render_context_t &context, const scalar_field_t &field, const std::string &timestamp, const global_range_t &range, const colormap_t &colormap, const render_config_t &config) -> frame_result_t
{
  frame_result_t result;

  if (field.rows != context.grid.rows || field.cols != context.grid.cols)
  {
    result.error = field_error_e::OUT_OF_BOUNDS_GRID;
    result.error_message = std::format("field {}x{} does not match grid {}x{}", field.rows, field.cols, context.grid.rows, context.grid.cols);
    return result;
  }

  if (!range.is_degenerate() && (field.min_value() < range.min() || field.max_value() > range.max()))
  {
    std::cerr << "[WARN] Values outside global range for " << timestamp << ": min=" << field.min_value() << ", max=" << field.max_value() << std::endl;
  }

  frame_t frame;
  frame.timestamp = timestamp;
  frame.range_min = range.min();
  frame.range_max = range.max();
  frame.raster = colormap.colorize(range.normalize(field), field.rows, field.cols);
  apply_opacity(frame.raster, config.opacity);

  auto masked = apply_mask(frame.raster, context.mask);
  if (!masked.success)
  {
    result.error = masked.error;
    result.error_message = masked.error_message;
    return result;
  }

  frame.legend = render_legend(colormap, range, config.legend);

  result.success = true;
  result.frame = std::move(frame);
  return result;
}

auto render_frames(const render_context_t &context, const field_batch_t &batch, const render_config_t &config, const std::atomic<bool> *cancel) -> frames_result_t
{
  frames_result_t result;
  result.global_min = batch.range().min();
  result.global_max = batch.range().max();
  result.degenerate = batch.range().is_degenerate();

  colormap_t colormap(config.colormap);

  for (const auto &ts : batch.timestamps())
  {
    if (is_cancelled(cancel))
    {
      result.error = field_error_e::CANCELLED;
      result.error_message = "frame rendering cancelled";
      result.frames.clear();
      return result;
    }

    auto frame = render_frame(context, *batch.field(ts), ts, batch.range(), colormap, config);
    if (!frame.success)
    {
      std::cerr << "[ERROR] Frame " << ts << ": " << frame.error_message << std::endl;
      result.issues.push_back({ts, frame.error, frame.error_message});
      continue;
    }
    result.frames.push_back(std::move(*frame.frame));
  }

  if (result.frames.empty())
  {
    result.error = result.issues.empty() ? field_error_e::INSUFFICIENT_STATIONS : result.issues.front().kind;
    result.error_message = "no frame could be rendered";
    return result;
  }

  result.success = true;
  return result;
}

auto render_animation(const render_context_t &context, const field_batch_t &batch, const animation_config_t &animation, const render_config_t &config, const std::atomic<bool> *cancel) -> animation_result_t
{
  animation_result_t result;
  const int k = std::max(animation.intermediate_frame_count, 0);
  result.expected_length = k + 2;

  const auto *start_field = batch.field(animation.start_timestamp);
  const auto *end_field = batch.field(animation.end_timestamp);
  if (!start_field || !end_field)
  {
    result.error = field_error_e::INSUFFICIENT_STATIONS;
    result.error_message = std::format("animation endpoints {} and {} must both be rendered timestamps of {}", animation.start_timestamp, animation.end_timestamp, batch.parameter());
    return result;
  }

  const auto &order = batch.timestamps();
  auto start_pos = std::find(order.begin(), order.end(), animation.start_timestamp);
  auto end_pos = std::find(order.begin(), order.end(), animation.end_timestamp);
  if (start_pos >= end_pos)
  {
    result.error = field_error_e::INSUFFICIENT_STATIONS;
    result.error_message = std::format("animation start {} must come before end {} in the batch order of {}", animation.start_timestamp, animation.end_timestamp, batch.parameter());
    return result;
  }

  colormap_t colormap(config.colormap);

  auto add_frame = [&](int step, const std::string &label, frame_result_t frame, bool synthetic) -> bool
  {
    if (!frame.success)
    {
      result.issues.push_back({std::format("step {}", step), frame.error, frame.error_message});
      return false;
    }
    frame.frame->synthetic = synthetic;
    result.frames.push_back({step, label, std::move(*frame.frame)});
    return true;
  };

  // Endpoints are rendered exactly as the batch frames are
  if (!add_frame(0, animation.start_timestamp, render_frame(context, *start_field, animation.start_timestamp, batch.range(), colormap, config), false))
  {
    result.error = result.issues.back().kind;
    result.error_message = result.issues.back().message;
    return result;
  }

  auto steps = interpolate_steps(animation.start_timestamp, *batch.samples(animation.start_timestamp), animation.end_timestamp, *batch.samples(animation.end_timestamp), k);
  for (const auto &step : steps)
  {
    if (is_cancelled(cancel))
    {
      result.error = field_error_e::CANCELLED;
      result.error_message = "animation cancelled";
      result.frames.clear();
      return result;
    }

    if (!step.success)
    {
      std::cerr << "[WARN] Skipping " << step.label << ": " << step.error_message << std::endl;
      result.issues.push_back({std::format("step {}", step.step_index), step.error, step.error_message});
      continue;
    }

    auto field = compute_field(context, step.samples, config);
    if (!field.success)
    {
      result.issues.push_back({std::format("step {}", step.step_index), field.error, field.error_message});
      continue;
    }
    add_frame(step.step_index, step.label, render_frame(context, field.field, step.label, batch.range(), colormap, config), true);
  }

  add_frame(k + 1, animation.end_timestamp, render_frame(context, *end_field, animation.end_timestamp, batch.range(), colormap, config), false);

  result.success = true;
  return result;
}

} // namespace field_mapper
