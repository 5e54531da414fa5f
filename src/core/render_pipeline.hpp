#pragma once

#include "boundary.hpp"
#include "boundary_masker.hpp"
#include "colormap.hpp"
#include "field_error.hpp"
#include "global_normalizer.hpp"
#include "raster_grid.hpp"
#include "render_config.hpp"
#include "sample.hpp"
#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace field_mapper
{

// Grid, boundary and mask shared by every frame of a session
struct render_context_t
{
  boundary_t boundary;
  raster_grid_t grid;
  boundary_mask_t mask;
};

struct context_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  std::optional<render_context_t> context;
};

// Uses the polygon when given and valid, otherwise the extent of `samples`
// (INVALID_BOUNDARY is added to `issues` in that case). Fails when neither gives an area.
auto make_render_context(std::optional<std::vector<ring_t>> rings, const std::vector<station_sample_t> &samples, const render_config_t &config, issue_list_t &issues) -> context_result_t;

// Phase one output: every real field of a parameter plus the range they define.
// Only compute_fields() creates one, so frames can not be rendered before the range covers the whole batch.
class field_batch_t
{
public:
  auto parameter() const -> const std::string & { return m_parameter; }
  auto timestamps() const -> const std::vector<std::string> & { return m_timestamps; }
  auto field(const std::string &timestamp) const -> const scalar_field_t *;
  auto samples(const std::string &timestamp) const -> const std::vector<station_sample_t> *;
  auto range() const -> const global_range_t & { return m_range; }
  auto total_points() const -> size_t { return m_total_points; }

private:
  friend struct batch_builder_t;

  field_batch_t(std::string parameter, global_range_t range);

  std::string m_parameter;
  std::vector<std::string> m_timestamps;
  std::map<std::string, scalar_field_t> m_fields;
  std::map<std::string, std::vector<station_sample_t>> m_samples;
  global_range_t m_range;
  size_t m_total_points = 0;
};

struct batch_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  std::optional<field_batch_t> batch;
  issue_list_t issues;
};

// Interpolated (and smoothed) field for one set of samples on the context grid
auto compute_field(const render_context_t &context, const std::vector<station_sample_t> &samples, const render_config_t &config) -> idw_result_t;

// Phase one. Interpolates every requested timestamp of `parameter` and then fixes the global range.
// A timestamp without stations is reported as INSUFFICIENT_STATIONS and skipped.
// `timestamps` empty means every timestamp of the parameter, in timestamp_less() order.
auto compute_fields(const render_context_t &context, const std::vector<station_sample_t> &samples, const std::string &parameter, const std::vector<std::string> &timestamps, const render_config_t &config,
                    const std::atomic<bool> *cancel = nullptr) -> batch_result_t;

struct frame_t
{
  std::string timestamp;
  rgba_image_t raster;
  legend_t legend;
  double range_min = 0.0;
  double range_max = 0.0;
  bool synthetic = false;
};

struct frame_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  std::optional<frame_t> frame;
};

// Normalise with `range`, colour, apply opacity, then clip to the boundary
auto render_frame(const render_context_t &context, const scalar_field_t &field, const std::string &timestamp, const global_range_t &range, const colormap_t &colormap, const render_config_t &config) -> frame_result_t;

struct frames_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  double global_min = 0.0;
  double global_max = 0.0;
  bool degenerate = false;
  std::vector<frame_t> frames;
  issue_list_t issues;
};

// Phase two: one frame per field of the batch, all with the batch range
auto render_frames(const render_context_t &context, const field_batch_t &batch, const render_config_t &config, const std::atomic<bool> *cancel = nullptr) -> frames_result_t;

struct animation_frame_t
{
  int step_index = 0;
  std::string label;
  frame_t frame;
};

struct animation_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  bool experimental = true;
  std::string notice = EXPERIMENTAL_ANIMATION_NOTICE;
  int expected_length = 0; // k + 2
  std::vector<animation_frame_t> frames;
  issue_list_t issues;
};

// Endpoints are the batch frames for the two real timestamps; the k interior steps are
// synthesised by the temporal interpolator and rendered with the batch range.
// Steps that fail are reported and left out.
auto render_animation(const render_context_t &context, const field_batch_t &batch, const animation_config_t &animation, const render_config_t &config, const std::atomic<bool> *cancel = nullptr) -> animation_result_t;

} // namespace field_mapper
