#pragma once

#include "boundary.hpp"
#include "field_error.hpp"
#include "render_config.hpp"
#include "render_pipeline.hpp"
#include "render_session.hpp"
#include "sample.hpp"
#include <optional>
#include <string>
#include <vector>

namespace field_mapper
{
namespace persistence
{

struct samples_result_t
{
  bool success = false;
  std::string error_message;
  std::vector<station_sample_t> samples;
  issue_list_t issues; // rows that could not be read, as MALFORMED_SAMPLE
};

// JSON array of {latitude, longitude, value, timestamp, parameter | species}.
// Numbers may be given as numeric strings. Unreadable rows are skipped and reported.
auto parse_samples(const std::string &text) -> samples_result_t;
auto load_samples(const std::string &filename) -> samples_result_t;

struct geojson_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  std::vector<ring_t> rings;
};

// Polygon, MultiPolygon, Feature or FeatureCollection (first polygonal feature).
// Only the structure is checked here; make_polygon_boundary() validates the geometry.
auto parse_geojson_boundary(const std::string &text) -> geojson_result_t;
auto load_geojson_boundary(const std::string &filename) -> geojson_result_t;

auto save_render_config(const std::string &filename, const render_config_t &config) -> bool;
auto load_render_config(const std::string &filename, render_config_t &config) -> bool;

// Driver input; see load_job()
struct job_t
{
  std::vector<station_sample_t> samples;
  std::optional<std::vector<ring_t>> boundary;
  std::string parameter; // empty renders every parameter
  std::vector<std::string> timestamps;
  render_config_t render;
  std::optional<animation_config_t> animation;
  std::string output_dir = "output";
  issue_list_t issues;
};

struct job_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  job_t job;
};

// `samples` and `boundary` may be inline or paths relative to the job file.
// A boundary that can not be read is reported and the sample extent is used instead.
auto load_job(const std::string &filename) -> job_result_t;

// {parameter, global_min, global_max, degenerate, timestamps, images, legend, legend_ticks, stats, issues};
// images and legend are base64 PNG keyed by timestamp
auto batch_result_to_string(const generation_result_t &result, size_t parameter_count) -> std::string;
auto save_batch_result(const std::string &filename, const generation_result_t &result, size_t parameter_count) -> bool;

auto animation_result_to_string(const std::string &parameter, const animation_result_t &result) -> std::string;
auto save_animation_result(const std::string &filename, const std::string &parameter, const animation_result_t &result) -> bool;

} // namespace persistence
} // namespace field_mapper
