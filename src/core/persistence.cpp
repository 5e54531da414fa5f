#include "persistence.hpp"
#include "image_encoder.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace field_mapper
{
namespace persistence
{

static auto read_file(const std::string &filename, std::string &text) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
    return false;

  std::stringstream buffer;
  buffer << file.rdbuf();
  text = buffer.str();
  return true;
}

static auto write_file(const std::string &filename, const std::string &text) -> bool
{
  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "[ERROR] Cannot write " << filename << std::endl;
    return false;
  }
  file << text;
  return true;
}

// Uploaded tables often carry numbers as text
static auto number_from(const json &item, const char *key) -> std::optional<double>
{
  auto it = item.find(key);
  if (it == item.end() || it->is_null())
    return std::nullopt;

  if (it->is_number())
    return it->get<double>();

  if (it->is_string())
  {
    const auto &text = it->get_ref<const std::string &>();
    if (text.empty())
      return std::nullopt;
    char *end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size())
      return std::nullopt;
    return v;
  }
  return std::nullopt;
}

static auto label_from(const json &item, const char *key) -> std::string
{
  auto it = item.find(key);
  if (it == item.end() || it->is_null())
    return {};
  if (it->is_string())
    return it->get<std::string>();
  return it->dump();
}

static auto samples_from_json(const json &rows) -> samples_result_t
{
  samples_result_t result;
  if (!rows.is_array())
  {
    result.error_message = "samples must be a JSON array";
    return result;
  }

  for (size_t i = 0; i < rows.size(); ++i)
  {
    const auto &row = rows[i];
    auto where = std::format("row {}", i);
    if (!row.is_object())
    {
      result.issues.push_back({where, field_error_e::MALFORMED_SAMPLE, "row is not an object"});
      continue;
    }

    auto lat = number_from(row, "latitude");
    auto lon = number_from(row, "longitude");
    auto value = number_from(row, "value");
    if (!lat || !lon || !value)
    {
      result.issues.push_back({where, field_error_e::MALFORMED_SAMPLE, "latitude, longitude and value must be numbers"});
      continue;
    }

    station_sample_t sample;
    sample.latitude = *lat;
    sample.longitude = *lon;
    sample.value = *value;
    sample.timestamp = label_from(row, "timestamp");
    sample.parameter = row.contains("parameter") ? label_from(row, "parameter") : label_from(row, "species");
    if (sample.parameter.empty())
      sample.parameter = DEFAULT_PARAMETER;

    result.samples.push_back(std::move(sample));
  }

  result.success = true;
  return result;
}

auto parse_samples(const std::string &text) -> samples_result_t
{
  try
  {
    return samples_from_json(json::parse(text));
  }
  catch (const json::parse_error &e)
  {
    samples_result_t result;
    result.error_message = std::string("JSON Parse Error: ") + e.what();
    return result;
  }
}

auto load_samples(const std::string &filename) -> samples_result_t
{
  std::string text;
  if (!read_file(filename, text))
  {
    samples_result_t result;
    result.error_message = "Cannot open " + filename;
    return result;
  }
  return parse_samples(text);
}

static auto ring_from_json(const json &coords) -> ring_t
{
  ring_t ring;
  for (const auto &position : coords)
  {
    if (!position.is_array() || position.size() < 2)
      throw std::invalid_argument("position must be [lon, lat]");
    ring.push_back({position[0].get<double>(), position[1].get<double>()});
  }
  return ring;
}

static auto rings_from_geometry(const json &geometry, std::vector<ring_t> &rings) -> bool
{
  if (!geometry.is_object())
    return false;

  auto type = geometry.value("type", "");
  if (type == "Polygon")
  {
    for (const auto &ring : geometry.at("coordinates"))
      rings.push_back(ring_from_json(ring));
    return true;
  }
  if (type == "MultiPolygon")
  {
    // Parts are disjoint, so the even-odd rule treats them as one shape
    for (const auto &polygon : geometry.at("coordinates"))
    {
      for (const auto &ring : polygon)
        rings.push_back(ring_from_json(ring));
    }
    return true;
  }
  if (type == "Feature")
    return rings_from_geometry(geometry.value("geometry", json()), rings);
  if (type == "FeatureCollection")
  {
    for (const auto &feature : geometry.value("features", json::array()))
    {
      if (rings_from_geometry(feature, rings))
        return true;
    }
  }
  return false;
}

static auto boundary_from_json(const json &geojson) -> geojson_result_t
{
  geojson_result_t result;
  try
  {
    if (!rings_from_geometry(geojson, result.rings))
    {
      result.error = field_error_e::INVALID_BOUNDARY;
      result.error_message = "GeoJSON has no Polygon or MultiPolygon geometry";
      result.rings.clear();
      return result;
    }
  }
  catch (const json::exception &e)
  {
    result.error = field_error_e::INVALID_BOUNDARY;
    result.error_message = std::string("Malformed GeoJSON coordinates: ") + e.what();
    result.rings.clear();
    return result;
  }
  catch (const std::invalid_argument &e)
  {
    result.error = field_error_e::INVALID_BOUNDARY;
    result.error_message = std::string("Malformed GeoJSON coordinates: ") + e.what();
    result.rings.clear();
    return result;
  }

  result.success = true;
  return result;
}

auto parse_geojson_boundary(const std::string &text) -> geojson_result_t
{
  try
  {
    return boundary_from_json(json::parse(text));
  }
  catch (const json::parse_error &e)
  {
    geojson_result_t result;
    result.error = field_error_e::INVALID_BOUNDARY;
    result.error_message = std::string("JSON Parse Error: ") + e.what();
    return result;
  }
}

auto load_geojson_boundary(const std::string &filename) -> geojson_result_t
{
  std::string text;
  if (!read_file(filename, text))
  {
    geojson_result_t result;
    result.error = field_error_e::IO_ERROR;
    result.error_message = "Cannot open " + filename;
    return result;
  }
  return parse_geojson_boundary(text);
}

static auto render_config_to_json(const render_config_t &config) -> json
{
  json j = {{"bandwidth", config.bandwidth},
            {"opacity", config.opacity},
            {"power", config.power},
            {"grid", {{"rows", config.grid.rows}, {"cols", config.grid.cols}, {"cell_size_deg", config.grid.cell_size_deg}}},
            {"margin_fraction", config.margin_fraction},
            {"legend", {{"width", config.legend.width}, {"height", config.legend.height}, {"ticks", config.legend.ticks}}},
            {"colormap", to_string(config.colormap)},
            {"verbose", config.verbose}};
  if (config.bandwidth_km)
    j["bandwidth_km"] = *config.bandwidth_km;
  if (config.range_override)
    j["range"] = {{"min", config.range_override->first}, {"max", config.range_override->second}};
  return j;
}

static auto render_config_from_json(const json &j, render_config_t &config) -> void
{
  config.bandwidth = j.value("bandwidth", 0.0);
  if (j.contains("bandwidth_km"))
    config.bandwidth_km = j["bandwidth_km"].get<double>();

  config.opacity = std::clamp(j.value("opacity", 0.8), 0.0, 1.0);

  config.power = j.value("power", DEFAULT_IDW_POWER);
  if (!(config.power > 0.0))
  {
    std::cerr << "[WARN] power must be > 0, using " << DEFAULT_IDW_POWER << std::endl;
    config.power = DEFAULT_IDW_POWER;
  }

  if (j.contains("grid"))
  {
    config.grid.rows = j["grid"].value("rows", 400);
    config.grid.cols = j["grid"].value("cols", 400);
    config.grid.cell_size_deg = j["grid"].value("cell_size_deg", 0.0);
  }

  config.margin_fraction = j.value("margin_fraction", DEFAULT_GRID_MARGIN);

  if (j.contains("legend"))
  {
    config.legend.width = j["legend"].value("width", 80);
    config.legend.height = j["legend"].value("height", 300);
    config.legend.ticks = j["legend"].value("ticks", 7);
  }

  auto name = j.value("colormap", "turbo");
  if (auto kind = colormap_from_string(name))
    config.colormap = *kind;
  else
    std::cerr << "[WARN] Unknown colormap '" << name << "', using turbo" << std::endl;

  if (j.contains("range"))
    config.range_override = std::make_pair(j["range"].at("min").get<double>(), j["range"].at("max").get<double>());

  config.verbose = j.value("verbose", false);
}

auto save_render_config(const std::string &filename, const render_config_t &config) -> bool
{
  return write_file(filename, render_config_to_json(config).dump(4));
}

auto load_render_config(const std::string &filename, render_config_t &config) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
    return false;

  try
  {
    json j;
    file >> j;
    render_config_from_json(j, config);
  }
  catch (const json::exception &e)
  {
    std::cerr << "[ERROR] " << filename << ": " << e.what() << std::endl;
    return false;
  }
  return true;
}

auto load_job(const std::string &filename) -> job_result_t
{
  job_result_t result;

  std::ifstream file(filename);
  if (!file.is_open())
  {
    result.error = field_error_e::IO_ERROR;
    result.error_message = "Cannot open " + filename;
    return result;
  }

  json j;
  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    result.error = field_error_e::IO_ERROR;
    result.error_message = std::string("JSON Parse Error: ") + e.what();
    return result;
  }

  auto base = std::filesystem::path(filename).parent_path();
  auto resolve = [&](const std::string &path) { return (base / path).string(); };

  auto &job = result.job;
  try
  {
    samples_result_t samples;
    if (j.contains("samples") && j["samples"].is_string())
      samples = load_samples(resolve(j["samples"].get<std::string>()));
    else
      samples = samples_from_json(j.value("samples", json::array()));

    if (!samples.success)
    {
      result.error = field_error_e::IO_ERROR;
      result.error_message = samples.error_message;
      return result;
    }
    job.samples = std::move(samples.samples);
    job.issues = std::move(samples.issues);

    if (j.contains("boundary") && !j["boundary"].is_null())
    {
      auto boundary = j["boundary"].is_string() ? load_geojson_boundary(resolve(j["boundary"].get<std::string>())) : boundary_from_json(j["boundary"]);
      if (boundary.success)
        job.boundary = std::move(boundary.rings);
      else
      {
        std::cerr << "[WARN] " << boundary.error_message << std::endl;
        job.issues.push_back({"boundary", boundary.error, boundary.error_message});
      }
    }

    job.parameter = j.value("parameter", "");
    if (j.contains("timestamps"))
    {
      for (const auto &ts : j["timestamps"])
        job.timestamps.push_back(ts.is_string() ? ts.get<std::string>() : ts.dump());
    }

    if (j.contains("render"))
      render_config_from_json(j["render"], job.render);

    if (j.contains("animation"))
    {
      animation_config_t animation;
      animation.start_timestamp = j["animation"].at("start_timestamp").get<std::string>();
      animation.end_timestamp = j["animation"].at("end_timestamp").get<std::string>();
      animation.intermediate_frame_count = j["animation"].value("intermediate_frame_count", 8);
      job.animation = animation;
    }

    job.output_dir = j.value("output_dir", "output");
  }
  catch (const json::exception &e)
  {
    result.error = field_error_e::IO_ERROR;
    result.error_message = std::string("Invalid job file: ") + e.what();
    return result;
  }

  result.success = true;
  return result;
}

static auto issues_to_json(const issue_list_t &issues) -> json
{
  json out = json::array();
  for (const auto &issue : issues)
    out.push_back({{"where", issue.where}, {"kind", to_string(issue.kind)}, {"message", issue.message}});
  return out;
}

static auto ticks_to_json(const std::vector<legend_tick_t> &ticks) -> json
{
  json out = json::array();
  for (const auto &tick : ticks)
    out.push_back({{"value", tick.value}, {"label", tick.label}});
  return out;
}

auto batch_result_to_string(const generation_result_t &result, size_t parameter_count) -> std::string
{
  json j;
  j["parameter"] = result.parameter;
  j["success"] = result.success;
  if (!result.success)
  {
    j["error"] = to_string(result.error);
    j["error_message"] = result.error_message;
  }

  const auto &frames = result.frames;
  j["global_min"] = frames.global_min;
  j["global_max"] = frames.global_max;
  j["degenerate"] = frames.degenerate;

  json timestamps = json::array();
  json images = json::object();
  json legends = json::object();
  for (const auto &frame : frames.frames)
  {
    timestamps.push_back(frame.timestamp);
    images[frame.timestamp] = image_encoder_t::encode_png_base64(frame.raster);
    legends[frame.timestamp] = image_encoder_t::encode_png_base64(frame.legend.image);
  }
  j["timestamps"] = timestamps;
  j["images"] = images;
  j["legend"] = legends;
  j["legend_ticks"] = frames.frames.empty() ? json::array() : ticks_to_json(frames.frames.front().legend.ticks);

  j["stats"] = {{"total_points", result.total_points}, {"parameter_count", parameter_count}, {"timestamp_count", frames.frames.size()}};
  j["issues"] = issues_to_json(result.issues);
  return j.dump(4);
}

auto save_batch_result(const std::string &filename, const generation_result_t &result, size_t parameter_count) -> bool
{
  return write_file(filename, batch_result_to_string(result, parameter_count));
}

auto animation_result_to_string(const std::string &parameter, const animation_result_t &result) -> std::string
{
  json j;
  j["parameter"] = parameter;
  j["success"] = result.success;
  if (!result.success)
  {
    j["error"] = to_string(result.error);
    j["error_message"] = result.error_message;
  }
  j["experimental"] = result.experimental;
  j["notice"] = result.notice;
  j["expected_length"] = result.expected_length;

  json frames = json::array();
  for (const auto &f : result.frames)
  {
    frames.push_back({{"step_index", f.step_index},
                      {"label", f.label},
                      {"synthetic", f.frame.synthetic},
                      {"image", image_encoder_t::encode_png_base64(f.frame.raster)}});
  }
  j["frames"] = frames;
  if (!result.frames.empty())
  {
    j["global_min"] = result.frames.front().frame.range_min;
    j["global_max"] = result.frames.front().frame.range_max;
    j["legend"] = image_encoder_t::encode_png_base64(result.frames.front().frame.legend.image);
  }
  j["issues"] = issues_to_json(result.issues);
  return j.dump(4);
}

auto save_animation_result(const std::string &filename, const std::string &parameter, const animation_result_t &result) -> bool
{
  return write_file(filename, animation_result_to_string(parameter, result));
}

} // namespace persistence
} // namespace field_mapper
