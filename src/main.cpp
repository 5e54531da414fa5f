#include <cctype>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "core/image_encoder.hpp"
#include "core/persistence.hpp"
#include "core/render_session.hpp"

using namespace field_mapper;

static void print_usage(const char *program)
{
  std::cerr << "Usage: " << program << " <job.json> [--output DIR] [--verbose]" << std::endl;
}

// Timestamps are free-form labels; keep them usable as file names
static auto file_safe(const std::string &label) -> std::string
{
  std::string out = label;
  for (char &c : out)
  {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.')
      c = '_';
  }
  return out;
}

static void print_issues(const issue_list_t &issues)
{
  for (const auto &issue : issues)
    std::cerr << "[WARN] " << issue.where << ": " << to_string(issue.kind) << ": " << issue.message << std::endl;
}

int main(int argc, char **argv)
{
  std::string job_file;
  std::string output_override;
  bool verbose = false;

  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "--output" && i + 1 < argc)
      output_override = argv[++i];
    else if (arg == "--verbose")
      verbose = true;
    else if (arg == "--help" || arg == "-h")
    {
      print_usage(argv[0]);
      return 0;
    }
    else if (job_file.empty())
      job_file = arg;
    else
    {
      print_usage(argv[0]);
      return 1;
    }
  }

  if (job_file.empty())
  {
    print_usage(argv[0]);
    return 1;
  }

  auto loaded = persistence::load_job(job_file);
  if (!loaded.success)
  {
    std::cerr << "[ERROR] " << loaded.error_message << std::endl;
    return 1;
  }

  auto &job = loaded.job;
  if (verbose)
    job.render.verbose = true;
  if (!output_override.empty())
    job.output_dir = output_override;
  print_issues(job.issues);

  std::error_code ec;
  std::filesystem::create_directories(job.output_dir, ec);
  if (ec)
  {
    std::cerr << "[ERROR] Cannot create " << job.output_dir << ": " << ec.message() << std::endl;
    return 1;
  }
  std::filesystem::path out_dir(job.output_dir);

  auto session = render_session_t::create(job.render);
  if (auto set = session->set_boundary(job.boundary); !set.success)
  {
    std::cerr << "[ERROR] " << set.error_message << std::endl;
    return 1;
  }

  auto added = session->add_samples(job.samples);
  if (!added.success)
  {
    std::cerr << "[ERROR] " << added.error_message << std::endl;
    return 1;
  }

  std::vector<std::string> parameters;
  if (job.parameter.empty())
    parameters = session->parameters();
  else
    parameters.push_back(job.parameter);

  std::cout << "[INFO] " << session->sample_count() << " samples, " << parameters.size() << " parameter(s)" << std::endl;

  int failures = 0;
  for (const auto &parameter : parameters)
  {
    auto result = session->generate(parameter, job.timestamps).get();
    print_issues(result.issues);

    if (!result.success)
    {
      std::cerr << "[ERROR] " << parameter << ": " << to_string(result.error) << ": " << result.error_message << std::endl;
      ++failures;
    }
    else
    {
      std::cout << "[INFO] " << parameter << ": " << result.frames.frames.size() << " frame(s), range " << result.frames.global_min << " to " << result.frames.global_max << std::endl;
      for (const auto &frame : result.frames.frames)
      {
        auto stem = file_safe(parameter) + "_" + file_safe(frame.timestamp);
        if (!image_encoder_t::save_png(frame.raster, (out_dir / (stem + ".png")).string()) || !image_encoder_t::save_png(frame.legend.image, (out_dir / (stem + "_legend.png")).string()))
          ++failures;
      }
    }

    auto json_path = (out_dir / (file_safe(parameter) + ".json")).string();
    if (!persistence::save_batch_result(json_path, result, session->parameters().size()))
      ++failures;
  }

  if (job.animation)
  {
    auto parameter = parameters.empty() ? std::string(DEFAULT_PARAMETER) : parameters.front();
    auto animation = session->animate(parameter, *job.animation).get();
    print_issues(animation.issues);

    if (!animation.success)
    {
      std::cerr << "[ERROR] Animation: " << to_string(animation.error) << ": " << animation.error_message << std::endl;
      ++failures;
    }
    else
    {
      std::cout << "[INFO] Animation: " << animation.frames.size() << " of " << animation.expected_length << " frames. " << animation.notice << std::endl;
      for (const auto &frame : animation.frames)
      {
        auto name = std::format("{}_animation_{:03}.png", file_safe(parameter), frame.step_index);
        if (!image_encoder_t::save_png(frame.frame.raster, (out_dir / name).string()))
          ++failures;
      }
    }

    if (!persistence::save_animation_result((out_dir / (file_safe(parameter) + "_animation.json")).string(), parameter, animation))
      ++failures;
  }

  return failures == 0 ? 0 : 2;
}
