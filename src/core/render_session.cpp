#include "render_session.hpp"
#include <format>
#include <iostream>
#include <utility>

namespace field_mapper
{

auto to_string(session_state_e state) -> const char *
{
  switch (state)
  {
  case session_state_e::EMPTY:
    return "Empty";
  case session_state_e::SAMPLES_LOADED:
    return "SamplesLoaded";
  case session_state_e::FIELDS_COMPUTED:
    return "FieldsComputed";
  case session_state_e::FRAMES_RENDERED:
    return "FramesRendered";
  case session_state_e::ANIMATION_REQUESTED:
    return "AnimationRequested";
  case session_state_e::ANIMATION_READY:
    return "AnimationReady";
  }
  return "Unknown";
}

template <typename T> static auto ready_future(T value) -> std::future<T>
{
  std::promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future();
}

static auto busy_result() -> mutation_result_t
{
  mutation_result_t result;
  result.error = field_error_e::SESSION_BUSY;
  result.error_message = "a generation job is running for this session";
  return result;
}

auto render_session_t::create(render_config_t config) -> std::shared_ptr<render_session_t>
{
  return std::shared_ptr<render_session_t>(new render_session_t(std::move(config)));
}

render_session_t::render_session_t(render_config_t config) : m_config(std::move(config))
{
}

render_session_t::~render_session_t()
{
  if (m_animation_cancel)
    *m_animation_cancel = true;
}

auto render_session_t::cancel_animation_locked() -> void
{
  if (m_animation_cancel)
    *m_animation_cancel = true;
  m_animation_cancel.reset();
  m_animating = false;
}

auto render_session_t::invalidate_locked() -> void
{
  ++m_generation;
  cancel_animation_locked();
  m_cache.clear();
  m_animation.reset();

  // A rectangular extent follows the samples, a polygon does not
  if (m_context && m_context->boundary.is_fallback())
  {
    m_context.reset();
    m_context_issues.clear();
  }

  m_state = m_store.empty() ? session_state_e::EMPTY : session_state_e::SAMPLES_LOADED;
}

auto render_session_t::set_boundary(std::optional<std::vector<ring_t>> rings) -> mutation_result_t
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_generating)
    return busy_result();

  m_rings = std::move(rings);
  m_context.reset();
  m_context_issues.clear();
  invalidate_locked();

  mutation_result_t result;
  result.success = true;
  return result;
}

auto render_session_t::set_config(const render_config_t &config) -> mutation_result_t
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_generating)
    return busy_result();

  m_config = config;
  m_context.reset();
  m_context_issues.clear();
  invalidate_locked();

  mutation_result_t result;
  result.success = true;
  return result;
}

auto render_session_t::add_samples(const std::vector<station_sample_t> &samples) -> mutation_result_t
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_generating)
    return busy_result();

  mutation_result_t result;
  result.issues = m_store.add_batch(samples);
  for (const auto &issue : result.issues)
    std::cerr << "[WARN] Skipping malformed sample (" << issue.where << "): " << issue.message << std::endl;

  size_t accepted = samples.size() - result.issues.size();
  if (accepted > 0)
    invalidate_locked();

  if (accepted == 0 && !samples.empty())
  {
    result.error = field_error_e::MALFORMED_SAMPLE;
    result.error_message = "every submitted sample was rejected";
    return result;
  }

  result.success = true;
  return result;
}

auto render_session_t::remove_sample(double latitude, double longitude, const std::string &parameter, const std::string &timestamp) -> mutation_result_t
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_generating)
    return busy_result();

  mutation_result_t result;
  if (!m_store.remove(latitude, longitude, parameter, timestamp))
  {
    result.error = field_error_e::MALFORMED_SAMPLE;
    result.error_message = std::format("no sample at ({}, {}) for {} @ {}", latitude, longitude, parameter, timestamp);
    return result;
  }

  invalidate_locked();
  result.success = true;
  return result;
}

auto render_session_t::clear_samples() -> mutation_result_t
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_generating)
    return busy_result();

  m_store.clear();
  invalidate_locked();

  mutation_result_t result;
  result.success = true;
  return result;
}

auto render_session_t::generate(const std::string &parameter, const std::vector<std::string> &timestamps) -> std::future<generation_result_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);

  generation_result_t refused;
  refused.parameter = parameter;
  if (m_generating)
  {
    refused.error = field_error_e::SESSION_BUSY;
    refused.error_message = "a generation job is already running for this session";
    return ready_future(std::move(refused));
  }
  if (m_store.empty())
  {
    refused.error = field_error_e::INSUFFICIENT_STATIONS;
    refused.error_message = "the session has no samples";
    return ready_future(std::move(refused));
  }

  // A new generation supersedes any animation in flight
  ++m_generation;
  cancel_animation_locked();
  m_animation.reset();
  m_cache.erase(parameter);
  m_state = session_state_e::SAMPLES_LOADED;
  m_generating = true;

  return std::async(std::launch::async,
                    [self = shared_from_this(), generation = m_generation, context = m_context, context_issues = m_context_issues, rings = m_rings, samples = m_store.samples(), parameter,
                     timestamps, config = m_config]() mutable
                    {
                      busy_guard_t guard(self->m_generating);
                      auto result = run_job<generation_result_t>(
                          [&]
                          {
                            return self->run_generation(generation, std::move(context), std::move(context_issues), std::move(rings), std::move(samples), parameter, std::move(timestamps),
                                                        std::move(config));
                          });
                      result.parameter = parameter;
                      return result;
                    });
}

auto render_session_t::run_generation(std::uint64_t generation, std::shared_ptr<const render_context_t> context, issue_list_t context_issues, std::optional<std::vector<ring_t>> rings,
                                      std::vector<station_sample_t> samples, std::string parameter, std::vector<std::string> timestamps, render_config_t config) -> generation_result_t
{
  generation_result_t result;
  result.parameter = parameter;

  if (!context)
  {
    auto built = make_render_context(std::move(rings), samples, config, context_issues);
    if (!built.success)
    {
      std::cerr << "[ERROR] " << built.error_message << std::endl;
      result.error = built.error;
      result.error_message = built.error_message;
      result.issues = std::move(context_issues);
      return result;
    }
    context = std::make_shared<const render_context_t>(std::move(*built.context));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation == m_generation)
    {
      m_context = context;
      m_context_issues = context_issues;
    }
  }
  result.issues = std::move(context_issues);

  auto fields = compute_fields(*context, samples, parameter, timestamps, config);
  result.issues.insert(result.issues.end(), fields.issues.begin(), fields.issues.end());
  if (!fields.success)
  {
    result.error = fields.error;
    result.error_message = fields.error_message;
    return result;
  }

  auto batch = std::make_shared<const field_batch_t>(std::move(*fields.batch));
  result.total_points = batch->total_points();
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation == m_generation)
      m_state = session_state_e::FIELDS_COMPUTED;
  }

  auto frames = render_frames(*context, *batch, config);
  result.issues.insert(result.issues.end(), frames.issues.begin(), frames.issues.end());
  if (!frames.success)
  {
    result.error = frames.error;
    result.error_message = frames.error_message;
    result.frames = std::move(frames);
    return result;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  if (generation != m_generation)
  {
    result.error = field_error_e::CANCELLED;
    result.error_message = "the session changed while the batch was rendering";
    return result;
  }

  m_cache[parameter] = parameter_cache_t{batch, frames};
  m_state = session_state_e::FRAMES_RENDERED;

  result.frames = std::move(frames);
  result.success = true;
  return result;
}

auto render_session_t::animate(const std::string &parameter, const animation_config_t &animation) -> std::future<animation_result_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);

  animation_result_t refused;
  if (m_generating)
  {
    refused.error = field_error_e::SESSION_BUSY;
    refused.error_message = "a generation job is running for this session";
    return ready_future(std::move(refused));
  }

  auto it = m_cache.find(parameter);
  if (it == m_cache.end() || !m_context)
  {
    refused.error = field_error_e::INSUFFICIENT_STATIONS;
    refused.error_message = std::format("no rendered frames for {}; generate them first", parameter);
    return ready_future(std::move(refused));
  }

  cancel_animation_locked();
  m_animation.reset();
  m_animation_cancel = std::make_shared<std::atomic<bool>>(false);
  m_animating = true;
  m_state = session_state_e::ANIMATION_REQUESTED;

  std::cout << "[INFO] " << EXPERIMENTAL_ANIMATION_NOTICE << std::endl;

  return std::async(std::launch::async, &render_session_t::run_animation, shared_from_this(), m_generation, m_context, it->second.batch, animation, m_config, m_animation_cancel);
}

auto render_session_t::run_animation(std::uint64_t generation, std::shared_ptr<const render_context_t> context, std::shared_ptr<const field_batch_t> batch, animation_config_t animation, render_config_t config,
                                     std::shared_ptr<std::atomic<bool>> cancel) -> animation_result_t
{
  auto result = run_job<animation_result_t>([&] { return render_animation(*context, *batch, animation, config, cancel.get()); });

  std::lock_guard<std::mutex> lock(m_mutex);
  bool current = (m_animation_cancel == cancel);
  if (current)
    m_animating = false;

  // Stale results are never handed out, even when the job ran to completion
  if (*cancel || generation != m_generation || !current)
  {
    result.success = false;
    result.error = field_error_e::CANCELLED;
    result.error_message = "animation superseded by a newer request";
    result.frames.clear();
    return result;
  }

  if (result.success)
  {
    m_animation = result;
    m_state = session_state_e::ANIMATION_READY;
  }
  else
  {
    m_state = session_state_e::FRAMES_RENDERED;
  }
  return result;
}

auto render_session_t::cancel_animation() -> void
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_animation_cancel)
    *m_animation_cancel = true;
  m_animating = false;
  if (m_state == session_state_e::ANIMATION_REQUESTED)
    m_state = session_state_e::FRAMES_RENDERED;
}

auto render_session_t::state() const -> session_state_e
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_state;
}

auto render_session_t::sample_count() const -> size_t
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_store.size();
}

auto render_session_t::samples() const -> std::vector<station_sample_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_store.samples();
}

auto render_session_t::parameters() const -> std::vector<std::string>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_store.parameters();
}

auto render_session_t::timestamps(const std::string &parameter) const -> std::vector<std::string>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_store.timestamps(parameter);
}

auto render_session_t::range(const std::string &parameter) const -> std::optional<global_range_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_cache.find(parameter);
  if (it == m_cache.end())
    return std::nullopt;
  return it->second.batch->range();
}

auto render_session_t::frames(const std::string &parameter) const -> std::optional<frames_result_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_cache.find(parameter);
  if (it == m_cache.end())
    return std::nullopt;
  return it->second.frames;
}

auto render_session_t::animation() const -> std::optional<animation_result_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_animation;
}

auto session_registry_t::open(const std::string &id, render_config_t config) -> std::shared_ptr<render_session_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  auto &session = m_sessions[id];
  if (!session)
    session = render_session_t::create(std::move(config));
  return session;
}

auto session_registry_t::find(const std::string &id) const -> std::shared_ptr<render_session_t>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_sessions.find(id);
  return it == m_sessions.end() ? nullptr : it->second;
}

auto session_registry_t::close(const std::string &id) -> bool
{
  std::shared_ptr<render_session_t> session;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(id);
    if (it == m_sessions.end())
      return false;
    session = std::move(it->second);
    m_sessions.erase(it);
  }
  session->cancel_animation();
  return true;
}

auto session_registry_t::ids() const -> std::vector<std::string>
{
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> out;
  out.reserve(m_sessions.size());
  for (const auto &[id, session] : m_sessions)
    out.push_back(id);
  return out;
}

auto session_registry_t::size() const -> size_t
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_sessions.size();
}

} // namespace field_mapper
