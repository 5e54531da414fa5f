#pragma once

#include "boundary.hpp"
#include "field_error.hpp"
#include "render_config.hpp"
#include "render_pipeline.hpp"
#include "sample.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace field_mapper
{

enum class session_state_e
{
  EMPTY,
  SAMPLES_LOADED,
  FIELDS_COMPUTED,
  FRAMES_RENDERED,
  ANIMATION_REQUESTED,
  ANIMATION_READY
};

auto to_string(session_state_e state) -> const char *;

struct mutation_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  issue_list_t issues; // rows rejected as MALFORMED_SAMPLE
};

struct generation_result_t
{
  bool success = false;
  field_error_e error = field_error_e::NONE;
  std::string error_message;
  std::string parameter;
  size_t total_points = 0;
  frames_result_t frames;
  issue_list_t issues; // boundary, field and frame issues of the whole job
};

// Clears `flag` when the scope ends, however it ends
class busy_guard_t
{
public:
  explicit busy_guard_t(std::atomic<bool> &flag) : m_flag(flag) {}
  ~busy_guard_t() { m_flag = false; }

  busy_guard_t(const busy_guard_t &) = delete;
  auto operator=(const busy_guard_t &) -> busy_guard_t & = delete;

private:
  std::atomic<bool> &m_flag;
};

// Runs a worker job; a std::exception escaping it is logged and returned as an IO_ERROR result
template <typename Result, typename Job> auto run_job(Job &&job) -> Result
{
  try
  {
    return job();
  }
  catch (const std::exception &e)
  {
    std::cerr << "[ERROR] Job failed: " << e.what() << std::endl;
    Result result;
    result.error = field_error_e::IO_ERROR;
    result.error_message = std::string("job failed: ") + e.what();
    return result;
  }
}

// One dataset with its boundary and config. Jobs run on std::async workers and keep the
// session alive through shared_from_this(), so sessions are only created through create().
class render_session_t : public std::enable_shared_from_this<render_session_t>
{
public:
  static auto create(render_config_t config = {}) -> std::shared_ptr<render_session_t>;
  ~render_session_t();

  render_session_t(const render_session_t &) = delete;
  auto operator=(const render_session_t &) -> render_session_t & = delete;

  // Polygon used for clipping and extent; std::nullopt selects the sample extent
  auto set_boundary(std::optional<std::vector<ring_t>> rings) -> mutation_result_t;
  auto set_config(const render_config_t &config) -> mutation_result_t;

  // Sample mutations reset the session to SAMPLES_LOADED and cancel a running animation.
  // They fail with SESSION_BUSY while a generation job is active.
  auto add_samples(const std::vector<station_sample_t> &samples) -> mutation_result_t;
  auto remove_sample(double latitude, double longitude, const std::string &parameter, const std::string &timestamp) -> mutation_result_t;
  auto clear_samples() -> mutation_result_t;

  // Both phases for one parameter. `timestamps` empty means all of them in timestamp order.
  auto generate(const std::string &parameter, const std::vector<std::string> &timestamps = {}) -> std::future<generation_result_t>;

  // Needs frames of `parameter` rendered by generate(); reuses their global range
  auto animate(const std::string &parameter, const animation_config_t &animation) -> std::future<animation_result_t>;

  // Requests the running animation (if any) to stop; its result reports CANCELLED
  auto cancel_animation() -> void;

  auto state() const -> session_state_e;
  auto is_busy() const -> bool { return m_generating; }
  auto is_animating() const -> bool { return m_animating; }

  auto sample_count() const -> size_t;
  auto samples() const -> std::vector<station_sample_t>;
  auto parameters() const -> std::vector<std::string>;
  auto timestamps(const std::string &parameter) const -> std::vector<std::string>;

  // Cached results of the last completed jobs, per parameter
  auto range(const std::string &parameter) const -> std::optional<global_range_t>;
  auto frames(const std::string &parameter) const -> std::optional<frames_result_t>;
  auto animation() const -> std::optional<animation_result_t>;

private:
  explicit render_session_t(render_config_t config);

  struct parameter_cache_t
  {
    std::shared_ptr<const field_batch_t> batch;
    frames_result_t frames;
  };

  // Caller holds m_mutex
  auto invalidate_locked() -> void;
  auto cancel_animation_locked() -> void;

  // Builds the context on the worker when the session has none yet
  auto run_generation(std::uint64_t generation, std::shared_ptr<const render_context_t> context, issue_list_t context_issues, std::optional<std::vector<ring_t>> rings,
                      std::vector<station_sample_t> samples, std::string parameter, std::vector<std::string> timestamps, render_config_t config) -> generation_result_t;
  auto run_animation(std::uint64_t generation, std::shared_ptr<const render_context_t> context, std::shared_ptr<const field_batch_t> batch, animation_config_t animation, render_config_t config,
                     std::shared_ptr<std::atomic<bool>> cancel) -> animation_result_t;

  mutable std::mutex m_mutex;
  render_config_t m_config;
  sample_store_t m_store;
  std::optional<std::vector<ring_t>> m_rings;
  std::shared_ptr<const render_context_t> m_context;
  issue_list_t m_context_issues;
  session_state_e m_state = session_state_e::EMPTY;

  std::map<std::string, parameter_cache_t> m_cache;
  std::optional<animation_result_t> m_animation;

  // Bumped by every mutation; a job whose number is stale does not publish its result
  std::uint64_t m_generation = 0;

  std::atomic<bool> m_generating{false};
  std::atomic<bool> m_animating{false};
  std::shared_ptr<std::atomic<bool>> m_animation_cancel;
};

// Independent sessions by id; sessions never share ranges, grids or frames
class session_registry_t
{
public:
  auto open(const std::string &id, render_config_t config = {}) -> std::shared_ptr<render_session_t>;
  auto find(const std::string &id) const -> std::shared_ptr<render_session_t>;
  auto close(const std::string &id) -> bool;
  auto ids() const -> std::vector<std::string>;
  auto size() const -> size_t;

private:
  mutable std::mutex m_mutex;
  std::map<std::string, std::shared_ptr<render_session_t>> m_sessions;
};

} // namespace field_mapper
