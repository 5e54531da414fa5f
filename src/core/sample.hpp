#pragma once

#include "field_error.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace field_mapper
{

constexpr const char *DEFAULT_PARAMETER = "UploadedParameter";

struct station_sample_t
{
  double latitude = 0.0;
  double longitude = 0.0;
  std::string parameter = DEFAULT_PARAMETER;
  std::string timestamp; // Label, ordered with timestamp_less()
  double value = 0.0;
};

// Returns a human readable reason when the sample can not be used, or nullopt
auto validate_sample(const station_sample_t &sample) -> std::optional<std::string>;

// Chronological key for labels such as "2024-01-31", "2024-01-31T10:00" or "Jan-24".
// Minutes since 1970-01-01, nullopt when the label is not a recognised date.
auto timestamp_order_key(const std::string &label) -> std::optional<long long>;

// Total order over timestamp labels: dated labels first (chronologically), then the rest lexicographically
auto timestamp_less(const std::string &a, const std::string &b) -> bool;

// Set of samples keyed by (latitude, longitude, parameter, timestamp).
// Writing an existing key overwrites the stored value.
class sample_store_t
{
public:
  sample_store_t() = default;
  ~sample_store_t() = default;

  // Returns MALFORMED_SAMPLE and leaves the store untouched if the sample is invalid
  auto add(const station_sample_t &sample) -> field_error_e;

  // Adds every valid sample, reporting the malformed ones by row index
  auto add_batch(const std::vector<station_sample_t> &samples) -> issue_list_t;

  // Removes exactly the sample matching the key. Returns false if there was none.
  auto remove(double latitude, double longitude, const std::string &parameter, const std::string &timestamp) -> bool;

  auto clear() -> void;

  auto size() const -> size_t;
  auto empty() const -> bool;

  auto samples() const -> std::vector<station_sample_t>;
  auto samples_for(const std::string &parameter) const -> std::vector<station_sample_t>;
  auto samples_for(const std::string &parameter, const std::string &timestamp) const -> std::vector<station_sample_t>;

  auto parameters() const -> std::vector<std::string>;

  // Distinct timestamps of a parameter in timestamp_less() order
  auto timestamps(const std::string &parameter) const -> std::vector<std::string>;

private:
  using key_t = std::tuple<double, double, std::string, std::string>;

  std::map<key_t, station_sample_t> m_samples;
};

} // namespace field_mapper
