#include "sample.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <format>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace field_mapper
{

auto validate_sample(const station_sample_t &sample) -> std::optional<std::string>
{
  if (!std::isfinite(sample.latitude) || !std::isfinite(sample.longitude))
    return "non-numeric coordinate";
  if (sample.latitude < -90.0 || sample.latitude > 90.0)
    return std::format("latitude {} out of range", sample.latitude);
  if (sample.longitude < -180.0 || sample.longitude > 180.0)
    return std::format("longitude {} out of range", sample.longitude);
  if (!std::isfinite(sample.value))
    return "non-numeric value";
  if (sample.timestamp.empty())
    return "missing timestamp";
  return std::nullopt;
}

static auto days_from_civil(int y, unsigned m, unsigned d) -> long long
{
  using namespace std::chrono;
  year_month_day ymd{year{y}, month{m}, day{d}};
  if (!ymd.ok())
    return std::numeric_limits<long long>::min();
  return sys_days{ymd}.time_since_epoch().count();
}

auto timestamp_order_key(const std::string &label) -> std::optional<long long>
{
  // ISO date with optional time part: 2024-01-31, 2024-01-31 10:00, 2024-01-31T10:00:00
  {
    std::tm tm = {};
    std::istringstream ss(label);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (!ss.fail())
    {
      long long days = days_from_civil(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
      if (days == std::numeric_limits<long long>::min())
        return std::nullopt;

      long long minutes = days * 24 * 60;
      char sep = 0;
      if (ss.get(sep) && (sep == 'T' || sep == ' '))
      {
        std::tm tm_time = {};
        ss >> std::get_time(&tm_time, "%H:%M");
        if (!ss.fail())
          minutes += tm_time.tm_hour * 60 + tm_time.tm_min;
      }
      return minutes;
    }
  }

  // Month abbreviation and year: Jan-24, Jan-2024, Jan 2024
  static const std::array<const char *, 12> months = {"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
  if (label.size() >= 5)
  {
    std::string mon = label.substr(0, 3);
    std::transform(mon.begin(), mon.end(), mon.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = std::find_if(months.begin(), months.end(), [&](const char *m) { return mon == m; });
    char sep = label[3];
    std::string year_str = label.substr(4);
    bool digits = !year_str.empty() && std::all_of(year_str.begin(), year_str.end(), [](unsigned char c) { return std::isdigit(c) != 0; });

    if (it != months.end() && (sep == '-' || sep == ' ' || sep == '/') && digits && (year_str.size() == 2 || year_str.size() == 4))
    {
      int year = std::stoi(year_str);
      if (year_str.size() == 2)
        year += 2000;
      unsigned month = static_cast<unsigned>(std::distance(months.begin(), it) + 1);
      return days_from_civil(year, month, 1) * 24 * 60;
    }
  }

  return std::nullopt;
}

auto timestamp_less(const std::string &a, const std::string &b) -> bool
{
  auto ka = timestamp_order_key(a);
  auto kb = timestamp_order_key(b);

  if (ka && kb)
  {
    if (*ka != *kb)
      return *ka < *kb;
    return a < b;
  }
  if (ka != kb)
    return ka.has_value(); // Dated labels before undated ones
  return a < b;
}

auto sample_store_t::add(const station_sample_t &sample) -> field_error_e
{
  if (validate_sample(sample))
    return field_error_e::MALFORMED_SAMPLE;

  station_sample_t stored = sample;
  if (stored.parameter.empty())
    stored.parameter = DEFAULT_PARAMETER;

  m_samples[{stored.latitude, stored.longitude, stored.parameter, stored.timestamp}] = stored;
  return field_error_e::NONE;
}

auto sample_store_t::add_batch(const std::vector<station_sample_t> &samples) -> issue_list_t
{
  issue_list_t issues;
  for (size_t i = 0; i < samples.size(); ++i)
  {
    if (auto reason = validate_sample(samples[i]))
    {
      issues.push_back({std::format("row {}", i), field_error_e::MALFORMED_SAMPLE, *reason});
      continue;
    }
    add(samples[i]);
  }
  return issues;
}

auto sample_store_t::remove(double latitude, double longitude, const std::string &parameter, const std::string &timestamp) -> bool
{
  return m_samples.erase({latitude, longitude, parameter, timestamp}) == 1;
}

auto sample_store_t::clear() -> void
{
  m_samples.clear();
}

auto sample_store_t::size() const -> size_t
{
  return m_samples.size();
}

auto sample_store_t::empty() const -> bool
{
  return m_samples.empty();
}

auto sample_store_t::samples() const -> std::vector<station_sample_t>
{
  std::vector<station_sample_t> out;
  out.reserve(m_samples.size());
  for (const auto &[key, sample] : m_samples)
    out.push_back(sample);
  return out;
}

auto sample_store_t::samples_for(const std::string &parameter) const -> std::vector<station_sample_t>
{
  std::vector<station_sample_t> out;
  for (const auto &[key, sample] : m_samples)
  {
    if (sample.parameter == parameter)
      out.push_back(sample);
  }
  return out;
}

auto sample_store_t::samples_for(const std::string &parameter, const std::string &timestamp) const -> std::vector<station_sample_t>
{
  std::vector<station_sample_t> out;
  for (const auto &[key, sample] : m_samples)
  {
    if (sample.parameter == parameter && sample.timestamp == timestamp)
      out.push_back(sample);
  }
  return out;
}

auto sample_store_t::parameters() const -> std::vector<std::string>
{
  std::set<std::string> names;
  for (const auto &[key, sample] : m_samples)
    names.insert(sample.parameter);
  return {names.begin(), names.end()};
}

auto sample_store_t::timestamps(const std::string &parameter) const -> std::vector<std::string>
{
  std::set<std::string> labels;
  for (const auto &[key, sample] : m_samples)
  {
    if (sample.parameter == parameter)
      labels.insert(sample.timestamp);
  }

  std::vector<std::string> out(labels.begin(), labels.end());
  std::sort(out.begin(), out.end(), timestamp_less);
  return out;
}

} // namespace field_mapper
