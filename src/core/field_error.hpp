#pragma once

#include <string>
#include <vector>

namespace field_mapper
{

enum class field_error_e
{
  NONE,
  INSUFFICIENT_STATIONS,
  DEGENERATE_RANGE,
  INVALID_BOUNDARY,
  OUT_OF_BOUNDS_GRID,
  MISSING_STATION_ACROSS_INTERPOLATION_WINDOW,
  MALFORMED_SAMPLE,
  SESSION_BUSY,
  CANCELLED,
  IO_ERROR
};

inline auto to_string(field_error_e error) -> const char *
{
  switch (error)
  {
  case field_error_e::NONE:
    return "None";
  case field_error_e::INSUFFICIENT_STATIONS:
    return "InsufficientStations";
  case field_error_e::DEGENERATE_RANGE:
    return "DegenerateRange";
  case field_error_e::INVALID_BOUNDARY:
    return "InvalidBoundary";
  case field_error_e::OUT_OF_BOUNDS_GRID:
    return "OutOfBoundsGrid";
  case field_error_e::MISSING_STATION_ACROSS_INTERPOLATION_WINDOW:
    return "MissingStationAcrossInterpolationWindow";
  case field_error_e::MALFORMED_SAMPLE:
    return "MalformedSample";
  case field_error_e::SESSION_BUSY:
    return "SessionBusy";
  case field_error_e::CANCELLED:
    return "Cancelled";
  case field_error_e::IO_ERROR:
    return "IoError";
  }
  return "Unknown";
}

// A non-fatal failure reported next to successful results.
// `where` is a timestamp label, a step index or a sample row.
struct issue_t
{
  std::string where;
  field_error_e kind = field_error_e::NONE;
  std::string message;
};

using issue_list_t = std::vector<issue_t>;

} // namespace field_mapper
