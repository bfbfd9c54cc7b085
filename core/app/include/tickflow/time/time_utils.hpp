#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace tickflow {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Conversions between epoch milliseconds (the engine's internal time
//         unit), std::chrono::system_clock::time_point, and the ISO-8601 UTC
//         strings carried by every outbound JSON message ("ts" fields).
//
// Thread-safety: Stateless. format_iso8601() uses gmtime_r, not gmtime, so it
//                is safe to call from every pipeline thread concurrently.
// -----------------------------------------------------------------------------

using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// format_iso8601
// -------------------------------------------------------------------------
// @brief  Formats epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
//
// @param  ms  Milliseconds since epoch. Negative values are clamped to 0.
// @return The UTC timestamp string.
// -------------------------------------------------------------------------
inline std::string format_iso8601(std::int64_t ms) {
  if (ms < 0) {
    ms = 0;
  }
  const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  const int millis = static_cast<int>(ms % 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", date, millis);
  return out;
}

}  // namespace tickflow
