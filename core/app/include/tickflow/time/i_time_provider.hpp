#pragma once

#include <cstdint>

namespace tickflow {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" so that tick timestamps, order records and
//         session liveness can be driven by a controllable clock in tests.
//
// @details
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → value advanced explicitly by the caller.
//
// Components hold a const reference and call now_ms(). Times are epoch
// milliseconds; the wire format converts them to ISO-8601 at the edge
// (see time_utils.hpp).
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. Every symbol
//   pipeline, the broker thread and the hub reaper read the same provider.
//
// Ownership:
//   Borrowed. The provider must outlive every component holding it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tickflow
