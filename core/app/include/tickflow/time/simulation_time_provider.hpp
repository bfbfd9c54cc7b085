#pragma once

#include "tickflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tickflow {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Tests use it to make tick timestamps, order-record timestamps and the
// BroadcastHub keepalive deadline deterministic: advance the clock past the
// keepalive timeout, call reapExpired(), and the silent session is gone
// without sleeping in real time.
//
// Storage is a single std::atomic<int64_t>; reads are lock-free and see the
// most recent store from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute time.
  //
  // @details
  // Monotonicity is the caller's responsibility; tests occasionally need to
  // set arbitrary values.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by `delta_ms` and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tickflow
