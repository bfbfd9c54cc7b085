#pragma once

#include <atomic>
#include <chrono>
#include <mutex>

namespace tickflow {

// -----------------------------------------------------------------------------
// RateLimiter — minimum spacing between upstream calls
// -----------------------------------------------------------------------------
//
// @brief  Hands out call slots at least `spacing` apart, across every thread
//         that shares the limiter.
//
// @details
// The quote endpoint is unofficial and throttles aggressive clients. All
// symbol threads of a PolledHttpProvider share one limiter, so N symbols
// polled every second still never hit the endpoint more often than once per
// `spacing`.
//
// acquire() reserves the next free slot under the mutex, then sleeps outside
// it until that slot, in short steps so `cancel` is honoured. A cancelled
// waiter keeps its reservation; the slot simply goes unused.
//
// Thread model:
//   acquire() is safe from any thread.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(std::chrono::milliseconds spacing) : spacing_(spacing) {}

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // -------------------------------------------------------------------------
  // acquire(cancel)
  // -------------------------------------------------------------------------
  // @return true when the caller may issue its call now, false if `cancel`
  //         was set while waiting.
  // -------------------------------------------------------------------------
  bool acquire(const std::atomic<bool>& cancel);

  std::chrono::milliseconds spacing() const { return spacing_; }

 private:
  const std::chrono::milliseconds spacing_;
  std::mutex mutex_;
  Clock::time_point next_slot_{};
};

// -----------------------------------------------------------------------------
// sleep_unless_cancelled(duration, cancel)
// -----------------------------------------------------------------------------
// Sleeps in steps of at most 10 ms until `duration` elapses or `cancel` is
// set. Returns false if cancelled. Used for the retry backoff.
// -----------------------------------------------------------------------------
bool sleep_unless_cancelled(std::chrono::milliseconds duration,
                            const std::atomic<bool>& cancel);

}  // namespace tickflow
