#include "tickflow/provider/rate_limiter.hpp"

#include <algorithm>
#include <thread>

namespace tickflow {

namespace {

constexpr auto kPollStep = std::chrono::milliseconds(10);

}  // namespace

bool RateLimiter::acquire(const std::atomic<bool>& cancel) {
  Clock::time_point slot;
  {
    std::lock_guard lock(mutex_);
    const auto now = Clock::now();
    slot = std::max(now, next_slot_);
    next_slot_ = slot + spacing_;
  }

  while (Clock::now() < slot) {
    if (cancel.load()) {
      return false;
    }
    const auto remaining = slot - Clock::now();
    std::this_thread::sleep_for(
        std::min<Clock::duration>(remaining, kPollStep));
  }
  return !cancel.load();
}

bool sleep_unless_cancelled(std::chrono::milliseconds duration,
                            const std::atomic<bool>& cancel) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel.load()) {
      return false;
    }
    const auto remaining = deadline - std::chrono::steady_clock::now();
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(remaining, kPollStep));
  }
  return !cancel.load();
}

}  // namespace tickflow
