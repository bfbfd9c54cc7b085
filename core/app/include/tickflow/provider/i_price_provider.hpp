#pragma once

#include "tickflow/domain/tick.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace tickflow {

// -----------------------------------------------------------------------------
// ProviderResult — outcome of one fetch
// -----------------------------------------------------------------------------
//
// @brief  Either a tick or an error message for one symbol, never both.
//
// @details
// Expected failures (network, HTTP status, unparsable body, unknown symbol
// format, rate-limit exhaustion) are values, not exceptions: the
// ProviderThread forwards them as ProviderErrorEvent and keeps polling.
// ts_ms is set in both cases so the error message can be timestamped.
// -----------------------------------------------------------------------------
struct ProviderResult {
  std::optional<domain::Tick> tick;
  std::string error;
  std::int64_t ts_ms{0};

  bool ok() const { return tick.has_value(); }

  static ProviderResult success(domain::Tick t) {
    ProviderResult r;
    r.ts_ms = t.ts_ms;
    r.tick = std::move(t);
    return r;
  }

  static ProviderResult failure(std::string message, std::int64_t ts_ms) {
    ProviderResult r;
    r.error = std::move(message);
    r.ts_ms = ts_ms;
    return r;
  }
};

// -----------------------------------------------------------------------------
// IPriceProvider — "produce the next tick for a symbol, or an error"
// -----------------------------------------------------------------------------
//
// @brief  The single capability every price source implements.
//
// @details
// Variants:
//   - SimulatedProvider   → seeded geometric random walk, no I/O.
//   - PolledHttpProvider  → one HTTP GET per call against a quote endpoint.
//
// The variant is chosen once by make_price_provider() from the validated
// ProviderConfig. Nothing downstream ever asks which variant it holds.
//
// Cancellation:
//   fetch() observes `cancel`. An implementation that blocks (rate-limit
//   wait, backoff sleep, network transfer) must return promptly once it is
//   set; the returned result is then discarded by the caller.
//
// Thread model:
//   One provider instance is shared by every symbol's ProviderThread, so
//   fetch() must be safe to call concurrently for different symbols.
// -----------------------------------------------------------------------------
class IPriceProvider {
 public:
  virtual ~IPriceProvider() = default;

  virtual ProviderResult fetch(const std::string& symbol,
                               const std::atomic<bool>& cancel) = 0;

  // Uncancellable convenience form.
  ProviderResult fetch(const std::string& symbol) {
    static const std::atomic<bool> kNeverCancelled{false};
    return fetch(symbol, kNeverCancelled);
  }

  // Releases any per-symbol state, so a later subscription starts fresh.
  // Stateless providers have nothing to release.
  virtual void forget(const std::string& /*symbol*/) {}

  // Short tag for logs and the health payload ("simulated", "polled_http").
  virtual const char* name() const = 0;
};

}  // namespace tickflow
