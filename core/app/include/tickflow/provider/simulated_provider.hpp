#pragma once

#include "tickflow/config/engine_config.hpp"
#include "tickflow/provider/i_price_provider.hpp"
#include "tickflow/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace tickflow {

// -----------------------------------------------------------------------------
// SimulatedProvider — seeded geometric random walk
// -----------------------------------------------------------------------------
//
// @brief  Offline price source for demos and tests.
//
// @details
// Each symbol walks independently from `start_price`:
//
//   r     ~ N(drift, volatility)
//   price = max(0.01, price * exp(r))
//
// Every symbol owns its own generator, seeded from the configured seed mixed
// with a hash of the symbol name. The sequence for a symbol therefore depends
// only on (seed, symbol), not on how calls for different symbols interleave
// across threads. Without a seed the generators are seeded from
// std::random_device.
//
// With volatility 0 the walk is deterministic: price * exp(drift) each step.
//
// forget() erases a symbol's walk when it is unsubscribed, so the map only
// holds subscribed symbols and a re-subscription replays from the start.
//
// Thread model:
//   fetch() and forget() lock a mutex around the per-symbol state map and the step.
// -----------------------------------------------------------------------------
class SimulatedProvider final : public IPriceProvider {
 public:
  SimulatedProvider(SimulatedProviderConfig config,
                    const ITimeProvider& time_provider);

  using IPriceProvider::fetch;
  ProviderResult fetch(const std::string& symbol,
                       const std::atomic<bool>& cancel) override;

  // Drops the symbol's walk; the next fetch() restarts it from start_price
  // with a freshly seeded generator.
  void forget(const std::string& symbol) override;

  std::size_t symbol_count() const;

  const char* name() const override { return "simulated"; }

 private:
  struct Walk {
    double price;
    std::mt19937_64 rng;
  };

  Walk& walk_for(const std::string& symbol);

  const SimulatedProviderConfig config_;
  const ITimeProvider& time_provider_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Walk> walks_;
};

}  // namespace tickflow
