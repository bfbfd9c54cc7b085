#include "tickflow/provider/simulated_provider.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tickflow {

namespace {

// FNV-1a. std::hash<std::string> is not guaranteed stable across standard
// library implementations, and the per-symbol sequence must be.
std::uint64_t fnv1a(const std::string& s) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

constexpr double kPriceFloor = 0.01;

}  // namespace

SimulatedProvider::SimulatedProvider(SimulatedProviderConfig config,
                                     const ITimeProvider& time_provider)
    : config_(std::move(config)), time_provider_(time_provider) {}

SimulatedProvider::Walk& SimulatedProvider::walk_for(const std::string& symbol) {
  auto it = walks_.find(symbol);
  if (it == walks_.end()) {
    const std::uint64_t base =
        config_.seed ? *config_.seed
                     : (static_cast<std::uint64_t>(std::random_device{}()) << 32) ^
                           std::random_device{}();
    it = walks_
             .emplace(symbol,
                      Walk{config_.start_price, std::mt19937_64(base ^ fnv1a(symbol))})
             .first;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// fetch(): one step of the walk. Cannot fail; `cancel` is irrelevant here.
// -----------------------------------------------------------------------------
ProviderResult SimulatedProvider::fetch(const std::string& symbol,
                                        const std::atomic<bool>& /*cancel*/) {
  double price = 0.0;
  {
    std::lock_guard lock(mutex_);
    Walk& walk = walk_for(symbol);

    double r = config_.drift;
    if (config_.volatility > 0.0) {
      std::normal_distribution<double> step(config_.drift, config_.volatility);
      r = step(walk.rng);
    }
    walk.price = std::max(kPriceFloor, walk.price * std::exp(r));
    price = walk.price;
  }

  return ProviderResult::success(
      domain::Tick{symbol, price, time_provider_.now_ms()});
}

void SimulatedProvider::forget(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  walks_.erase(symbol);
}

std::size_t SimulatedProvider::symbol_count() const {
  std::lock_guard lock(mutex_);
  return walks_.size();
}

}  // namespace tickflow
