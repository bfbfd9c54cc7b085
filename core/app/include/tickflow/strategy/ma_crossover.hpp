#pragma once

#include "tickflow/config/engine_config.hpp"
#include "tickflow/strategy/i_strategy.hpp"

namespace tickflow {

// -----------------------------------------------------------------------------
// MACrossover
// -----------------------------------------------------------------------------
// BUY  (ma_cross_up):   previous short <= long, current short > long.
// SELL (ma_cross_down): previous short >= long, current short < long.
// HOLD otherwise. Either MA undefined now → insufficient_data; either MA
// undefined on the previous tick → no_cross (nothing to cross from).
//
// The periods live in the IndicatorEngine; this rule only compares values.
// -----------------------------------------------------------------------------
class MACrossover final : public IStrategy {
 public:
  explicit MACrossover(MACrossoverConfig config) : config_(config) {}

  StrategyDecision decide(
      const std::optional<domain::IndicatorSnapshot>& previous,
      const domain::IndicatorSnapshot& current) const override;

  const char* name() const override { return "ma_crossover"; }

  const MACrossoverConfig& config() const { return config_; }

 private:
  const MACrossoverConfig config_;
};

}  // namespace tickflow
