#pragma once

#include "tickflow/config/engine_config.hpp"
#include "tickflow/strategy/i_strategy.hpp"

namespace tickflow {

// -----------------------------------------------------------------------------
// RsiThreshold
// -----------------------------------------------------------------------------
// Reversal rule on RSI crossings:
//   BUY  (rsi_cross_below_oversold):   previous >= oversold, current < oversold
//   SELL (rsi_cross_above_overbought): previous <= overbought, current > overbought
// HOLD while RSI is undefined or when neither threshold was crossed.
// -----------------------------------------------------------------------------
class RsiThreshold final : public IStrategy {
 public:
  explicit RsiThreshold(RsiConfig config) : config_(config) {}

  StrategyDecision decide(
      const std::optional<domain::IndicatorSnapshot>& previous,
      const domain::IndicatorSnapshot& current) const override;

  const char* name() const override { return "rsi_threshold"; }

 private:
  const RsiConfig config_;
};

}  // namespace tickflow
