#pragma once

#include "tickflow/domain/indicators.hpp"
#include "tickflow/domain/signal.hpp"

#include <optional>
#include <string>

namespace tickflow {

// What a strategy decided for one tick. The engine turns it into a Signal.
struct StrategyDecision {
  domain::SignalKind kind{domain::SignalKind::Hold};
  std::string reason;
};

// -----------------------------------------------------------------------------
// IStrategy — edge-triggered signal rule
// -----------------------------------------------------------------------------
//
// @brief  Decides BUY / SELL / HOLD from the indicator values of the previous
//         and the current tick of one symbol.
//
// @details
// A strategy is stateless: the per-symbol memory (previous snapshot) lives
// in StrategyEngine and is passed in. Comparing previous against current is
// what makes every rule edge-triggered: a condition that keeps holding on
// later ticks produces HOLD.
//
// `previous` is std::nullopt on the first tick of a symbol. Undefined
// indicator values must resolve to HOLD with reason "insufficient_data".
//
// Variants: MACrossover, RsiThreshold. Chosen once by make_strategy().
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual StrategyDecision decide(
      const std::optional<domain::IndicatorSnapshot>& previous,
      const domain::IndicatorSnapshot& current) const = 0;

  virtual const char* name() const = 0;
};

}  // namespace tickflow
