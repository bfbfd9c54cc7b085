#pragma once

#include "tickflow/domain/indicators.hpp"
#include "tickflow/domain/signal.hpp"
#include "tickflow/domain/tick.hpp"
#include "tickflow/strategy/i_strategy.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tickflow {

// -----------------------------------------------------------------------------
// StrategyEngine
// -----------------------------------------------------------------------------
//
// @brief  Runs one IStrategy over every symbol, keeping the per-symbol memory
//         that makes its signals edge-triggered.
//
// @details
// StrategyMemory per symbol:
//   - last:         the indicator snapshot of the previous tick;
//   - last_emitted: the last non-HOLD kind produced (HOLD until the first
//                   BUY or SELL).
//
// evaluate() asks the strategy to compare `last` with the new snapshot, then
// stores the new snapshot as `last`. The Signal carries the tick's symbol
// and timestamp.
//
// Thread model:
//   Same scheme as IndicatorEngine: the memory map is mutex-guarded for
//   lookup and erase, and each symbol's memory is touched only by that
//   symbol's loop thread.
// -----------------------------------------------------------------------------
class StrategyEngine {
 public:
  explicit StrategyEngine(std::unique_ptr<IStrategy> strategy);

  StrategyEngine(const StrategyEngine&) = delete;
  StrategyEngine& operator=(const StrategyEngine&) = delete;

  domain::Signal evaluate(const domain::Tick& tick,
                          const domain::IndicatorSnapshot& indicators);

  void forget(const std::string& symbol);

  // Last BUY/SELL emitted for `symbol`, HOLD if none or unknown.
  domain::SignalKind last_emitted(const std::string& symbol) const;

  std::size_t symbol_count() const;

  const IStrategy& strategy() const { return *strategy_; }

 private:
  struct Memory {
    std::optional<domain::IndicatorSnapshot> last;
    domain::SignalKind last_emitted{domain::SignalKind::Hold};
  };

  Memory& memory_for(const std::string& symbol);

  const std::unique_ptr<IStrategy> strategy_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<Memory>> memory_;
};

}  // namespace tickflow
