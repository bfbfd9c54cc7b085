#pragma once

#include "tickflow/config/engine_config.hpp"
#include "tickflow/domain/indicators.hpp"
#include "tickflow/domain/tick.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tickflow {

// Window sizes the engine computes. Derived from the strategy section so the
// indicators a strategy reads are always the ones being maintained.
struct IndicatorConfig {
  int ma_short{10};
  int ma_long{30};
  int rsi_period{14};

  static IndicatorConfig from(const StrategyConfig& strategy) {
    return IndicatorConfig{strategy.ma_crossover.short_period,
                           strategy.ma_crossover.long_period,
                           strategy.rsi.period};
  }
};

// -----------------------------------------------------------------------------
// IndicatorEngine — rolling per-symbol indicators
// -----------------------------------------------------------------------------
//
// @brief  Maintains a bounded price history per symbol and derives the short
//         and long simple moving averages and Wilder RSI on every tick.
//
// @details
// Per-symbol state:
//   - history: the last max(ma_long, rsi_period) + 1 prices, oldest evicted;
//   - Wilder state: previous price, avg_gain, avg_loss, number of price
//     changes seen.
//
// Moving averages are the arithmetic mean of the last N prices and are
// undefined until N prices have arrived, defined exactly at the N-th.
//
// RSI is updated in O(1) per tick. Both averages start at 0 and every price
// change after the first price is folded in with
//
//   avg = (avg_prev * (period - 1) + x) / period
//
// for x = gain and x = loss. RSI is undefined until `period` changes have
// been observed (period + 1 prices) and then
//
//   avg_loss == 0, avg_gain > 0   → 100
//   avg_loss == 0, avg_gain == 0  → 50   (flat series)
//   otherwise                     → 100 - 100 / (1 + avg_gain / avg_loss)
//
// so it always lies in [0, 100].
//
// Thread model:
//   One engine is shared by all symbol pipelines. The map of states is
//   guarded by a mutex held only for lookup, insertion and erase; each
//   state is heap-allocated and mutated only by its own symbol's loop
//   thread, so pipelines never contend on the arithmetic.
//
// Ownership:
//   Owned by TradingEngine.
// -----------------------------------------------------------------------------
class IndicatorEngine {
 public:
  explicit IndicatorEngine(IndicatorConfig config);

  IndicatorEngine(const IndicatorEngine&) = delete;
  IndicatorEngine& operator=(const IndicatorEngine&) = delete;

  // -------------------------------------------------------------------------
  // update(tick)
  // -------------------------------------------------------------------------
  // @brief  Folds `tick.price` into the symbol's state.
  // @return The indicator values after this tick.
  //
  // Thread-safety: concurrent calls for different symbols are safe; calls
  // for the same symbol must come from one thread at a time.
  // -------------------------------------------------------------------------
  domain::IndicatorSnapshot update(const domain::Tick& tick);

  // Releases the symbol's history and Wilder state. The next tick for it
  // starts from scratch.
  void forget(const std::string& symbol);

  // Prices currently held for `symbol` (0 if unknown).
  std::size_t history_size(const std::string& symbol) const;

  std::size_t history_capacity() const { return capacity_; }

  std::size_t symbol_count() const;

  const IndicatorConfig& config() const { return config_; }

 private:
  struct State {
    std::deque<double> history;
    std::optional<double> previous_price;
    double avg_gain{0.0};
    double avg_loss{0.0};
    int changes{0};
  };

  State& state_for(const std::string& symbol);
  std::optional<double> mean_of_last(const State& state, int n) const;
  std::optional<double> rsi_of(const State& state) const;

  const IndicatorConfig config_;
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<State>> states_;
};

}  // namespace tickflow
