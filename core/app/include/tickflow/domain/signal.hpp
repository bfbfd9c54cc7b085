#pragma once

#include <cstdint>
#include <string>

namespace tickflow {
namespace domain {

// -----------------------------------------------------------------------------
// SignalKind
// -----------------------------------------------------------------------------
// Hold is the default: a strategy that sees nothing worth acting on still
// produces a Signal, so every tick flows through the broker for
// mark-to-market.
// -----------------------------------------------------------------------------
enum class SignalKind {
  Hold,
  Buy,
  Sell,
};

inline const char* to_string(SignalKind kind) {
  switch (kind) {
    case SignalKind::Buy:
      return "BUY";
    case SignalKind::Sell:
      return "SELL";
    case SignalKind::Hold:
      break;
  }
  return "HOLD";
}

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
//
// @brief  Output of the StrategyEngine for one tick.
//
// @details
// reason names the trigger and the values behind it, for example
// "ma_cross_up ma_short=11.0000 ma_long=10.6667" or "insufficient_data".
// It travels to consumers as signal_meta.reason.
// -----------------------------------------------------------------------------
struct Signal {
  std::string symbol;
  SignalKind kind{SignalKind::Hold};
  std::string reason;
  std::int64_t ts_ms{0};
};

}  // namespace domain
}  // namespace tickflow
