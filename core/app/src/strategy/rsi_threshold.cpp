#include "tickflow/strategy/rsi_threshold.hpp"

#include "reason_format.hpp"

namespace tickflow {

using domain::SignalKind;

// -----------------------------------------------------------------------------
// decide(): reason lists the current RSI, the previous RSI and the threshold
// that was crossed, e.g.
//   "rsi_cross_below_oversold rsi=28.4000 prev_rsi=31.2000 oversold=30.0000"
// -----------------------------------------------------------------------------
StrategyDecision RsiThreshold::decide(
    const std::optional<domain::IndicatorSnapshot>& previous,
    const domain::IndicatorSnapshot& current) const {
  if (!current.rsi) {
    return {SignalKind::Hold, "insufficient_data"};
  }
  const double rsi = *current.rsi;

  std::ostringstream reason;
  if (!previous || !previous->rsi) {
    reason << "no_cross";
    detail::append_value(reason, "rsi", rsi);
    return {SignalKind::Hold, reason.str()};
  }
  const double prev = *previous->rsi;

  if (prev >= config_.oversold && rsi < config_.oversold) {
    reason << "rsi_cross_below_oversold";
    detail::append_value(reason, "rsi", rsi);
    detail::append_value(reason, "prev_rsi", prev);
    detail::append_value(reason, "oversold", config_.oversold);
    return {SignalKind::Buy, reason.str()};
  }

  if (prev <= config_.overbought && rsi > config_.overbought) {
    reason << "rsi_cross_above_overbought";
    detail::append_value(reason, "rsi", rsi);
    detail::append_value(reason, "prev_rsi", prev);
    detail::append_value(reason, "overbought", config_.overbought);
    return {SignalKind::Sell, reason.str()};
  }

  reason << "no_cross";
  detail::append_value(reason, "rsi", rsi);
  return {SignalKind::Hold, reason.str()};
}

}  // namespace tickflow
