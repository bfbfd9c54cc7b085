#include "tickflow/strategy/ma_crossover.hpp"

#include "reason_format.hpp"

namespace tickflow {

using domain::SignalKind;

StrategyDecision MACrossover::decide(
    const std::optional<domain::IndicatorSnapshot>& previous,
    const domain::IndicatorSnapshot& current) const {
  if (!current.ma_short || !current.ma_long) {
    return {SignalKind::Hold, "insufficient_data"};
  }

  const double s = *current.ma_short;
  const double l = *current.ma_long;

  std::ostringstream reason;
  SignalKind kind = SignalKind::Hold;

  if (!previous || !previous->ma_short || !previous->ma_long) {
    reason << "no_cross";
  } else {
    const double ps = *previous->ma_short;
    const double pl = *previous->ma_long;
    if (ps <= pl && s > l) {
      kind = SignalKind::Buy;
      reason << "ma_cross_up";
    } else if (ps >= pl && s < l) {
      kind = SignalKind::Sell;
      reason << "ma_cross_down";
    } else {
      reason << "no_cross";
    }
  }

  detail::append_value(reason, "ma_short", s);
  detail::append_value(reason, "ma_long", l);
  return {kind, reason.str()};
}

}  // namespace tickflow
