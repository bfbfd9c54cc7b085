#pragma once

#include <optional>

namespace tickflow {
namespace domain {

// -----------------------------------------------------------------------------
// IndicatorSnapshot
// -----------------------------------------------------------------------------
//
// @brief  The indicator values for one symbol after one tick.
//
// @details
// Each field is std::nullopt until its window is full. An undefined value is
// "insufficient data", never zero; strategies resolve it to HOLD and the
// wire format writes it as JSON null.
// -----------------------------------------------------------------------------
struct IndicatorSnapshot {
  std::optional<double> ma_short;
  std::optional<double> ma_long;
  std::optional<double> rsi;
};

}  // namespace domain
}  // namespace tickflow
