#pragma once

#include <string>

namespace tickflow {
namespace domain {

// -----------------------------------------------------------------------------
// Position — long-only holding in one symbol
// -----------------------------------------------------------------------------
//
// @brief  Quantity held and its cost-weighted average entry price.
//
// @details
// qty is never negative (no short-selling). avg_price is updated on every
// filled BUY as
//
//   avg = (qty_old * avg_old + qty_fill * price) / (qty_old + qty_fill)
//
// and both fields return to (0, 0) when a SELL liquidates the position. A
// cleared position stays in the account's map so consumers keep seeing the
// symbol with qty 0.
//
// Thread model:
//   Value type; the mutable copy lives in PaperBroker on the broker thread.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double qty{0.0};
  double avg_price{0.0};
};

}  // namespace domain
}  // namespace tickflow
