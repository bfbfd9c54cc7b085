#pragma once

#include "tickflow/domain/order.hpp"
#include "tickflow/domain/position.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tickflow {
namespace domain {

// -----------------------------------------------------------------------------
// AccountSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Immutable copy of the paper account plus its derived equity.
//
// @details
// Produced by PaperBroker after every processed tick and carried inside the
// composite tick message. equity is computed at snapshot time as
//
//   cash + sum(position.qty * latest_price[position.symbol])
//
// where latest_price is the most recent price seen for each symbol, across
// all pipelines. It is never stored in the account itself.
//
// version is the broker's mutation counter at snapshot time. Snapshots
// travel through several pipelines and can arrive out of order; a higher
// version is always the more recent account.
//
// positions is an ordered map so serialized output is stable.
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  double cash{0.0};
  double equity{0.0};
  double realized_pnl{0.0};
  std::map<std::string, Position> positions;
  std::optional<OrderRecord> last_order;
  std::uint64_t version{0};
};

}  // namespace domain
}  // namespace tickflow
