#pragma once

#include <cstdint>
#include <string>

namespace tickflow {
namespace domain {

// -----------------------------------------------------------------------------
// Tick — one price observation
// -----------------------------------------------------------------------------
//
// @brief  A single price for one symbol at one instant, as emitted by a
//         price provider.
//
// @details
// Immutable once emitted: the ProviderThread builds it, the symbol pipeline
// copies it into its events, and the BroadcastHub stores the latest one per
// symbol in the SnapshotStore. price is always > 0 for a tick that reached
// the pipeline; providers turn anything else into an error result.
//
// Thread model:
//   Value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct Tick {
  std::string symbol;     // Canonical symbol as configured (e.g. "SH600000")
  double price{0.0};      // Last traded price, strictly positive
  std::int64_t ts_ms{0};  // Observation time, epoch milliseconds
};

}  // namespace domain
}  // namespace tickflow
