#pragma once

#include "tickflow/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace tickflow {
namespace domain {

// Unique per engine, assigned by the PaperBroker starting at 1.
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* to_string(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

// -----------------------------------------------------------------------------
// OrderRecord
// -----------------------------------------------------------------------------
//
// @brief  The account's record of the most recent order attempt.
//
// @details
// Created by PaperBroker for every BUY or SELL signal, filled or not. For a
// rejected order qty is the quantity that was attempted (0 when none could be
// computed) and reason is one of:
//
//   insufficient_cash      cost of one lot, or of the sized qty, exceeds cash
//   position_already_open  BUY while holding and pyramiding is disabled
//   no_position            SELL with qty 0
//   invalid_price          tick price not a finite positive number
//
// Filled orders carry an empty reason.
//
// Ownership:
//   The authoritative copy lives in the Account on the broker thread. Copies
//   travel inside AccountSnapshot and are never mutated.
// -----------------------------------------------------------------------------
struct OrderRecord {
  OrderId id{};
  std::string symbol;
  Side side{Side::Buy};
  double qty{0.0};
  double price{0.0};
  OrderStatus status{OrderStatus::Rejected};
  std::string reason;
  std::int64_t ts_ms{0};
};

}  // namespace domain
}  // namespace tickflow
