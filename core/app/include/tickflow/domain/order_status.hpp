#pragma once

namespace tickflow {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
//
// @brief  Outcome of one paper order.
//
// @details
// The paper broker fills synchronously at the tick price, so an order is
// terminal the moment it is recorded: either it moved cash and position
// (Filled) or it changed nothing but the account's last_order (Rejected).
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Filled,
  Rejected,
};

inline const char* to_string(OrderStatus status) {
  return status == OrderStatus::Filled ? "FILLED" : "REJECTED";
}

}  // namespace domain
}  // namespace tickflow
