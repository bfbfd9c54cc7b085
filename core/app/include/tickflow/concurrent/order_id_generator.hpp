#pragma once

#include <atomic>
#include <cstdint>

namespace tickflow {

// -----------------------------------------------------------------------------
// OrderIdGenerator — monotonically increasing paper-order ID source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique order IDs for the OrderRecords produced by the
//         PaperBroker, filled and rejected alike.
//
// @details
// IDs start at 1; 0 is reserved as "unset". The counter is atomic so the
// generator stays correct if it is ever shared between brokers, even though
// today only the BrokerThread calls next_id(). Relaxed ordering suffices:
// uniqueness is the only requirement.
//
// Ownership:
//   Owned by value inside PaperBroker.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tickflow
