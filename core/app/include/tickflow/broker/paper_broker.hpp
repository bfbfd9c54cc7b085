#pragma once

#include "tickflow/broker/position_sizer.hpp"
#include "tickflow/broker/single_writer_guard.hpp"
#include "tickflow/concurrent/order_id_generator.hpp"
#include "tickflow/config/engine_config.hpp"
#include "tickflow/domain/account.hpp"
#include "tickflow/domain/order.hpp"
#include "tickflow/domain/signal.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tickflow {

// -----------------------------------------------------------------------------
// PaperBroker — simulated account
// -----------------------------------------------------------------------------
//
// @brief  Applies signals to one virtual cash account with long-only
//         positions, filling instantly at the tick price.
//
// @details
// on_signal(signal, price) is the one entry point used by the pipeline:
//   1. record `price` as the symbol's mark (latest known price);
//   2. BUY  → buy(), SELL → sell(), HOLD → nothing more;
//   3. return snapshot().
//
// BUY preconditions, checked in this order:
//   price finite and > 0                         else invalid_price
//   no open position, unless allow_pyramiding   else position_already_open
//   sized qty, floored to lot_size, >= lot_size  else insufficient_cash
//   qty * price <= cash                          else insufficient_cash
// On fill: cash -= qty * price, qty += fill, avg_price cost-weighted.
//
// SELL liquidates the whole position at the tick price: cash += qty * price,
// realized_pnl += qty * (price - avg_price), position reset to (0, 0).
// A SELL with qty 0 is rejected with no_position.
//
// A rejection changes nothing but last_order (its status REJECTED, with the
// reason). Every attempt, filled or rejected, gets a fresh order id.
//
// Equity (computed in snapshot(), never stored):
//   cash + sum over positions of qty * mark[symbol]
// using the latest mark of each symbol, whichever pipeline last priced it.
//
// Every mutating call bumps a version counter first, and snapshot() stamps
// it into AccountSnapshot::version. Consumers receiving snapshots out of
// order (one per pipeline) keep the highest version.
//
// Thread model:
//   Not thread-safe by design: every mutating call goes through a
//   SingleWriterGuard. In the engine the owner is the BrokerThread loop;
//   symbol pipelines only talk to it through BrokerRequestEvent.
//   snapshot() and the const accessors must also be called from the owner,
//   or while no owner is running.
// -----------------------------------------------------------------------------
class PaperBroker {
 public:
  PaperBroker(BrokerConfig config, std::unique_ptr<IPositionSizer> sizer);

  PaperBroker(const PaperBroker&) = delete;
  PaperBroker& operator=(const PaperBroker&) = delete;

  // Mark, execute, snapshot. See class comment.
  domain::AccountSnapshot on_signal(const domain::Signal& signal, double price);

  // Records the latest price of `symbol` for equity. Ignores invalid prices.
  void mark(const std::string& symbol, double price);

  const domain::OrderRecord& buy(const std::string& symbol, double price,
                                 std::int64_t ts_ms);
  const domain::OrderRecord& sell(const std::string& symbol, double price,
                                  std::int64_t ts_ms);

  domain::AccountSnapshot snapshot() const;

  double cash() const { return cash_; }
  double realized_pnl() const { return realized_pnl_; }
  std::uint64_t version() const { return version_; }
  double equity() const;

  // Zero position if the symbol was never bought.
  domain::Position position(const std::string& symbol) const;

  const std::optional<domain::OrderRecord>& last_order() const {
    return last_order_;
  }

  // Latest known price of `symbol`, if any.
  std::optional<double> mark_price(const std::string& symbol) const;

  // Drops the writer binding. See SingleWriterGuard::rebind().
  void release_writer() { guard_.rebind(); }

  const IPositionSizer& sizer() const { return *sizer_; }

 private:
  const domain::OrderRecord& reject(const std::string& symbol,
                                    domain::Side side, double qty,
                                    double price, const char* reason,
                                    std::int64_t ts_ms);

  const BrokerConfig config_;
  const std::unique_ptr<IPositionSizer> sizer_;

  SingleWriterGuard guard_{"PaperBroker"};
  OrderIdGenerator order_ids_;

  double cash_;
  double realized_pnl_{0.0};
  std::uint64_t version_{0};
  std::map<std::string, domain::Position> positions_;
  std::map<std::string, double> marks_;
  std::optional<domain::OrderRecord> last_order_;
};

}  // namespace tickflow
