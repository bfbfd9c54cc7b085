#include "tickflow/broker/paper_broker.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace tickflow {

using domain::OrderRecord;
using domain::OrderStatus;
using domain::Side;

namespace {

// Absorbs representation error so 5000 / 100 floors to 50, not 49.
constexpr double kLotEpsilon = 1e-9;

bool valid_price(double price) { return std::isfinite(price) && price > 0.0; }

}  // namespace

PaperBroker::PaperBroker(BrokerConfig config,
                         std::unique_ptr<IPositionSizer> sizer)
    : config_(std::move(config)),
      sizer_(std::move(sizer)),
      cash_(config_.starting_cash) {
  if (!sizer_) {
    throw std::invalid_argument("PaperBroker requires a position sizer");
  }
}

// -----------------------------------------------------------------------------
// on_signal(signal, price)
// -----------------------------------------------------------------------------
domain::AccountSnapshot PaperBroker::on_signal(const domain::Signal& signal,
                                               double price) {
  guard_.check("on_signal");

  mark(signal.symbol, price);  // HOLD ticks still move equity
  switch (signal.kind) {
    case domain::SignalKind::Buy:
      buy(signal.symbol, price, signal.ts_ms);
      break;
    case domain::SignalKind::Sell:
      sell(signal.symbol, price, signal.ts_ms);
      break;
    case domain::SignalKind::Hold:
      break;
  }
  return snapshot();
}

void PaperBroker::mark(const std::string& symbol, double price) {
  guard_.check("mark");
  ++version_;
  if (valid_price(price)) {
    marks_[symbol] = price;
  }
}

// -----------------------------------------------------------------------------
// buy(symbol, price, ts_ms)
// -----------------------------------------------------------------------------
const OrderRecord& PaperBroker::buy(const std::string& symbol, double price,
                                    std::int64_t ts_ms) {
  guard_.check("buy");
  mark(symbol, price);

  if (!valid_price(price)) {
    return reject(symbol, Side::Buy, 0.0, price, "invalid_price", ts_ms);
  }

  auto existing = positions_.find(symbol);
  const bool open = existing != positions_.end() && existing->second.qty > 0.0;
  if (open && !config_.allow_pyramiding) {
    return reject(symbol, Side::Buy, 0.0, price, "position_already_open",
                  ts_ms);
  }

  const double raw = sizer_->quantity(cash_, price);
  const double lots = std::floor(raw / config_.lot_size + kLotEpsilon);
  const double qty = lots * config_.lot_size;
  if (lots < 1.0) {
    return reject(symbol, Side::Buy, 0.0, price, "insufficient_cash", ts_ms);
  }

  const double cost = qty * price;
  if (cost > cash_) {
    return reject(symbol, Side::Buy, qty, price, "insufficient_cash", ts_ms);
  }

  domain::Position& position = positions_[symbol];
  position.symbol = symbol;
  const double new_qty = position.qty + qty;
  position.avg_price = (position.qty * position.avg_price + cost) / new_qty;
  position.qty = new_qty;
  cash_ -= cost;

  last_order_ = OrderRecord{order_ids_.next_id(), symbol, Side::Buy, qty,
                            price, OrderStatus::Filled, "", ts_ms};
  return *last_order_;
}

// -----------------------------------------------------------------------------
// sell(symbol, price, ts_ms): full liquidation
// -----------------------------------------------------------------------------
const OrderRecord& PaperBroker::sell(const std::string& symbol, double price,
                                     std::int64_t ts_ms) {
  guard_.check("sell");
  mark(symbol, price);

  if (!valid_price(price)) {
    return reject(symbol, Side::Sell, 0.0, price, "invalid_price", ts_ms);
  }

  auto it = positions_.find(symbol);
  if (it == positions_.end() || it->second.qty <= 0.0) {
    return reject(symbol, Side::Sell, 0.0, price, "no_position", ts_ms);
  }

  domain::Position& position = it->second;
  const double qty = position.qty;
  cash_ += qty * price;
  realized_pnl_ += qty * (price - position.avg_price);
  position.qty = 0.0;
  position.avg_price = 0.0;

  last_order_ = OrderRecord{order_ids_.next_id(), symbol, Side::Sell, qty,
                            price, OrderStatus::Filled, "", ts_ms};
  return *last_order_;
}

const OrderRecord& PaperBroker::reject(const std::string& symbol, Side side,
                                       double qty, double price,
                                       const char* reason,
                                       std::int64_t ts_ms) {
  last_order_ = OrderRecord{order_ids_.next_id(), symbol, side, qty, price,
                            OrderStatus::Rejected, reason, ts_ms};
  return *last_order_;
}

// -----------------------------------------------------------------------------
// Read side
// -----------------------------------------------------------------------------
double PaperBroker::equity() const {
  double value = cash_;
  for (const auto& [symbol, position] : positions_) {
    if (position.qty <= 0.0) {
      continue;
    }
    auto mark_it = marks_.find(symbol);
    const double price =
        mark_it != marks_.end() ? mark_it->second : position.avg_price;
    value += position.qty * price;
  }
  return value;
}

domain::AccountSnapshot PaperBroker::snapshot() const {
  domain::AccountSnapshot snap;
  snap.cash = cash_;
  snap.equity = equity();
  snap.realized_pnl = realized_pnl_;
  snap.positions = positions_;
  snap.last_order = last_order_;
  snap.version = version_;
  return snap;
}

domain::Position PaperBroker::position(const std::string& symbol) const {
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return domain::Position{symbol, 0.0, 0.0};
  }
  return it->second;
}

std::optional<double> PaperBroker::mark_price(const std::string& symbol) const {
  auto it = marks_.find(symbol);
  if (it == marks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace tickflow
