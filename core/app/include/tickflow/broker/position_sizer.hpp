#pragma once

#include "tickflow/config/engine_config.hpp"

#include <memory>

namespace tickflow {

// -----------------------------------------------------------------------------
// IPositionSizer — how many units a BUY asks for
// -----------------------------------------------------------------------------
// Returns the raw quantity for a BUY at `price` given the current `cash`.
// PaperBroker floors the result to a multiple of lot_size and checks that
// the cost fits in cash; a sizer does neither.
// -----------------------------------------------------------------------------
class IPositionSizer {
 public:
  virtual ~IPositionSizer() = default;
  virtual double quantity(double cash, double price) const = 0;
  virtual const char* name() const = 0;
};

// Spend `fraction` of current cash. The default policy (fraction 0.5).
class FractionOfCash final : public IPositionSizer {
 public:
  explicit FractionOfCash(double fraction) : fraction_(fraction) {}

  double quantity(double cash, double price) const override {
    return cash * fraction_ / price;
  }
  const char* name() const override { return "fraction_of_cash"; }

 private:
  const double fraction_;
};

// Always ask for the same number of units, whatever the cash.
class FixedQuantity final : public IPositionSizer {
 public:
  explicit FixedQuantity(double qty) : qty_(qty) {}

  double quantity(double /*cash*/, double /*price*/) const override {
    return qty_;
  }
  const char* name() const override { return "fixed_quantity"; }

 private:
  const double qty_;
};

std::unique_ptr<IPositionSizer> make_position_sizer(const BrokerConfig& config);

}  // namespace tickflow
