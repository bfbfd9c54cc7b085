#include "tickflow/broker/position_sizer.hpp"

namespace tickflow {

std::unique_ptr<IPositionSizer> make_position_sizer(const BrokerConfig& config) {
  switch (config.sizing) {
    case SizingPolicy::FixedQuantity:
      return std::make_unique<FixedQuantity>(config.fixed_quantity);
    case SizingPolicy::FractionOfCash:
      break;
  }
  return std::make_unique<FractionOfCash>(config.cash_fraction);
}

}  // namespace tickflow
