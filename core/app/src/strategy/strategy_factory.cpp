#include "tickflow/strategy/strategy_factory.hpp"

#include "tickflow/strategy/ma_crossover.hpp"
#include "tickflow/strategy/rsi_threshold.hpp"

#include <iostream>

namespace tickflow {

std::unique_ptr<IStrategy> make_strategy(const StrategyConfig& config) {
  std::cout << "[StrategyFactory] strategy=" << to_string(config.type) << "\n";
  switch (config.type) {
    case StrategyType::RsiThreshold:
      return std::make_unique<RsiThreshold>(config.rsi);
    case StrategyType::MACrossover:
      break;
  }
  return std::make_unique<MACrossover>(config.ma_crossover);
}

}  // namespace tickflow
