#pragma once

#include "tickflow/config/engine_config.hpp"
#include "tickflow/strategy/i_strategy.hpp"

#include <memory>

namespace tickflow {

// Builds the strategy variant named by config.type.
std::unique_ptr<IStrategy> make_strategy(const StrategyConfig& config);

}  // namespace tickflow
