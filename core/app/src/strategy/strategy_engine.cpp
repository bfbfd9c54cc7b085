#include "tickflow/strategy/strategy_engine.hpp"

#include <stdexcept>
#include <utility>

namespace tickflow {

StrategyEngine::StrategyEngine(std::unique_ptr<IStrategy> strategy)
    : strategy_(std::move(strategy)) {
  if (!strategy_) {
    throw std::invalid_argument("StrategyEngine requires a strategy");
  }
}

StrategyEngine::Memory& StrategyEngine::memory_for(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto& slot = memory_[symbol];
  if (!slot) {
    slot = std::make_unique<Memory>();
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// evaluate(tick, indicators)
// -----------------------------------------------------------------------------
domain::Signal StrategyEngine::evaluate(
    const domain::Tick& tick, const domain::IndicatorSnapshot& indicators) {
  Memory& memory = memory_for(tick.symbol);

  StrategyDecision decision = strategy_->decide(memory.last, indicators);
  memory.last = indicators;
  if (decision.kind != domain::SignalKind::Hold) {
    memory.last_emitted = decision.kind;
  }

  return domain::Signal{tick.symbol, decision.kind, std::move(decision.reason),
                        tick.ts_ms};
}

void StrategyEngine::forget(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  memory_.erase(symbol);
}

domain::SignalKind StrategyEngine::last_emitted(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = memory_.find(symbol);
  return it == memory_.end() ? domain::SignalKind::Hold
                             : it->second->last_emitted;
}

std::size_t StrategyEngine::symbol_count() const {
  std::lock_guard lock(mutex_);
  return memory_.size();
}

}  // namespace tickflow
