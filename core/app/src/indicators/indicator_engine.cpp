#include "tickflow/indicators/indicator_engine.hpp"

#include <algorithm>
#include <numeric>

namespace tickflow {

IndicatorEngine::IndicatorEngine(IndicatorConfig config)
    : config_(config),
      capacity_(static_cast<std::size_t>(
                    std::max(config.ma_long, config.rsi_period)) +
                1) {}

IndicatorEngine::State& IndicatorEngine::state_for(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto& slot = states_[symbol];
  if (!slot) {
    slot = std::make_unique<State>();
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// update(tick)
// -----------------------------------------------------------------------------
domain::IndicatorSnapshot IndicatorEngine::update(const domain::Tick& tick) {
  State& state = state_for(tick.symbol);

  state.history.push_back(tick.price);
  if (state.history.size() > capacity_) {
    state.history.pop_front();
  }

  if (state.previous_price) {
    const double change = tick.price - *state.previous_price;
    const double gain = change > 0.0 ? change : 0.0;
    const double loss = change < 0.0 ? -change : 0.0;
    const double period = static_cast<double>(config_.rsi_period);
    state.avg_gain = (state.avg_gain * (period - 1.0) + gain) / period;
    state.avg_loss = (state.avg_loss * (period - 1.0) + loss) / period;
    ++state.changes;
  }
  state.previous_price = tick.price;

  domain::IndicatorSnapshot snapshot;
  snapshot.ma_short = mean_of_last(state, config_.ma_short);
  snapshot.ma_long = mean_of_last(state, config_.ma_long);
  snapshot.rsi = rsi_of(state);
  return snapshot;
}

std::optional<double> IndicatorEngine::mean_of_last(const State& state,
                                                    int n) const {
  const auto count = static_cast<std::size_t>(n);
  if (state.history.size() < count) {
    return std::nullopt;
  }
  const double sum =
      std::accumulate(state.history.end() - static_cast<std::ptrdiff_t>(count),
                      state.history.end(), 0.0);
  return sum / static_cast<double>(count);
}

std::optional<double> IndicatorEngine::rsi_of(const State& state) const {
  if (state.changes < config_.rsi_period) {
    return std::nullopt;
  }
  if (state.avg_loss == 0.0) {
    return state.avg_gain > 0.0 ? 100.0 : 50.0;
  }
  const double rs = state.avg_gain / state.avg_loss;
  const double rsi = 100.0 - 100.0 / (1.0 + rs);
  return std::clamp(rsi, 0.0, 100.0);
}

void IndicatorEngine::forget(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  states_.erase(symbol);
}

std::size_t IndicatorEngine::history_size(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = states_.find(symbol);
  return it == states_.end() ? 0 : it->second->history.size();
}

std::size_t IndicatorEngine::symbol_count() const {
  std::lock_guard lock(mutex_);
  return states_.size();
}

}  // namespace tickflow
