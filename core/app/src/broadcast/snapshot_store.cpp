#include "tickflow/broadcast/snapshot_store.hpp"

#include <algorithm>
#include <utility>

namespace tickflow {

void SnapshotStore::add_symbol(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  add_symbol_locked(symbol);
}

void SnapshotStore::add_symbol_locked(const std::string& symbol) {
  if (std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end()) {
    return;
  }
  symbols_.push_back(symbol);
  last_[symbol];
  health_[symbol];
}

void SnapshotStore::remove_symbol(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  symbols_.erase(std::remove(symbols_.begin(), symbols_.end(), symbol),
                 symbols_.end());
  last_.erase(symbol);
  health_.erase(symbol);
}

bool SnapshotStore::has_symbol(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  return std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end();
}

void SnapshotStore::record_tick(const TickProcessedEvent& composite) {
  const std::string& symbol = composite.tick.symbol;
  std::lock_guard lock(mutex_);
  add_symbol_locked(symbol);

  SymbolSnapshot& entry = last_[symbol];
  entry.tick = composite.tick;
  entry.indicators = composite.indicators;
  entry.signal = composite.signal;

  ProviderHealth& health = health_[symbol];
  health.last_ok_ms = composite.tick.ts_ms;
  health.last_error.reset();
  ++health.tick_count;

  // Pipelines publish concurrently; never step back to an older account.
  if (composite.account.version >= account_.version) {
    account_ = composite.account;
  }
}

void SnapshotStore::record_error(const std::string& symbol,
                                 const std::string& error) {
  std::lock_guard lock(mutex_);
  add_symbol_locked(symbol);
  health_[symbol].last_error = error;
}

void SnapshotStore::set_account(domain::AccountSnapshot account) {
  std::lock_guard lock(mutex_);
  account_ = std::move(account);
}

void SnapshotStore::set_engine_running(bool running) {
  std::lock_guard lock(mutex_);
  engine_running_ = running;
}

SnapshotData SnapshotStore::read(std::int64_t now_ms) const {
  std::lock_guard lock(mutex_);
  SnapshotData data;
  data.ts_ms = now_ms;
  data.engine_running = engine_running_;
  data.symbols = symbols_;
  data.account = account_;
  data.last = last_;
  data.health = health_;
  return data;
}

void SnapshotStore::clear() {
  std::lock_guard lock(mutex_);
  engine_running_ = false;
  symbols_.clear();
  account_ = domain::AccountSnapshot{};
  last_.clear();
  health_.clear();
}

}  // namespace tickflow
