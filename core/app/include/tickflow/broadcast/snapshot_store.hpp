#pragma once

#include "tickflow/domain/account.hpp"
#include "tickflow/domain/indicators.hpp"
#include "tickflow/domain/signal.hpp"
#include "tickflow/domain/tick.hpp"
#include "tickflow/events/event_types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tickflow {

// Latest composite state of one symbol. Everything is empty until its first
// processed tick.
struct SymbolSnapshot {
  std::optional<domain::Tick> tick;
  std::optional<domain::IndicatorSnapshot> indicators;
  std::optional<domain::Signal> signal;
};

// Provider health of one symbol. A successful tick clears last_error.
struct ProviderHealth {
  std::optional<std::int64_t> last_ok_ms;
  std::optional<std::string> last_error;
  std::uint64_t tick_count{0};
};

// A consistent copy of the whole store, taken under its lock.
struct SnapshotData {
  std::int64_t ts_ms{0};
  bool engine_running{false};
  std::vector<std::string> symbols;  // Subscription order
  domain::AccountSnapshot account;
  std::map<std::string, SymbolSnapshot> last;
  std::map<std::string, ProviderHealth> health;
};

// -----------------------------------------------------------------------------
// SnapshotStore
// -----------------------------------------------------------------------------
//
// @brief  Latest known state per symbol plus the account, for late joiners
//         and polling consumers.
//
// @details
// Overwritten by BroadcastHub on every composite tick and provider error.
// read() returns a self-consistent SnapshotData: a reader never sees the
// tick of one publish with the account of another.
//
// The account is only replaced by a composite whose account version is at
// least the stored one, so a late reply from one pipeline cannot roll the
// account back past a newer one already published by another. set_account()
// overwrites unconditionally (engine start, restart).
//
// Symbols are registered when their pipeline starts and removed when it is
// unsubscribed, which drops their last state and health. A tick for an
// unregistered symbol registers it.
//
// Lifecycle: created with the hub at pipeline start, clear()ed at shutdown.
//
// Thread model:
//   All methods lock one internal mutex.
// -----------------------------------------------------------------------------
class SnapshotStore {
 public:
  SnapshotStore() = default;

  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  void add_symbol(const std::string& symbol);
  void remove_symbol(const std::string& symbol);
  bool has_symbol(const std::string& symbol) const;

  void record_tick(const TickProcessedEvent& composite);
  void record_error(const std::string& symbol, const std::string& error);
  void set_account(domain::AccountSnapshot account);
  void set_engine_running(bool running);

  SnapshotData read(std::int64_t now_ms) const;

  void clear();

 private:
  void add_symbol_locked(const std::string& symbol);

  mutable std::mutex mutex_;
  bool engine_running_{false};
  std::vector<std::string> symbols_;
  domain::AccountSnapshot account_;
  std::map<std::string, SymbolSnapshot> last_;
  std::map<std::string, ProviderHealth> health_;
};

}  // namespace tickflow
