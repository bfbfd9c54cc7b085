#pragma once

#include "tickflow/broadcast/client_session.hpp"
#include "tickflow/broadcast/snapshot_store.hpp"
#include "tickflow/config/engine_config.hpp"
#include "tickflow/events/event_types.hpp"
#include "tickflow/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tickflow {

// Which stage failed. Only provider failures count against provider health.
enum class ErrorOrigin {
  Provider,
  Broker,
};

// -----------------------------------------------------------------------------
// BroadcastHub — fan-out of composite state to every consumer
// -----------------------------------------------------------------------------
//
// @brief  Owns the registry of connected sessions and the SnapshotStore.
//         Symbol pipelines publish into it; transports drain sessions out of
//         it; polling endpoints read its snapshot.
//
// @details
// publish(composite), on a symbol pipeline thread:
//   1. serialize the tick message once (outside the lock);
//   2. under the hub lock: overwrite the SnapshotStore entry and account,
//      then enqueue the shared message on every session.
// Enqueue never blocks: each session queue is bounded and drops its oldest
// message when full. A stalled consumer therefore costs the publisher one
// short critical section and never delays the other sessions.
//
// connect():
//   Under the same lock, creates a session, enqueues a full snapshot message
//   as its first item, and registers it. Because publish() holds that lock
//   while enqueueing, a tick is either already in the snapshot or queued
//   after it; a consumer never sees a tick before its snapshot. The snapshot
//   is pinned in the session queue, so overflow evicts ticks behind it, never
//   the snapshot itself.
//
// Liveness:
//   touch(id) records a keepalive. reapExpired() begins closing every session
//   silent for longer than keepalive_timeout_ms (reason KeepaliveExpired) and
//   removes it from the registry. start_reaper() runs it every
//   reap_interval_ms on a dedicated thread; stop_reaper() wakes and joins it.
//
// Shutdown:
//   closeAll(reason) begins closing every session with `reason` so
//   transports can pick the close code, and empties the registry.
//
// Thread model:
//   Every public method is safe from any thread. Transports are reached
//   only through ClientSession::on_ready, which may run under the hub lock
//   and therefore only schedules work.
//
// Ownership:
//   Owned by TradingEngine. Sessions are shared with their transport via
//   shared_ptr; once removed from the registry a session receives nothing.
// -----------------------------------------------------------------------------
class BroadcastHub {
 public:
  using SessionPtr = std::shared_ptr<ClientSession>;

  BroadcastHub(BroadcastConfig config, const ITimeProvider& time_provider);

  // Stops the reaper and closes every session with ServerShutdown.
  ~BroadcastHub();

  BroadcastHub(const BroadcastHub&) = delete;
  BroadcastHub& operator=(const BroadcastHub&) = delete;

  // -------------------------------------------------------------------------
  // Symbol registry (mirrors the engine's subscriptions)
  // -------------------------------------------------------------------------
  void add_symbol(const std::string& symbol);
  void remove_symbol(const std::string& symbol);

  // Seeds the account shown before the first tick.
  void set_account(domain::AccountSnapshot account);
  void set_engine_running(bool running);

  // -------------------------------------------------------------------------
  // publish(composite)
  // -------------------------------------------------------------------------
  // Records the composite in the SnapshotStore and enqueues a "tick"
  // message to every session. See class comment.
  // -------------------------------------------------------------------------
  void publish(const TickProcessedEvent& composite);

  // -------------------------------------------------------------------------
  // publishError(symbol, error, ts_ms, origin)
  // -------------------------------------------------------------------------
  // Enqueues an "error" message to every session. A Provider failure is also
  // recorded as the symbol's last_error in provider health; a Broker
  // failure leaves health untouched.
  // -------------------------------------------------------------------------
  void publishError(const std::string& symbol, const std::string& error,
                    std::int64_t ts_ms,
                    ErrorOrigin origin = ErrorOrigin::Provider);

  // -------------------------------------------------------------------------
  // connect()
  // -------------------------------------------------------------------------
  // @return A new session in state Connecting whose first queued message is
  //         the current snapshot.
  // -------------------------------------------------------------------------
  SessionPtr connect();

  // Records a keepalive. False if `id` is not registered.
  bool touch(ClientSession::Id id);

  // Begins closing the session (ClientDisconnect) and unregisters it.
  void disconnect(ClientSession::Id id);

  // @return Number of sessions dropped for keepalive expiry.
  std::size_t reapExpired();

  void closeAll(CloseReason reason);

  void start_reaper();
  void stop_reaper();

  // -------------------------------------------------------------------------
  // Pull accessors
  // -------------------------------------------------------------------------
  SnapshotData snapshot() const;
  std::string snapshotJson() const;
  nlohmann::json health() const;
  std::size_t clientCount() const;

  // Clears the SnapshotStore. Called at engine shutdown.
  void clear();

  // Composite ticks published since construction.
  std::uint64_t published() const { return published_.load(); }

 private:
  void enqueue_all_locked(const OutboundMessage& message);
  void reaper_loop();

  const BroadcastConfig config_;
  const ITimeProvider& time_provider_;

  SnapshotStore store_;

  mutable std::mutex mutex_;  // Guards sessions_, next_id_, publish ordering
  std::map<ClientSession::Id, SessionPtr> sessions_;
  ClientSession::Id next_id_{1};
  std::atomic<std::uint64_t> published_{0};

  std::mutex reaper_mutex_;
  std::condition_variable reaper_cv_;
  bool reaper_stop_{false};
  std::thread reaper_;
};

}  // namespace tickflow
