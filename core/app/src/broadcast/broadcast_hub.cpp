#include "tickflow/broadcast/broadcast_hub.hpp"

#include "tickflow/broadcast/message_codec.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace tickflow {

BroadcastHub::BroadcastHub(BroadcastConfig config,
                           const ITimeProvider& time_provider)
    : config_(config), time_provider_(time_provider) {}

BroadcastHub::~BroadcastHub() {
  stop_reaper();
  closeAll(CloseReason::ServerShutdown);
}

void BroadcastHub::add_symbol(const std::string& symbol) {
  store_.add_symbol(symbol);
}

void BroadcastHub::remove_symbol(const std::string& symbol) {
  store_.remove_symbol(symbol);
}

void BroadcastHub::set_account(domain::AccountSnapshot account) {
  store_.set_account(std::move(account));
}

void BroadcastHub::set_engine_running(bool running) {
  store_.set_engine_running(running);
}

// -----------------------------------------------------------------------------
// publish(composite)
// -----------------------------------------------------------------------------
void BroadcastHub::publish(const TickProcessedEvent& composite) {
  auto message =
      std::make_shared<const std::string>(codec::encode_tick(composite));

  std::lock_guard lock(mutex_);
  store_.record_tick(composite);
  enqueue_all_locked(message);
  ++published_;
}

void BroadcastHub::publishError(const std::string& symbol,
                                const std::string& error, std::int64_t ts_ms,
                                ErrorOrigin origin) {
  auto message = std::make_shared<const std::string>(
      codec::encode_error(symbol, error, ts_ms));

  std::lock_guard lock(mutex_);
  if (origin == ErrorOrigin::Provider) {
    store_.record_error(symbol, error);
  }
  enqueue_all_locked(message);
}

void BroadcastHub::enqueue_all_locked(const OutboundMessage& message) {
  for (auto& [id, session] : sessions_) {
    (void)id;
    session->enqueue(message);
  }
}

// -----------------------------------------------------------------------------
// connect(): snapshot first, then visible to publish()
// -----------------------------------------------------------------------------
BroadcastHub::SessionPtr BroadcastHub::connect() {
  const std::int64_t now = time_provider_.now_ms();

  std::lock_guard lock(mutex_);
  auto session = std::make_shared<ClientSession>(next_id_++,
                                                 config_.queue_capacity, now);
  session->enqueue_pinned(
      std::make_shared<const std::string>(codec::encode_snapshot(store_.read(now))));
  sessions_.emplace(session->id(), session);
  return session;
}

bool BroadcastHub::touch(ClientSession::Id id) {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return false;
  }
  it->second->touch(time_provider_.now_ms());
  return true;
}

void BroadcastHub::disconnect(ClientSession::Id id) {
  SessionPtr session;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      return;
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }
  session->begin_close(CloseReason::ClientDisconnect);
}

// -----------------------------------------------------------------------------
// reapExpired(): unregister under the lock, close outside it
// -----------------------------------------------------------------------------
std::size_t BroadcastHub::reapExpired() {
  const std::int64_t now = time_provider_.now_ms();
  std::vector<SessionPtr> expired;
  {
    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (now - it->second->last_seen_ms() > config_.keepalive_timeout_ms) {
        expired.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& session : expired) {
    std::cout << "[BroadcastHub] session " << session->id()
              << " keepalive expired\n";
    session->begin_close(CloseReason::KeepaliveExpired);
  }
  return expired.size();
}

void BroadcastHub::closeAll(CloseReason reason) {
  std::map<ClientSession::Id, SessionPtr> sessions;
  {
    std::lock_guard lock(mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [id, session] : sessions) {
    (void)id;
    session->begin_close(reason);
  }
  if (!sessions.empty()) {
    std::cout << "[BroadcastHub] closed " << sessions.size()
              << " session(s): " << to_string(reason) << "\n";
  }
}

// -----------------------------------------------------------------------------
// Reaper thread
// -----------------------------------------------------------------------------
void BroadcastHub::start_reaper() {
  if (reaper_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(reaper_mutex_);
    reaper_stop_ = false;
  }
  reaper_ = std::thread([this] { reaper_loop(); });
}

void BroadcastHub::stop_reaper() {
  if (!reaper_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(reaper_mutex_);
    reaper_stop_ = true;
  }
  reaper_cv_.notify_all();
  reaper_.join();
}

void BroadcastHub::reaper_loop() {
  const auto interval = std::chrono::milliseconds(config_.reap_interval_ms);
  std::unique_lock lock(reaper_mutex_);
  while (!reaper_stop_) {
    if (reaper_cv_.wait_for(lock, interval, [this] { return reaper_stop_; })) {
      break;
    }
    lock.unlock();
    reapExpired();
    lock.lock();
  }
}

// -----------------------------------------------------------------------------
// Pull accessors
// -----------------------------------------------------------------------------
SnapshotData BroadcastHub::snapshot() const {
  return store_.read(time_provider_.now_ms());
}

std::string BroadcastHub::snapshotJson() const {
  return codec::to_wire(codec::snapshot_to_json(snapshot()));
}

nlohmann::json BroadcastHub::health() const {
  return codec::health_to_json(snapshot());
}

std::size_t BroadcastHub::clientCount() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

void BroadcastHub::clear() { store_.clear(); }

}  // namespace tickflow
