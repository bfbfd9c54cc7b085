#include "tickflow/broadcast/client_session.hpp"

#include <utility>

namespace tickflow {

const char* to_string(SessionState state) {
  switch (state) {
    case SessionState::Connecting:
      return "CONNECTING";
    case SessionState::Open:
      return "OPEN";
    case SessionState::Closing:
      return "CLOSING";
    case SessionState::Closed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

const char* to_string(CloseReason reason) {
  switch (reason) {
    case CloseReason::ClientDisconnect:
      return "client_disconnect";
    case CloseReason::KeepaliveExpired:
      return "keepalive_expired";
    case CloseReason::ServerShutdown:
      return "server_shutdown";
  }
  return "unknown";
}

namespace {

bool legal(SessionState from, SessionState to) {
  switch (from) {
    case SessionState::Connecting:
      return to == SessionState::Open || to == SessionState::Closing;
    case SessionState::Open:
      return to == SessionState::Closing;
    case SessionState::Closing:
      return to == SessionState::Closed;
    case SessionState::Closed:
      return false;
  }
  return false;
}

}  // namespace

ClientSession::ClientSession(Id id, std::size_t capacity, std::int64_t now_ms)
    : id_(id), queue_(capacity), last_seen_ms_(now_ms) {}

bool ClientSession::accepting() const {
  std::lock_guard lock(mutex_);
  return state_ != SessionState::Closing && state_ != SessionState::Closed;
}

bool ClientSession::enqueue(OutboundMessage message) {
  if (!accepting()) {
    return false;
  }
  const bool dropped = queue_.push(std::move(message));
  notify_ready();
  return dropped;
}

bool ClientSession::enqueue_pinned(OutboundMessage message) {
  if (!accepting()) {
    return false;
  }
  const bool dropped = queue_.push_pinned(std::move(message));
  notify_ready();
  return dropped;
}

bool ClientSession::transition(SessionState next) {
  std::lock_guard lock(mutex_);
  if (!legal(state_, next)) {
    return false;
  }
  state_ = next;
  return true;
}

bool ClientSession::begin_close(CloseReason reason) {
  {
    std::lock_guard lock(mutex_);
    if (!legal(state_, SessionState::Closing)) {
      return false;
    }
    state_ = SessionState::Closing;
    close_reason_ = reason;
  }
  queue_.close();
  notify_ready();
  return true;
}

SessionState ClientSession::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::optional<CloseReason> ClientSession::close_reason() const {
  std::lock_guard lock(mutex_);
  return close_reason_;
}

void ClientSession::set_on_ready(ReadyCallback callback) {
  std::lock_guard lock(mutex_);
  on_ready_ = std::move(callback);
}

// Copy the callback out so it runs without the session lock held.
void ClientSession::notify_ready() {
  ReadyCallback callback;
  {
    std::lock_guard lock(mutex_);
    callback = on_ready_;
  }
  if (callback) {
    callback();
  }
}

}  // namespace tickflow
