#pragma once

#include "tickflow/concurrent/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tickflow {

// Serialized once by the hub, shared by every session queue it lands in.
using OutboundMessage = std::shared_ptr<const std::string>;

// -----------------------------------------------------------------------------
// SessionState — connection lifecycle
// -----------------------------------------------------------------------------
//
//   Connecting ──> Open ──> Closing ──> Closed
//        │                    ▲
//        └────────────────────┘
//
// Closed is terminal. A reconnecting consumer gets a brand new session; no
// queue state is carried over.
// -----------------------------------------------------------------------------
enum class SessionState {
  Connecting,
  Open,
  Closing,
  Closed,
};

// Why a session is being closed. Transports map it to a close code:
// ServerShutdown → 1012 (service restart), KeepaliveExpired → 1001.
enum class CloseReason {
  ClientDisconnect,
  KeepaliveExpired,
  ServerShutdown,
};

const char* to_string(SessionState state);
const char* to_string(CloseReason reason);

// -----------------------------------------------------------------------------
// ClientSession
// -----------------------------------------------------------------------------
//
// @brief  One connected consumer: a bounded outbound queue, the time of its
//         last keepalive, and its lifecycle state.
//
// @details
// Created only by BroadcastHub::connect(), which enqueues the snapshot
// message before the session becomes visible to publish(). The transport
// (LiveServer's WebSocket session, the IPC server) then:
//   - calls transition(Open) once its handshake completes;
//   - drains the queue from its writer task (pop_for / try_pop);
//   - reports inbound liveness frames via BroadcastHub::touch();
//   - calls finish_close() after the underlying connection is gone.
//
// enqueue() never blocks: a full queue drops its oldest message, except a
// message added with enqueue_pinned(), which stays until popped. Once
// begin_close() has run, the queue is closed, new messages are discarded,
// and a drained pop returns std::nullopt so the writer task can finish.
//
// on_ready, when set, is invoked after every successful enqueue and on
// begin_close(). It runs on the publisher's thread and must only schedule
// work (e.g. post to an io_context), never perform I/O.
//
// Thread model:
//   enqueue()/begin_close() from publisher/hub threads, pops from the one
//   writer task, state queries from anywhere.
// -----------------------------------------------------------------------------
class ClientSession {
 public:
  using Id = std::uint64_t;
  using ReadyCallback = std::function<void()>;

  ClientSession(Id id, std::size_t capacity, std::int64_t now_ms);

  ClientSession(const ClientSession&) = delete;
  ClientSession& operator=(const ClientSession&) = delete;

  Id id() const { return id_; }

  // -------------------------------------------------------------------------
  // enqueue(message)
  // -------------------------------------------------------------------------
  // @return true if an older message was dropped to make room.
  // Ignored once the session is Closing or Closed.
  // -------------------------------------------------------------------------
  bool enqueue(OutboundMessage message);

  // Same, but the message is never evicted before the writer pops it. Used
  // for the connect-time snapshot.
  bool enqueue_pinned(OutboundMessage message);

  template <typename Rep, typename Period>
  std::optional<OutboundMessage> pop_for(
      std::chrono::duration<Rep, Period> timeout) {
    return queue_.pop_for(timeout);
  }

  std::optional<OutboundMessage> try_pop() { return queue_.try_pop(); }

  // -------------------------------------------------------------------------
  // transition(next)
  // -------------------------------------------------------------------------
  // Applies one edge of the lifecycle graph above.
  // @return false (and leaves the state unchanged) for any other edge.
  // -------------------------------------------------------------------------
  bool transition(SessionState next);

  // -------------------------------------------------------------------------
  // begin_close(reason)
  // -------------------------------------------------------------------------
  // Moves Connecting/Open to Closing, records `reason`, closes the queue and
  // fires on_ready so the writer notices. Returns false if already Closing
  // or Closed; the first reason wins.
  // -------------------------------------------------------------------------
  bool begin_close(CloseReason reason);

  // Closing → Closed. Called by the transport once the connection is gone.
  bool finish_close() { return transition(SessionState::Closed); }

  SessionState state() const;
  std::optional<CloseReason> close_reason() const;

  void touch(std::int64_t now_ms) { last_seen_ms_.store(now_ms); }
  std::int64_t last_seen_ms() const { return last_seen_ms_.load(); }

  void set_on_ready(ReadyCallback callback);

  std::size_t queued() const { return queue_.size(); }
  std::size_t capacity() const { return queue_.capacity(); }
  std::uint64_t dropped() const { return queue_.dropped_count(); }

 private:
  bool accepting() const;
  void notify_ready();

  const Id id_;
  BoundedQueue<OutboundMessage> queue_;
  std::atomic<std::int64_t> last_seen_ms_;

  mutable std::mutex mutex_;  // Guards state_, close_reason_, on_ready_
  SessionState state_{SessionState::Connecting};
  std::optional<CloseReason> close_reason_;
  ReadyCallback on_ready_;
};

}  // namespace tickflow
