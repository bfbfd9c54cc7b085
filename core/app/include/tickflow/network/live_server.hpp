#pragma once

#include "tickflow/broadcast/broadcast_hub.hpp"
#include "tickflow/config/engine_config.hpp"
#include "tickflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>

namespace tickflow {

namespace detail {
struct LiveContext;
}  // namespace detail

// -----------------------------------------------------------------------------
// LiveServer — HTTP + WebSocket transport for the BroadcastHub
// -----------------------------------------------------------------------------
//
// @brief  Serves the live channel and the pull endpoints on one port using
//         Boost.Beast on a dedicated io_context thread.
//
// @details
// Routes (GET):
//   {ws_path} (upgrade)  → live channel; one hub session per connection
//   /api/snapshot        → BroadcastHub::snapshotJson()
//   /api/health          → BroadcastHub::health()
//   /api/ws_clients      → {"clients": n}
//   anything else        → 404 {"error":"not found","path":...}
//
// Each WebSocket connection runs two cooperating tasks on the io thread:
//   - a writer pump that drains its ClientSession queue one frame at a time,
//     woken by the session's on_ready callback (posted, never inline);
//   - a reader that treats "ping" / "hello" text frames as keepalives
//     (BroadcastHub::touch) and answers each with {"type":"pong","ts"}
//     through the same queue, so there is only ever one writer.
// When the hub starts closing a session the pump flushes what is queued and
// sends the close frame: 1012 (service restart) for ServerShutdown, 1001
// (going away) for KeepaliveExpired, 1000 otherwise.
//
// stop() stops accepting, closes every live connection with
// ServerShutdown, waits up to shutdown_grace_ms for the close handshakes,
// then stops the io_context and joins its thread. A handshake that completes
// while stop() is running is closed with ServerShutdown straight away; after
// the join, any session still tracked is unregistered from the hub and its
// ready callback cleared, so no hub session outlives the io_context.
//
// Thread model:
//   start()/stop() from the owning thread. All socket work happens on the
//   io thread. The hub is called from the io thread and is thread-safe.
//
// Ownership:
//   Owned by TradingEngine. Borrows the hub and clock, which must outlive it.
// -----------------------------------------------------------------------------
class LiveServer {
 public:
  LiveServer(ServerConfig config, BroadcastHub& hub,
             const ITimeProvider& time_provider);

  ~LiveServer();

  LiveServer(const LiveServer&) = delete;
  LiveServer& operator=(const LiveServer&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds host:port synchronously, so port() is valid on return even for
  // port 0, then spawns the io thread.
  //
  // @throws std::runtime_error if the address cannot be parsed or bound.
  // -------------------------------------------------------------------------
  void start();

  void stop();

  bool running() const { return running_.load(); }

  // Bound port; 0 before start().
  std::uint16_t port() const { return port_; }

  // WebSocket connections currently alive.
  std::size_t active_connections() const;

 private:
  const ServerConfig config_;
  BroadcastHub& hub_;
  const ITimeProvider& time_provider_;

  std::unique_ptr<detail::LiveContext> context_;
  std::atomic<bool> running_{false};
  std::uint16_t port_{0};
  std::thread thread_;
};

}  // namespace tickflow
