#pragma once

#include "tickflow/broadcast/broadcast_hub.hpp"
#include "tickflow/config/engine_config.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tickflow {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and feed gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that mirrors the live channel onto a PUB
//         socket and answers commands on a REP socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (pub_endpoint):
//      The server holds its own BroadcastHub session, so PUB subscribers
//      receive exactly what a WebSocket client receives: the snapshot on
//      connect, then "tick" and "error" messages. The session is touched on
//      every loop iteration and never expires. If the hub closes it while
//      the server is running, a fresh one is opened (and a fresh snapshot
//      published).
//
//   2. REP socket (cmd_endpoint):
//      Each request string is forwarded to the command handler (bound to
//      TradingEngine::executeCommand()) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps the thread alternating between both duties.
//
// Thread model:
//   start()/stop() from the owning thread. The command handler runs on the
//   IPC thread and must be thread-safe with respect to the engine.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, its hub session and the worker thread. Borrows the hub.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no thread is spawned until start().
  IpcServer(CommandHandler command_handler, BroadcastHub& hub,
            IpcConfig config);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets, opens the hub session and spawns the worker.
  // Idempotent.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, closes the hub session and the sockets.
  void stop();

  bool running() const { return running_.load(); }

  // Messages sent on the PUB socket since start().
  std::uint64_t published() const { return published_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processFeed();
  void processCommands();
  void openSession();

  CommandHandler command_handler_;
  BroadcastHub& hub_;
  const IpcConfig config_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  BroadcastHub::SessionPtr session_;  // IPC thread only while running
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> published_{0};
};

}  // namespace tickflow
