#pragma once

#include "tickflow/broadcast/broadcast_hub.hpp"
#include "tickflow/broker/broker_thread.hpp"
#include "tickflow/config/engine_config.hpp"
#include "tickflow/engine/symbol_pipeline.hpp"
#include "tickflow/indicators/indicator_engine.hpp"
#include "tickflow/network/ipc_server.hpp"
#include "tickflow/network/live_server.hpp"
#include "tickflow/provider/i_price_provider.hpp"
#include "tickflow/strategy/strategy_engine.hpp"
#include "tickflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tickflow {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  The session object. Owns every component of the tick pipeline and
//         every thread that drives it, and exposes one start/stop lifecycle.
//
// @details
// There is no process-wide state: main() and each test construct their own
// engine, and everything a component needs is handed to it explicitly.
//
// Thread layout:
//
//   <symbol> loop thread (one per subscription)
//                          → IndicatorEngine, StrategyEngine, hub publish
//   provider thread (one per subscription)
//                          → IPriceProvider::fetch every interval_ms
//   broker loop thread     → PaperBroker (sole writer of the account)
//   hub reaper thread      → BroadcastHub::reapExpired every reap_interval_ms
//   live server io thread  → Boost.Beast HTTP + WebSocket (optional)
//   ipc thread             → ZeroMQ REP + PUB (optional)
//   main thread           → start(), wait for shutdown, stop()
//
// Cross-thread bridges:
//   1. provider thread → symbol loop:   MarketDataEvent / ProviderErrorEvent
//   2. symbol loop     → broker loop:   BrokerRequestEvent (+ reply future)
//   3. symbol loop     → hub sessions:  bounded per-session queues
//
// Ownership:
//   TradingEngine
//    ├── config_            (EngineConfig — validated copy)
//    ├── time_provider_     (const ITimeProvider& — non-owning)
//    ├── provider_          (unique_ptr<IPriceProvider> — shared by pipelines)
//    ├── indicators_        (unique_ptr<IndicatorEngine>)
//    ├── strategy_          (unique_ptr<StrategyEngine>)
//    ├── broker_            (unique_ptr<BrokerThread> — owns PaperBroker)
//    ├── hub_               (unique_ptr<BroadcastHub>)
//    ├── live_server_       (unique_ptr<LiveServer> — when server.enabled)
//    ├── ipc_server_        (unique_ptr<IpcServer> — when ipc.enabled)
//    └── pipelines_         (symbol → unique_ptr<SymbolPipeline>)
//
// Members are destroyed in reverse order, so pipelines and transports go
// before the hub, the broker and the engines they borrow.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Validates `config` and builds the components it selects.
  //
  // @param  config         Engine configuration. validate() runs here.
  // @param  time_provider  Clock for ticks, messages and keepalives. Must
  //                        outlive the engine.
  //
  // @throws std::invalid_argument if the configuration is invalid.
  //
  // No threads are spawned and no sockets are opened until start().
  // -------------------------------------------------------------------------
  TradingEngine(EngineConfig config, const ITimeProvider& time_provider);

  // Destructor calls stop() for RAII safety.
  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // Startup sequence:
  //   1. Seed the hub (account, symbols, engine_running) and start its
  //      reaper.
  //   2. Start the broker loop.
  //   3. Start the LiveServer and IpcServer, when enabled.
  //   4. Start one SymbolPipeline per subscribed symbol (providers LAST, so
  //      every consumer is live before the first tick).
  //
  // @throws std::runtime_error / zmq::error_t if a transport cannot bind.
  //         Everything already started is stopped again before the throw.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // Shutdown sequence:
  //   1. Stop every pipeline (provider first, then its loop).
  //   2. Stop the IpcServer, then the LiveServer (close code 1012).
  //   3. Close any remaining hub sessions, stop the reaper, clear the
  //      snapshot.
  //   4. Stop the broker loop.
  //
  // Idempotent. The subscription list survives, so start() may follow.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // subscribe(symbol) / unsubscribe(symbol)
  // -------------------------------------------------------------------------
  // While running, subscribe() starts a pipeline immediately; otherwise the
  // symbol is recorded for the next start(). unsubscribe() stops the
  // symbol's provider and loop, then releases its indicator state, strategy
  // memory and snapshot entry.
  //
  // @return false if the symbol was already (or not) subscribed.
  // @throws std::invalid_argument for an empty symbol.
  // -------------------------------------------------------------------------
  bool subscribe(const std::string& symbol);
  bool unsubscribe(const std::string& symbol);

  // Subscribed symbols in subscription order.
  std::vector<std::string> symbols() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // Handles IPC command requests. Returns a JSON string:
  //   PING                → {"status":"ok","response":"PONG"}
  //   SNAPSHOT            → {"status":"ok","snapshot":{...}}
  //   HEALTH              → {"status":"ok","health":{...}}
  //   CLIENTS             → {"status":"ok","clients":n}
  //   SUBSCRIBE <sym>     → {"status":"ok"|"error","symbol":...}
  //   UNSUBSCRIBE <sym>   → {"status":"ok"|"error","symbol":...}
  //   anything else       → {"status":"error","response":"Unknown command: ..."}
  // Safe from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  BroadcastHub& hub() { return *hub_; }
  const BroadcastHub& hub() const { return *hub_; }

  BrokerThread& broker() { return *broker_; }

  // The running pipeline for `symbol`, or nullptr.
  SymbolPipeline* pipeline(const std::string& symbol);

  const EngineConfig& config() const { return config_; }

  // Port the LiveServer bound; 0 when disabled or stopped.
  std::uint16_t serverPort() const;

 private:
  std::unique_ptr<SymbolPipeline> makePipeline(const std::string& symbol);
  void startPipelineLocked(const std::string& symbol);

  const EngineConfig config_;
  const ITimeProvider& time_provider_;

  std::unique_ptr<IPriceProvider> provider_;
  std::unique_ptr<IndicatorEngine> indicators_;
  std::unique_ptr<StrategyEngine> strategy_;
  std::unique_ptr<BrokerThread> broker_;
  std::unique_ptr<BroadcastHub> hub_;
  std::unique_ptr<LiveServer> live_server_;
  std::unique_ptr<IpcServer> ipc_server_;

  mutable std::mutex mutex_;  // Guards symbols_, pipelines_, running_ writes
  std::vector<std::string> symbols_;
  std::map<std::string, std::unique_ptr<SymbolPipeline>> pipelines_;
  std::atomic<bool> running_{false};
};

}  // namespace tickflow
