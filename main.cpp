// -----------------------------------------------------------------------------
// tickflow — single executable entry point.
//
//   1) Load the EngineConfig: defaults, or --config <file.json>.
//   2) Create the wall clock and the TradingEngine (validates the config).
//   3) Start the engine: providers poll, the LiveServer serves /ws and /api/*.
//   4) Subscribe a logging callback to each symbol's pipeline bus.
//   5) Block the main thread until SIGINT/SIGTERM.
//   6) Shut down cleanly (live clients get close code 1012).
//
// No global state beyond the shutdown flag; the engine owns every thread.
// -----------------------------------------------------------------------------

#include "tickflow/config/engine_config.hpp"
#include "tickflow/engine/trading_engine.hpp"
#include "tickflow/events/event_types.hpp"
#include "tickflow/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Set from the signal handler, polled by main(). Lock-free atomic<bool> is
// async-signal-safe to store to.
std::atomic<bool> g_shutdown_requested{false};

void shutdown_handler(int /*signum*/) { g_shutdown_requested.store(true); }

void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [--config <file.json>]\n"
            << "  Without --config the built-in defaults are used:\n"
            << "  simulated provider, SH600000, 1 s interval, MA 10/30,\n"
            << "  live server on 0.0.0.0:8000 (/ws, /api/snapshot, "
               "/api/health, /api/ws_clients).\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 ||
               std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "[main] unknown argument: " << argv[i] << "\n";
      print_usage(argv[0]);
      return 2;
    }
  }

  // -------------------------------------------------------------------------
  // 1) + 2) Configuration and engine. Both throw on invalid input, before any
  // thread exists.
  // -------------------------------------------------------------------------
  tickflow::LiveTimeProvider clock;
  std::unique_ptr<tickflow::TradingEngine> engine;
  try {
    tickflow::EngineConfig config =
        config_path.empty() ? tickflow::EngineConfig{}
                            : tickflow::EngineConfig::fromFile(config_path);
    engine = std::make_unique<tickflow::TradingEngine>(std::move(config), clock);
  } catch (const std::exception& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  // -------------------------------------------------------------------------
  // 3) Start. Transports may fail to bind.
  // -------------------------------------------------------------------------
  try {
    engine->start();
  } catch (const std::exception& e) {
    std::cerr << "[main] start failed: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Log every non-HOLD signal. Callbacks run on the pipeline threads.
  // -------------------------------------------------------------------------
  for (const auto& symbol : engine->symbols()) {
    if (auto* pipeline = engine->pipeline(symbol)) {
      pipeline->eventBus().subscribe<tickflow::TickProcessedEvent>(
          [](const tickflow::TickProcessedEvent& e) {
            if (e.signal.kind == tickflow::domain::SignalKind::Hold) {
              return;
            }
            std::cout << "[Signal] " << e.signal.symbol << " "
                      << tickflow::domain::to_string(e.signal.kind) << " @ "
                      << e.tick.price << " (" << e.signal.reason
                      << ") equity=" << e.account.equity << "\n";
          });
    }
  }

  if (engine->serverPort() != 0) {
    std::cout << "[main] live server on port " << engine->serverPort()
              << ". Press Ctrl-C to shut down.\n";
  } else {
    std::cout << "[main] running. Press Ctrl-C to shut down.\n";
  }

  // -------------------------------------------------------------------------
  // 5) Wait for a shutdown signal.
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 6) Clean shutdown: stop the engine (joins every thread).
  // -------------------------------------------------------------------------
  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine->stop();
  return 0;
}
