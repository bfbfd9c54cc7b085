// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Unit tests for tickflow::TradingEngine.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, idempotent and restartable
//   - Invalid configuration is rejected before any thread starts
//   - Ticks from the simulated provider flow through every stage, and the
//     account obeys equity = cash + qty * last price on every composite
//   - subscribe() / unsubscribe() while running start and stop pipelines and
//     keep the hub's symbol list in step
//   - executeCommand() answers the IPC command set
//
// Design: Each test creates its own TradingEngine with a seeded simulated
// provider, a 5 ms interval and MA(2/3) so signals appear quickly. Network
// transports stay disabled unless a test turns one on with port 0.
// =============================================================================

#include "tickflow/engine/trading_engine.hpp"
#include "tickflow/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using nlohmann::json;

namespace {

tickflow::EngineConfig fastConfig() {
  tickflow::EngineConfig config;
  config.symbols = {"SH600000"};
  config.interval_ms = 5;
  config.provider.simulated.seed = 2024;
  config.provider.simulated.volatility = 0.02;
  config.strategy.ma_crossover.short_period = 2;
  config.strategy.ma_crossover.long_period = 3;
  config.broker.starting_cash = 10000.0;
  config.server.enabled = false;
  config.ipc.enabled = false;
  return config;
}

bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = 3s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

std::uint64_t tickCount(const tickflow::TradingEngine& engine,
                        const std::string& symbol) {
  const auto snap = engine.hub().snapshot();
  auto it = snap.health.find(symbol);
  return it == snap.health.end() ? 0 : it->second.tick_count;
}

}  // namespace

// Shared simulation clock for all TradingEngine tests.
class TradingEngineTestFixture : public ::testing::Test {
 protected:
  tickflow::SimulationTimeProvider sim_clock{1'700'000'000'000};
};

// -----------------------------------------------------------------------------
// 1. Ticks flow end to end; every composite satisfies the equity identity.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, TicksFlowAndEquityHolds) {
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<tickflow::TickProcessedEvent> composites;

  // Declared after the collector so its pipelines are joined first.
  tickflow::TradingEngine engine(fastConfig(), sim_clock);
  engine.start();
  ASSERT_TRUE(engine.running());
  auto* pipeline = engine.pipeline("SH600000");
  ASSERT_NE(pipeline, nullptr);
  pipeline->eventBus().subscribe<tickflow::TickProcessedEvent>(
      [&](const tickflow::TickProcessedEvent& e) {
        std::lock_guard lock(mutex);
        composites.push_back(e);
        cv.notify_all();
      });

  {
    std::unique_lock lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 5s, [&] { return composites.size() >= 60; }));
  }
  engine.stop();

  std::lock_guard lock(mutex);
  std::uint64_t previous_seq = 0;
  for (const auto& c : composites) {
    const auto it = c.account.positions.find("SH600000");
    const double qty = it == c.account.positions.end() ? 0.0 : it->second.qty;
    EXPECT_NEAR(c.account.equity, c.account.cash + qty * c.tick.price, 1e-6);
    EXPECT_GE(c.account.cash, 0.0);
    EXPECT_GT(c.tick.price, 0.0);
    EXPECT_GT(c.sequence_id, previous_seq);
    previous_seq = c.sequence_id;
  }

  const bool traded = std::any_of(
      composites.begin(), composites.end(),
      [](const tickflow::TickProcessedEvent& c) {
        return c.signal.kind != tickflow::domain::SignalKind::Hold;
      });
  EXPECT_TRUE(traded) << "a 2/3 crossover should fire within 60 noisy ticks";
}

// -----------------------------------------------------------------------------
// 2. start() and stop() are idempotent; the engine can start again.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, IdempotentAndRestartable) {
  tickflow::TradingEngine engine(fastConfig(), sim_clock);
  EXPECT_FALSE(engine.running());

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.running());
  EXPECT_TRUE(engine.hub().snapshot().engine_running);

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.running());
  EXPECT_EQ(engine.pipeline("SH600000"), nullptr);
  EXPECT_FALSE(engine.hub().snapshot().engine_running);
  EXPECT_TRUE(engine.hub().snapshot().symbols.empty());

  engine.start();
  EXPECT_EQ(engine.hub().snapshot().symbols,
            (std::vector<std::string>{"SH600000"}));
  EXPECT_TRUE(waitUntil([&] { return tickCount(engine, "SH600000") > 0; }));
  engine.stop();
}

// -----------------------------------------------------------------------------
// 3. RAII: the destructor joins every thread without an explicit stop().
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, DestructorStopsThreads) {
  {
    tickflow::TradingEngine engine(fastConfig(), sim_clock);
    engine.start();
    EXPECT_TRUE(waitUntil([&] { return tickCount(engine, "SH600000") > 2; }));
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 4. A bad configuration never gets as far as a thread.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, InvalidConfigThrows) {
  auto config = fastConfig();
  config.strategy.ma_crossover.long_period = 2;  // not > short_period
  EXPECT_THROW(tickflow::TradingEngine(config, sim_clock),
               std::invalid_argument);

  config = fastConfig();
  config.symbols.clear();
  EXPECT_THROW(tickflow::TradingEngine(config, sim_clock),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 5. Subscriptions change while the engine runs.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, SubscribeAndUnsubscribeWhileRunning) {
  tickflow::TradingEngine engine(fastConfig(), sim_clock);
  engine.start();

  EXPECT_TRUE(engine.subscribe("SZ000001"));
  EXPECT_FALSE(engine.subscribe("SZ000001"));
  ASSERT_NE(engine.pipeline("SZ000001"), nullptr);
  EXPECT_EQ(engine.symbols(),
            (std::vector<std::string>{"SH600000", "SZ000001"}));
  EXPECT_TRUE(waitUntil([&] { return tickCount(engine, "SZ000001") > 0; }));

  EXPECT_TRUE(engine.unsubscribe("SZ000001"));
  EXPECT_FALSE(engine.unsubscribe("SZ000001"));
  EXPECT_EQ(engine.pipeline("SZ000001"), nullptr);

  const auto snap = engine.hub().snapshot();
  EXPECT_EQ(snap.symbols, (std::vector<std::string>{"SH600000"}));
  EXPECT_EQ(snap.last.count("SZ000001"), 0u);

  // The remaining symbol keeps ticking.
  const auto before = tickCount(engine, "SH600000");
  EXPECT_TRUE(
      waitUntil([&] { return tickCount(engine, "SH600000") > before; }));

  EXPECT_THROW(engine.subscribe(""), std::invalid_argument);
  engine.stop();
}

TEST_F(TradingEngineTestFixture, SubscribeWhileStoppedTakesEffectOnStart) {
  tickflow::TradingEngine engine(fastConfig(), sim_clock);
  EXPECT_TRUE(engine.subscribe("SZ000001"));
  EXPECT_EQ(engine.pipeline("SZ000001"), nullptr);

  engine.start();
  EXPECT_NE(engine.pipeline("SZ000001"), nullptr);
  EXPECT_TRUE(waitUntil([&] { return tickCount(engine, "SZ000001") > 0; }));
  engine.stop();
}

// -----------------------------------------------------------------------------
// 6. The IPC command set.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, ExecuteCommand) {
  tickflow::TradingEngine engine(fastConfig(), sim_clock);
  engine.start();

  json r = json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(r["status"], "ok");
  EXPECT_EQ(r["response"], "PONG");
  EXPECT_EQ(json::parse(engine.executeCommand("ping"))["response"], "PONG");

  r = json::parse(engine.executeCommand("CLIENTS"));
  EXPECT_EQ(r["clients"], 0);

  r = json::parse(engine.executeCommand("HEALTH"));
  EXPECT_EQ(r["health"]["engine_running"], true);

  r = json::parse(engine.executeCommand("SNAPSHOT"));
  EXPECT_EQ(r["snapshot"]["symbols"], json::array({"SH600000"}));

  r = json::parse(engine.executeCommand("SUBSCRIBE SZ000001"));
  EXPECT_EQ(r["status"], "ok");
  EXPECT_EQ(r["symbol"], "SZ000001");
  r = json::parse(engine.executeCommand("SUBSCRIBE SZ000001"));
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["response"], "Already subscribed");

  r = json::parse(engine.executeCommand("UNSUBSCRIBE SZ000001"));
  EXPECT_EQ(r["status"], "ok");
  r = json::parse(engine.executeCommand("UNSUBSCRIBE SZ000001"));
  EXPECT_EQ(r["response"], "Not subscribed");

  r = json::parse(engine.executeCommand("FLY"));
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["response"], "Unknown command: FLY");

  r = json::parse(engine.executeCommand("SUBSCRIBE"));
  EXPECT_EQ(r["status"], "error");

  engine.stop();
}

// -----------------------------------------------------------------------------
// 7. With the server enabled on port 0 the bound port is reported.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, ServerPortWhenEnabled) {
  auto config = fastConfig();
  config.server.enabled = true;
  config.server.host = "127.0.0.1";
  config.server.port = 0;
  tickflow::TradingEngine engine(config, sim_clock);

  EXPECT_EQ(engine.serverPort(), 0);
  engine.start();
  EXPECT_NE(engine.serverPort(), 0);
  engine.stop();
  EXPECT_EQ(engine.serverPort(), 0);
}
