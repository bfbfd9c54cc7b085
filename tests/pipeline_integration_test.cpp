// =============================================================================
// pipeline_integration_test.cpp
// =============================================================================
// Integration tests for one SymbolPipeline wired to real components:
//   MarketDataEvent → IndicatorEngine → StrategyEngine
//     → BrokerThread (cross-thread request + reply) → BroadcastHub
//     → TickProcessedEvent on the pipeline bus
//
// Validates:
//   - The documented MA(2/3) scenario end to end: BUY on the 4th tick, the
//     account after it, and the composite reaching a hub session in order
//   - Provider errors reach the hub without interrupting the stream
//   - A broker that never replies produces "broker reply timeout" and no
//     composite for that tick
//   - Graceful shutdown: ticks pushed before stop() are fully processed
//
// Design:
//   The provider never produces anything on its own (it blocks until
//   cancelled), so every tick is injected with SymbolPipeline::push().
//   Composites are collected from the pipeline's EventBus; all threads are
//   stopped and joined before assertions that read the account.
// =============================================================================

#include "tickflow/broker/position_sizer.hpp"
#include "tickflow/engine/symbol_pipeline.hpp"
#include "tickflow/strategy/ma_crossover.hpp"
#include "tickflow/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using nlohmann::json;
using tickflow::domain::SignalKind;

namespace {

// Blocks in fetch() until the pipeline cancels it.
class IdleProvider final : public tickflow::IPriceProvider {
 public:
  using IPriceProvider::fetch;
  tickflow::ProviderResult fetch(const std::string& /*symbol*/,
                                 const std::atomic<bool>& cancel) override {
    while (!cancel.load()) {
      std::this_thread::sleep_for(1ms);
    }
    return tickflow::ProviderResult::failure("cancelled", 0);
  }
  const char* name() const override { return "idle"; }
};

}  // namespace

// =============================================================================
// Fixture: one pipeline for SH600000 over MA(2/3), 10000 starting cash.
//
// Lifecycle per test:
//   SetUp()    → build components, start the broker and the pipeline.
//   <test>     → push events and verify outcomes.
//   TearDown() → stop the pipeline, then the broker (joins both loops).
// =============================================================================
class PipelineIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tickflow::BrokerConfig broker_config;
    broker_config.starting_cash = 10000.0;
    broker = std::make_unique<tickflow::BrokerThread>(
        std::make_unique<tickflow::PaperBroker>(
            broker_config, tickflow::make_position_sizer(broker_config)));

    hub.add_symbol("SH600000");
    hub.set_account(broker->idle_snapshot());
  }

  void TearDown() override {
    if (pipeline) {
      pipeline->stop();
    }
    broker->stop();
  }

  void startPipeline(std::chrono::milliseconds reply_timeout = 2s,
                     bool start_broker = true) {
    pipeline = std::make_unique<tickflow::SymbolPipeline>(
        "SH600000", provider, 1h, indicators, strategy, *broker, hub,
        reply_timeout);
    pipeline->eventBus().subscribe<tickflow::TickProcessedEvent>(
        [this](const tickflow::TickProcessedEvent& e) {
          std::lock_guard lock(mutex);
          composites.push_back(e);
          cv.notify_all();
        });
    if (start_broker) {
      broker->start();
    }
    pipeline->start();
  }

  void pushTick(double price, std::int64_t ts, std::uint64_t seq) {
    pipeline->push(tickflow::MarketDataEvent{
        tickflow::domain::Tick{"SH600000", price, ts}, seq});
  }

  bool waitForComposites(std::size_t n) {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, 2s, [&] { return composites.size() >= n; });
  }

  tickflow::SimulationTimeProvider clock{1'700'000'000'000};
  IdleProvider provider;
  tickflow::IndicatorEngine indicators{tickflow::IndicatorConfig{2, 3, 14}};
  tickflow::StrategyEngine strategy{std::make_unique<tickflow::MACrossover>(
      tickflow::MACrossoverConfig{2, 3})};
  tickflow::BroadcastHub hub{tickflow::BroadcastConfig{}, clock};
  std::unique_ptr<tickflow::BrokerThread> broker;
  std::unique_ptr<tickflow::SymbolPipeline> pipeline;

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<tickflow::TickProcessedEvent> composites;
};

// -----------------------------------------------------------------------------
// 1. [10, 10, 10, 12, 14]: BUY on the 4th tick at 12, marked at 14 after.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, CrossoverScenarioEndToEnd) {
  auto session = hub.connect();
  startPipeline();

  const double prices[] = {10, 10, 10, 12, 14};
  for (std::uint64_t i = 0; i < 5; ++i) {
    pushTick(prices[i], static_cast<std::int64_t>(i + 1), i + 1);
  }
  ASSERT_TRUE(waitForComposites(5));

  const auto& buy = composites[3];
  EXPECT_EQ(buy.signal.kind, SignalKind::Buy);
  EXPECT_EQ(buy.signal.reason, "ma_cross_up ma_short=11.0000 ma_long=10.6667");
  EXPECT_EQ(buy.sequence_id, 4u);
  ASSERT_TRUE(buy.account.last_order.has_value());
  EXPECT_EQ(buy.account.last_order->status,
            tickflow::domain::OrderStatus::Filled);
  // floor(5000 / 12) = 416 units for 4992.
  EXPECT_DOUBLE_EQ(buy.account.positions.at("SH600000").qty, 416.0);
  EXPECT_DOUBLE_EQ(buy.account.cash, 5008.0);
  EXPECT_DOUBLE_EQ(buy.account.equity, 10000.0);

  const auto& last = composites[4];
  EXPECT_EQ(last.signal.kind, SignalKind::Hold);
  EXPECT_DOUBLE_EQ(last.account.equity, 5008.0 + 416.0 * 14.0);
  EXPECT_DOUBLE_EQ(*last.indicators.ma_short, 13.0);
  EXPECT_DOUBLE_EQ(*last.indicators.ma_long, 12.0);

  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(composites[i].signal.kind, SignalKind::Hold) << i;
  }
  EXPECT_EQ(pipeline->processed(), 5u);

  // The hub session saw the snapshot, then the five ticks in order.
  EXPECT_EQ(json::parse(**session->try_pop())["type"], "snapshot");
  for (double price : prices) {
    const json m = json::parse(**session->try_pop());
    EXPECT_EQ(m["type"], "tick");
    EXPECT_EQ(m["price"], price);
  }

  const auto snap = hub.snapshot();
  EXPECT_DOUBLE_EQ(snap.last.at("SH600000").tick->price, 14.0);
  EXPECT_EQ(snap.health.at("SH600000").tick_count, 5u);
  EXPECT_DOUBLE_EQ(snap.account.cash, 5008.0);
}

// -----------------------------------------------------------------------------
// 2. A provider error is broadcast and the next tick still flows.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, ProviderErrorDoesNotStopStream) {
  auto session = hub.connect();
  session->try_pop();  // snapshot
  startPipeline();

  pipeline->push(
      tickflow::ProviderErrorEvent{"SH600000", "http 503", clock.now_ms(), 1});
  pushTick(10.0, clock.now_ms(), 2);
  ASSERT_TRUE(waitForComposites(1));

  const json error = json::parse(**session->pop_for(2s));
  EXPECT_EQ(error["type"], "error");
  EXPECT_EQ(error["error"], "http 503");
  EXPECT_EQ(json::parse(**session->pop_for(2s))["type"], "tick");

  EXPECT_EQ(pipeline->errors(), 1u);
  EXPECT_EQ(pipeline->processed(), 1u);
  EXPECT_FALSE(hub.snapshot().health.at("SH600000").last_error.has_value());
}

// -----------------------------------------------------------------------------
// 3. The broker loop is not running: the wait is bounded and reported.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, BrokerReplyTimeoutIsReported) {
  auto session = hub.connect();
  session->try_pop();  // snapshot
  startPipeline(50ms, /*start_broker=*/false);

  pushTick(10.0, clock.now_ms(), 1);
  auto message = session->pop_for(2s);
  ASSERT_TRUE(message.has_value());

  const json error = json::parse(**message);
  EXPECT_EQ(error["type"], "error");
  EXPECT_EQ(error["symbol"], "SH600000");
  EXPECT_EQ(error["error"], "broker reply timeout");
  // A broker fault is not a provider fault.
  EXPECT_FALSE(hub.snapshot().health.at("SH600000").last_error.has_value());

  pipeline->stop();
  EXPECT_EQ(pipeline->errors(), 1u);
  EXPECT_EQ(pipeline->processed(), 0u);
  EXPECT_TRUE(composites.empty());
  EXPECT_EQ(hub.published(), 0u);
}

// -----------------------------------------------------------------------------
// 4. stop() finishes every tick that was already queued.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, StopDrainsQueuedTicks) {
  startPipeline();

  constexpr int kTicks = 200;
  for (int i = 1; i <= kTicks; ++i) {
    pushTick(10.0 + (i % 5), i, static_cast<std::uint64_t>(i));
  }
  pipeline->stop();

  EXPECT_FALSE(pipeline->running());
  EXPECT_EQ(pipeline->processed(), static_cast<std::uint64_t>(kTicks));
  EXPECT_EQ(hub.published(), static_cast<std::uint64_t>(kTicks));

  // Composites arrived strictly in push order.
  std::lock_guard lock(mutex);
  ASSERT_EQ(composites.size(), static_cast<std::size_t>(kTicks));
  for (int i = 0; i < kTicks; ++i) {
    EXPECT_EQ(composites[i].sequence_id, static_cast<std::uint64_t>(i + 1));
  }
}
