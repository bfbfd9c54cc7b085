#pragma once

#include "tickflow/broadcast/broadcast_hub.hpp"
#include "tickflow/broker/broker_thread.hpp"
#include "tickflow/concurrent/event_loop_thread.hpp"
#include "tickflow/eventbus/event_bus.hpp"
#include "tickflow/indicators/indicator_engine.hpp"
#include "tickflow/provider/i_price_provider.hpp"
#include "tickflow/provider/provider_thread.hpp"
#include "tickflow/strategy/strategy_engine.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace tickflow {

// -----------------------------------------------------------------------------
// SymbolPipeline — one symbol's tick → indicators → signal → account → hub
// -----------------------------------------------------------------------------
//
// @brief  Owns the symbol's serial event loop and its ProviderThread, and
//         runs the four pipeline stages for every tick on that loop.
//
// @details
// Per MarketDataEvent, on the pipeline thread, in order:
//   1. IndicatorEngine::update(tick)
//   2. StrategyEngine::evaluate(tick, indicators)
//   3. BrokerThread::submit(signal, price) and a bounded wait for the
//      account snapshot. A reply that misses broker.reply_timeout_ms is
//      reported through BroadcastHub::publishError("broker reply timeout",
//      ErrorOrigin::Broker) and the tick is not broadcast. The abandoned
//      request may still be applied later; the next composite's account
//      (a whole-account snapshot) then carries its effect.
//   4. BroadcastHub::publish(composite), then the composite is published on
//      this pipeline's EventBus as a TickProcessedEvent for observers.
// The next tick is not dequeued until all four have completed.
//
// Per ProviderErrorEvent: BroadcastHub::publishError(). Observers on the
// pipeline bus see the event directly.
//
// Thread model:
//   start()/stop() from the engine thread. Stage code runs on the pipeline
//   thread. Observers subscribed to eventBus() run on the pipeline thread.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Borrows the provider, the
//   shared engines, the broker and the hub; all must outlive it.
// -----------------------------------------------------------------------------
class SymbolPipeline {
 public:
  SymbolPipeline(std::string symbol, IPriceProvider& provider,
                 std::chrono::milliseconds interval,
                 IndicatorEngine& indicators, StrategyEngine& strategy,
                 BrokerThread& broker, BroadcastHub& hub,
                 std::chrono::milliseconds broker_reply_timeout);

  ~SymbolPipeline();

  SymbolPipeline(const SymbolPipeline&) = delete;
  SymbolPipeline& operator=(const SymbolPipeline&) = delete;

  // Starts the loop, then the provider, so no tick arrives before the
  // stages are subscribed.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Stops the provider first (cancelling any in-flight fetch), then the
  // loop, which finishes the ticks already queued. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return loop_.running(); }

  const std::string& symbol() const { return symbol_; }

  // -------------------------------------------------------------------------
  // push(event)
  // -------------------------------------------------------------------------
  // Injects an event as if the provider had produced it. Tests use this to
  // drive the stages with known prices.
  // -------------------------------------------------------------------------
  void push(Event event) { loop_.push(std::move(event)); }

  // TickProcessedEvent / ProviderErrorEvent observers.
  EventBus& eventBus() { return loop_.eventBus(); }

  std::uint64_t processed() const { return processed_.load(); }
  std::uint64_t errors() const { return errors_.load(); }

 private:
  void onTick(const MarketDataEvent& event);
  void onError(const ProviderErrorEvent& event);

  const std::string symbol_;
  IndicatorEngine& indicators_;
  StrategyEngine& strategy_;
  BrokerThread& broker_;
  BroadcastHub& hub_;
  const std::chrono::milliseconds broker_reply_timeout_;

  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> errors_{0};

  // Declared last: the provider thread pushes into the loop, so it is
  // destroyed (joined) first.
  EventLoopThread loop_;
  ProviderThread provider_thread_;
};

}  // namespace tickflow
