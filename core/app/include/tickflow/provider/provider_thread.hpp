#pragma once

#include "tickflow/events/event.hpp"
#include "tickflow/provider/i_price_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tickflow {

// -----------------------------------------------------------------------------
// ProviderThread — polling loop for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Calls IPriceProvider::fetch() for one symbol every `interval` and
//         forwards each result into the symbol pipeline.
//
// @details
// Loop:
//   1. result = provider.fetch(symbol, stop flag)
//   2. tick  → sink(MarketDataEvent), error → sink(ProviderErrorEvent)
//   3. wait `interval` on a condition variable, or until stop()
//
// The interval is measured from the end of one fetch to the start of the
// next, so a slow upstream stretches the cadence instead of queueing calls.
// The sink is the pipeline's EventLoopThread::push(); it never blocks.
//
// Cancellation:
//   stop() sets the flag the provider observes (aborting an in-flight
//   transfer or backoff), notifies the condition variable, and joins. A
//   result that completes after stop() was requested is dropped.
//
// Restartable: start() after stop() begins a fresh loop; sequence ids keep
// counting.
//
// Thread model:
//   start()/stop() from the owning thread. The sink runs on this thread.
//
// Ownership:
//   Owned by SymbolPipeline. Borrows the provider, which TradingEngine owns
//   and destroys after every ProviderThread has stopped.
// -----------------------------------------------------------------------------
class ProviderThread {
 public:
  using EventSink = std::function<void(Event)>;

  ProviderThread(std::string symbol, IPriceProvider& provider,
                 std::chrono::milliseconds interval, EventSink sink);

  ~ProviderThread();

  ProviderThread(const ProviderThread&) = delete;
  ProviderThread& operator=(const ProviderThread&) = delete;
  ProviderThread(ProviderThread&&) = delete;
  ProviderThread& operator=(ProviderThread&&) = delete;

  void start();
  void stop();

  bool running() const { return thread_.joinable() && !stop_requested_.load(); }

  const std::string& symbol() const { return symbol_; }

  // Results forwarded so far (ticks and errors).
  std::uint64_t emitted() const { return sequence_.load(); }

 private:
  void run();

  const std::string symbol_;
  IPriceProvider& provider_;
  const std::chrono::milliseconds interval_;
  EventSink sink_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> sequence_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace tickflow
