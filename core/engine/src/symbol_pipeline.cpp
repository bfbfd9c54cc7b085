#include "tickflow/engine/symbol_pipeline.hpp"

#include <future>
#include <iostream>
#include <utility>

namespace tickflow {

SymbolPipeline::SymbolPipeline(std::string symbol, IPriceProvider& provider,
                               std::chrono::milliseconds interval,
                               IndicatorEngine& indicators,
                               StrategyEngine& strategy, BrokerThread& broker,
                               BroadcastHub& hub,
                               std::chrono::milliseconds broker_reply_timeout)
    : symbol_(std::move(symbol)),
      indicators_(indicators),
      strategy_(strategy),
      broker_(broker),
      hub_(hub),
      broker_reply_timeout_(broker_reply_timeout),
      loop_(symbol_),
      provider_thread_(symbol_, provider, interval,
                       [this](Event event) { loop_.push(std::move(event)); }) {
  loop_.eventBus().subscribe<MarketDataEvent>(
      [this](const MarketDataEvent& e) { onTick(e); });
  loop_.eventBus().subscribe<ProviderErrorEvent>(
      [this](const ProviderErrorEvent& e) { onError(e); });
}

SymbolPipeline::~SymbolPipeline() { stop(); }

void SymbolPipeline::start() {
  loop_.start();
  provider_thread_.start();
}

void SymbolPipeline::stop() {
  provider_thread_.stop();
  loop_.stop();
}

// -----------------------------------------------------------------------------
// onTick(): the four stages, strictly in order
// -----------------------------------------------------------------------------
void SymbolPipeline::onTick(const MarketDataEvent& event) {
  const domain::Tick& tick = event.tick;

  const domain::IndicatorSnapshot indicators = indicators_.update(tick);
  domain::Signal signal = strategy_.evaluate(tick, indicators);

  auto reply = broker_.submit(signal, tick.price, tick.ts_ms);
  if (reply.wait_for(broker_reply_timeout_) != std::future_status::ready) {
    ++errors_;
    std::cerr << "[SymbolPipeline] " << symbol_
              << " broker reply timeout after "
              << broker_reply_timeout_.count() << " ms (seq "
              << event.sequence_id << ")\n";
    hub_.publishError(symbol_, "broker reply timeout", tick.ts_ms,
                      ErrorOrigin::Broker);
    return;
  }

  TickProcessedEvent composite{tick, indicators, std::move(signal),
                               reply.get(), event.sequence_id};
  hub_.publish(composite);
  ++processed_;

  loop_.eventBus().publish(composite);
}

void SymbolPipeline::onError(const ProviderErrorEvent& event) {
  ++errors_;
  hub_.publishError(event.symbol, event.error, event.ts_ms);
}

}  // namespace tickflow
