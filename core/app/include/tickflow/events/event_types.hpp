#pragma once

#include "tickflow/domain/account.hpp"
#include "tickflow/domain/indicators.hpp"
#include "tickflow/domain/signal.hpp"
#include "tickflow/domain/tick.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace tickflow {

// -----------------------------------------------------------------------------
// MarketDataEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries one provider tick into a symbol pipeline.
// Pushed by the symbol's ProviderThread onto the pipeline's EventLoopThread;
// the pipeline runs indicators, strategy, broker and broadcast for it on the
// loop thread, in arrival order.
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  domain::Tick tick;
  std::uint64_t sequence_id{0};  // Per-symbol, assigned by the ProviderThread
};

// -----------------------------------------------------------------------------
// ProviderErrorEvent
// -----------------------------------------------------------------------------
// Responsibility: A failed fetch for one symbol (network, parse, rate-limit,
// bad symbol) or a broker reply that did not arrive in time. Non-fatal: the
// pipeline forwards it to the BroadcastHub and carries on with the next
// interval.
// -----------------------------------------------------------------------------
struct ProviderErrorEvent {
  std::string symbol;
  std::string error;
  std::int64_t ts_ms{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// BrokerRequestEvent
// -----------------------------------------------------------------------------
//
// @brief  A request to apply one signal to the paper account.
//
// @details
// Symbol pipelines never touch the account themselves. They push this event
// onto the BrokerThread's loop, which is the only thread that mutates the
// PaperBroker, and block (with a bound) on `reply` for the resulting
// AccountSnapshot. The promise is shared because Event is copied by the
// EventBus; only the broker thread ever sets it.
//
// HOLD requests are still sent: they update the mark price for the symbol so
// equity is recomputed on every tick.
// -----------------------------------------------------------------------------
struct BrokerRequestEvent {
  domain::Signal signal;
  double price{0.0};
  std::int64_t ts_ms{0};
  std::shared_ptr<std::promise<domain::AccountSnapshot>> reply;
};

// -----------------------------------------------------------------------------
// TickProcessedEvent
// -----------------------------------------------------------------------------
// Responsibility: The composite result of one tick after all four stages.
// Published on the pipeline's own bus right after the BroadcastHub received
// it; tests and diagnostics subscribe here instead of going through a
// network consumer.
// -----------------------------------------------------------------------------
struct TickProcessedEvent {
  domain::Tick tick;
  domain::IndicatorSnapshot indicators;
  domain::Signal signal;
  domain::AccountSnapshot account;
  std::uint64_t sequence_id{0};
};

}  // namespace tickflow
