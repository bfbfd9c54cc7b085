#pragma once

#include "tickflow/broker/paper_broker.hpp"
#include "tickflow/concurrent/event_loop_thread.hpp"
#include "tickflow/domain/account.hpp"
#include "tickflow/domain/signal.hpp"
#include "tickflow/eventbus/event_bus.hpp"

#include <cstdint>
#include <future>
#include <memory>

namespace tickflow {

// -----------------------------------------------------------------------------
// BrokerThread — single owner of the paper account
// -----------------------------------------------------------------------------
//
// @brief  Serializes every account mutation through one EventLoopThread.
//
// @details
// Symbol pipelines run in parallel but trade against one shared account.
// Instead of locking the account, each pipeline calls submit(), which pushes
// a BrokerRequestEvent onto this loop and returns a future. The loop applies
// requests one at a time, in arrival order, with PaperBroker::on_signal()
// and fulfils the future with the resulting AccountSnapshot.
//
// The PaperBroker's writer binding is released in start() so the loop
// thread becomes its owner on the first request.
//
// If the broker reports a SingleWriterViolation on the loop, the handler
// logs it, forwards it to the waiting pipeline through the future and
// rethrows, which ends the process.
//
// Thread model:
//   start()/stop() from the owning thread (TradingEngine). submit() from
//   any thread.
//
// Ownership:
//   Owns the PaperBroker. Owned by TradingEngine.
// -----------------------------------------------------------------------------
class BrokerThread {
 public:
  explicit BrokerThread(std::unique_ptr<PaperBroker> broker);
  ~BrokerThread();

  BrokerThread(const BrokerThread&) = delete;
  BrokerThread& operator=(const BrokerThread&) = delete;

  void start();

  // Applies every request already queued, then joins the loop.
  void stop();

  // -------------------------------------------------------------------------
  // submit(signal, price, ts_ms)
  // -------------------------------------------------------------------------
  // @brief  Queues `signal` (HOLD included, for the mark) at `price`.
  // @return Future of the account snapshot after the request is applied.
  // -------------------------------------------------------------------------
  std::future<domain::AccountSnapshot> submit(domain::Signal signal,
                                              double price,
                                              std::int64_t ts_ms);

  // Account state while the loop is not running. Used to seed the
  // BroadcastHub before start().
  domain::AccountSnapshot idle_snapshot() const;

  bool running() const { return loop_.running(); }

 private:
  void onRequest(const BrokerRequestEvent& request);

  std::unique_ptr<PaperBroker> broker_;
  EventLoopThread loop_{"broker"};
  EventBus::SubscriptionId subscription_id_{0};
};

}  // namespace tickflow
