#include "tickflow/broker/broker_thread.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace tickflow {

BrokerThread::BrokerThread(std::unique_ptr<PaperBroker> broker)
    : broker_(std::move(broker)) {
  if (!broker_) {
    throw std::invalid_argument("BrokerThread requires a PaperBroker");
  }
  subscription_id_ = loop_.eventBus().subscribe<BrokerRequestEvent>(
      [this](const BrokerRequestEvent& e) { onRequest(e); });
}

BrokerThread::~BrokerThread() {
  stop();
  loop_.eventBus().unsubscribe(subscription_id_);
}

void BrokerThread::start() {
  if (loop_.running()) {
    return;
  }
  broker_->release_writer();
  loop_.start();
  std::cout << "[BrokerThread] started. cash=" << broker_->cash()
            << " sizer=" << broker_->sizer().name() << "\n";
}

void BrokerThread::stop() {
  if (!loop_.running()) {
    return;
  }
  loop_.stop();
  broker_->release_writer();
  std::cout << "[BrokerThread] stopped. cash=" << broker_->cash()
            << " equity=" << broker_->equity()
            << " realized_pnl=" << broker_->realized_pnl() << "\n";
}

std::future<domain::AccountSnapshot> BrokerThread::submit(
    domain::Signal signal, double price, std::int64_t ts_ms) {
  auto reply = std::make_shared<std::promise<domain::AccountSnapshot>>();
  auto future = reply->get_future();
  loop_.push(BrokerRequestEvent{std::move(signal), price, ts_ms, reply});
  return future;
}

domain::AccountSnapshot BrokerThread::idle_snapshot() const {
  return broker_->snapshot();
}

// -----------------------------------------------------------------------------
// onRequest(): runs on the broker loop thread only
// -----------------------------------------------------------------------------
void BrokerThread::onRequest(const BrokerRequestEvent& request) {
  try {
    request.reply->set_value(broker_->on_signal(request.signal, request.price));
  } catch (const SingleWriterViolation&) {
    std::cerr << "[BrokerThread] FATAL account accessed off the broker "
                 "thread; halting\n";
    request.reply->set_exception(std::current_exception());
    throw;
  }
}

}  // namespace tickflow
