#include "tickflow/provider/provider_thread.hpp"

#include <iostream>
#include <utility>

namespace tickflow {

ProviderThread::ProviderThread(std::string symbol, IPriceProvider& provider,
                               std::chrono::milliseconds interval,
                               EventSink sink)
    : symbol_(std::move(symbol)),
      provider_(provider),
      interval_(interval),
      sink_(std::move(sink)) {}

ProviderThread::~ProviderThread() { stop(); }

void ProviderThread::start() {
  if (thread_.joinable()) {
    return;
  }
  stop_requested_.store(false);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): set the flag under the mutex so the waiter cannot miss it, then
// notify and join.
// -----------------------------------------------------------------------------
void ProviderThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_.store(true);
  }
  cv_.notify_all();
  thread_.join();
}

void ProviderThread::run() {
  std::cout << "[ProviderThread] " << symbol_ << " polling every "
            << interval_.count() << " ms via " << provider_.name() << "\n";

  while (!stop_requested_.load()) {
    ProviderResult result = provider_.fetch(symbol_, stop_requested_);
    if (stop_requested_.load()) {
      break;
    }

    const std::uint64_t seq = ++sequence_;
    if (result.ok()) {
      sink_(MarketDataEvent{std::move(*result.tick), seq});
    } else {
      std::cerr << "[ProviderThread] " << symbol_ << " fetch failed: "
                << result.error << "\n";
      sink_(ProviderErrorEvent{symbol_, std::move(result.error), result.ts_ms,
                               seq});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return stop_requested_.load(); });
  }

  std::cout << "[ProviderThread] " << symbol_ << " stopped after "
            << sequence_.load() << " results\n";
}

}  // namespace tickflow
