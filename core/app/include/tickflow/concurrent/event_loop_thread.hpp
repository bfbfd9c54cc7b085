#pragma once

#include "tickflow/concurrent/thread_safe_queue.hpp"
#include "tickflow/eventbus/event_bus.hpp"
#include "tickflow/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace tickflow {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Anything subscribed to the
// bus runs on the worker thread, strictly in push order.
//
// Where it is used:
//   - one per SymbolPipeline: the serial FIFO that guarantees a symbol's
//     ticks are processed one at a time and in order;
//   - one inside BrokerThread: the single mutation queue of the account.
//
// Thread model: start(), stop() and push() may be called from any thread.
// EventBus callbacks run only on the worker thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  // `name` only appears in log lines ("[EventLoopThread:SH600000] ...").
  explicit EventLoopThread(std::string name = "loop");

  // Stops and joins; the worker never outlives the queue and bus it uses.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Launches the worker. Calling it while already running is a no-op.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Asks the worker to exit and joins it. Events already queued when
  // stop() is called are still published before the worker returns, so a
  // caller waiting on a reply carried in one of them is always answered.
  // Idempotent; start() may be called again afterwards.
  // Must not be called from the worker thread itself.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // push(event)
  // -------------------------------------------------------------------------
  // Enqueues one event for the worker. Never blocks on the worker.
  // -------------------------------------------------------------------------
  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

  // True when called from the worker thread.
  bool on_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
  }

  // Events waiting to be published.
  std::size_t pending() const { return queue_.size(); }

  const std::string& name() const { return name_; }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace tickflow
