#include "tickflow/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <utility>

namespace tickflow {

namespace {

// Idle wait between checks of running_. stop() also wakes the queue, so this
// only bounds the latency of a missed wake.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
// running_ is set before the thread is created so the worker's first check
// sees true.
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
// Clear the flag, release the worker from pop_for(), join. No lock is held
// across join().
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  queue_.wake();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (event) {
      bus_.publish(*event);
    }
  }

  // Drain what was queued before stop().
  while (std::optional<Event> event = queue_.try_pop()) {
    bus_.publish(*event);
  }
}

}  // namespace tickflow
