#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace tickflow {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between producer and consumer threads.
// Provides blocking pop(), timed pop_for() and non-blocking try_pop().
//
// Why in architecture: Every EventLoopThread (symbol pipelines, the broker
// thread) owns one of these. Provider threads and pipelines push; the loop
// thread pops and dispatches. Ordering is strict FIFO, which is what keeps
// ticks for one symbol in arrival order.
//
// Thread model: Safe for multiple producers and multiple consumers. wake()
// releases every waiter in pop_for() so an owning loop can notice a stop
// request without waiting out its timeout.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition variable. Share
  // by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one waiting consumer.
  // Thread-safety: Safe from any thread. Notification happens outside the
  // lock so the woken consumer does not immediately block on the mutex.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one exists.
  // Thread-safety: Safe from any thread. The predicate form of wait()
  // re-checks emptiness after spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout) — bounded wait
  // -------------------------------------------------------------------------
  // What: Like pop(), but gives up after `timeout` or after wake() and
  // returns std::nullopt if the queue is still empty.
  // Why: Loop threads use this as their idle wait so that stop() is
  // observed promptly without busy-waiting.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    const std::uint64_t epoch = wake_epoch_;
    condition_.wait_for(lock, timeout, [this, epoch] {
      return !queue_.empty() || wake_epoch_ != epoch;
    });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // wake()
  // -------------------------------------------------------------------------
  // What: Releases every thread currently blocked in pop_for(). Threads in
  // pop() keep waiting (they only return with an item).
  // -------------------------------------------------------------------------
  void wake() {
    {
      std::lock_guard lock(mutex_);
      ++wake_epoch_;
    }
    condition_.notify_all();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;

  // Bumped by wake(). Waiters in pop_for() compare against the value they
  // saw on entry, so a wake() only releases threads already waiting.
  std::uint64_t wake_epoch_{0};
};

}  // namespace tickflow
