#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace tickflow {

// -----------------------------------------------------------------------------
// BoundedQueue<T> — drop-oldest outbound buffer
// -----------------------------------------------------------------------------
//
// @brief  Fixed-capacity FIFO whose push() never blocks. When the queue is
//         full the oldest element is discarded to make room, so the queue
//         always holds the most recent `capacity` items.
//
// @details
// This is the per-consumer outbound queue of the BroadcastHub. The producer
// is a symbol pipeline thread publishing a composite tick; it must never wait
// on a slow or stalled network consumer. Dropping the oldest message keeps the
// consumer on the most recent state, which is what a live viewer wants.
//
// push_pinned() adds an element that eviction skips until it is popped.
// Pinned elements sit ahead of every unpinned one; the hub pins each
// session's snapshot so that overflow can never take it away from a consumer
// that has not read it yet. Pinned elements count against the capacity.
//
// close() marks the queue finished: pending items may still be popped, new
// pushes are ignored, and any consumer blocked in pop_for() wakes up. A
// drained, closed queue returns std::nullopt immediately, which is how the
// writer task of a connection learns it should exit.
//
// Thread model:
//   push() from any number of producers; pop_for()/try_pop() from the one
//   consumer task of the owning connection. All methods take the same mutex.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedQueue capacity must be > 0");
    }
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  //
  // @brief  Appends `value`, evicting the oldest element if full.
  //
  // @return true if an element had to be dropped to make room.
  //
  // @details
  // O(1), never blocks beyond the short critical section. Pushes to a closed
  // queue are discarded and reported as not dropped.
  // -------------------------------------------------------------------------
  bool push(T value) {
    bool dropped = false;
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      if (queue_.size() >= capacity_) {
        ++dropped_count_;
        dropped = true;
        if (queue_.size() == pinned_) {
          return true;  // Nothing evictable; the newcomer is the casualty.
        }
        queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(pinned_));
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return dropped;
  }

  // -------------------------------------------------------------------------
  // push_pinned(value)
  // -------------------------------------------------------------------------
  //
  // @brief  Places `value` after any pinned elements and before all unpinned
  //         ones, exempt from eviction until popped.
  //
  // @return true if an element had to be dropped to make room (the oldest
  //         unpinned one, or `value` itself when everything is pinned).
  // -------------------------------------------------------------------------
  bool push_pinned(T value) {
    bool dropped = false;
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      if (queue_.size() >= capacity_) {
        ++dropped_count_;
        dropped = true;
        if (queue_.size() == pinned_) {
          return true;
        }
        queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(pinned_));
      }
      queue_.insert(queue_.begin() + static_cast<std::ptrdiff_t>(pinned_),
                    std::move(value));
      ++pinned_;
    }
    condition_.notify_one();
    return dropped;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  //
  // @brief  Waits up to `timeout` for an element.
  //
  // @return The front element, or std::nullopt on timeout or when the queue
  //         is closed and drained.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout,
                        [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
      return std::nullopt;
    }
    return take_front_locked();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    return take_front_locked();
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

  // Total number of elements evicted by push() since construction.
  std::uint64_t dropped_count() const {
    std::lock_guard lock(mutex_);
    return dropped_count_;
  }

 private:
  T take_front_locked() {
    T value = std::move(queue_.front());
    queue_.pop_front();
    if (pinned_ > 0) {
      --pinned_;
    }
    return value;
  }

  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool closed_{false};
  std::uint64_t dropped_count_{0};
  std::size_t pinned_{0};  // Leading elements exempt from eviction
};

}  // namespace tickflow
