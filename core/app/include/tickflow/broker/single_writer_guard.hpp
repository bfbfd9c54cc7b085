#pragma once

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>

namespace tickflow {

// -----------------------------------------------------------------------------
// SingleWriterViolation
// -----------------------------------------------------------------------------
// Thrown when guarded state is mutated from a thread other than its owner.
// A programming error, never an expected runtime outcome: nothing in the
// engine catches it to continue.
// -----------------------------------------------------------------------------
class SingleWriterViolation : public std::logic_error {
 public:
  explicit SingleWriterViolation(const std::string& what)
      : std::logic_error(what) {}
};

// -----------------------------------------------------------------------------
// SingleWriterGuard
// -----------------------------------------------------------------------------
//
// @brief  Binds to the first thread that calls check() and rejects every
//         other thread afterwards.
//
// @details
// PaperBroker calls check() at the top of each mutating operation. In the
// engine all of them run on the BrokerThread loop, which binds on the first
// tick. A stray call from a symbol pipeline, a server thread or a test
// thread is reported with a "[<owner>] FATAL" line on stderr and a
// SingleWriterViolation.
//
// rebind() releases the binding; only for handing a broker that was set up
// on one thread to the loop that will own it, before that loop starts.
// -----------------------------------------------------------------------------
class SingleWriterGuard {
 public:
  explicit SingleWriterGuard(std::string owner) : owner_(std::move(owner)) {}

  void check(const char* operation);

  void rebind() { writer_.store(std::thread::id{}); }

  bool bound() const { return writer_.load() != std::thread::id{}; }

 private:
  const std::string owner_;
  std::atomic<std::thread::id> writer_{};
};

}  // namespace tickflow
