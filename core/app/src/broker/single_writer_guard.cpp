#include "tickflow/broker/single_writer_guard.hpp"

#include <iostream>
#include <sstream>

namespace tickflow {

// -----------------------------------------------------------------------------
// check(operation)
// -----------------------------------------------------------------------------
// First caller wins the compare-exchange and becomes the writer. Later calls
// from the writer pass; anyone else is fatal.
// -----------------------------------------------------------------------------
void SingleWriterGuard::check(const char* operation) {
  const std::thread::id self = std::this_thread::get_id();
  std::thread::id expected{};
  if (writer_.compare_exchange_strong(expected, self) || expected == self) {
    return;
  }

  std::ostringstream message;
  message << owner_ << "::" << operation << " called from thread " << self
          << " but the single writer is thread " << expected;
  std::cerr << "[" << owner_ << "] FATAL single-writer violation: "
            << message.str() << "\n";
  throw SingleWriterViolation(message.str());
}

}  // namespace tickflow
