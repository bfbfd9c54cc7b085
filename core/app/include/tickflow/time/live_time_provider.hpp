#pragma once

#include "tickflow/time/i_time_provider.hpp"

namespace tickflow {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time
// -----------------------------------------------------------------------------
// Used by the executable. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tickflow
