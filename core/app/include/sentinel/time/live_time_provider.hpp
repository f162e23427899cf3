#pragma once

#include "sentinel/time/i_time_provider.hpp"

namespace sentinel {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall clock
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace sentinel
