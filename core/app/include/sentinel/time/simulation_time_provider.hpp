#pragma once

#include "sentinel/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace sentinel {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set by the caller.
//
// @details
// Used by tests and by the demo harness. advance_time() jumps to an absolute
// timestamp; advance_by() moves relative to the current value, which is the
// common case when a test needs "the hold limit has now elapsed".
//
// Storage is a std::atomic<int64_t>, so readers on worker threads never
// contend with the writer.
//
// Monotonicity is the caller's responsibility and is not enforced; tests
// occasionally rewind the clock on purpose.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace sentinel
