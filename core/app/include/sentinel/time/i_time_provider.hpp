#pragma once

#include <cstdint>

namespace sentinel {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every time-dependent rule in the engine.
//
// @details
// Max-hold-time exits, entry timestamps, fill timestamps and price-cache
// expiry all read the clock through this interface instead of calling
// std::chrono::system_clock directly. Production wiring injects a
// LiveTimeProvider; tests inject a SimulationTimeProvider and move time
// forward explicitly, so a 24 hour hold limit is tested without sleeping.
//
// Resolution is epoch milliseconds as int64_t, the same representation used
// in persisted records and JSON telemetry.
//
// Thread-safety contract:
//   now_ms() may be called concurrently from the monitor thread, the per-
//   position workers and the IPC thread. Implementations synchronize any
//   writer internally.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace sentinel
