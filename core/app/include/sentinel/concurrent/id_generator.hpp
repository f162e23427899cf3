#pragma once

#include <atomic>
#include <cstdint>

namespace sentinel {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out position and strategy ids.
//
// @details
// Starts at 1; id 0 is reserved (it doubles as "manual" for strategy ids).
// After records are loaded from persistence the owner calls
// ensure_above(max_loaded_id) so restarted processes never reuse an id that
// already exists on disk.
//
// Thread model:
//   next_id() and ensure_above() are safe from any thread.
//
// Ownership:
//   Held by value in the PositionManager and StrategyBook. Not shared.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // ensure_above(id)
  // -------------------------------------------------------------------------
  // Raises the counter so the next id returned is strictly greater than `id`.
  // Never lowers it. CAS loop so a concurrent next_id() is not lost.
  // -------------------------------------------------------------------------
  void ensure_above(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace sentinel
