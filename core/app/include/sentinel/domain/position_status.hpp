#pragma once

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// PositionStatus — position lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates the states a monitored position can occupy.
//
// @details
//
//   Open ───> PartiallyClosed ───> Closed
//    │              │   ▲
//    │              └───┘  (further partial sells, scale-in buys)
//    └──────────────────────────> Closed
//
// Closed is terminal. A position reaches it when amount_remaining hits zero,
// either through a full close or a partial close that consumed the remainder.
// Scale-in buys never change the status; a PartiallyClosed position that
// averages down stays PartiallyClosed.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Open,
  PartiallyClosed,
  Closed,
};

inline bool isActive(PositionStatus status) {
  return status == PositionStatus::Open ||
         status == PositionStatus::PartiallyClosed;
}

const char* toString(PositionStatus status);

}  // namespace domain
}  // namespace sentinel
