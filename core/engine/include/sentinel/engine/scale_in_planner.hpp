#pragma once

#include "sentinel/domain/position.hpp"
#include "sentinel/domain/scale_in_plan.hpp"

#include <optional>

namespace sentinel {

// -----------------------------------------------------------------------------
// ScaleInPlanner — decides whether the next averaging-down buy is due
// -----------------------------------------------------------------------------
//
// @brief  Pure function: returns the phase at current_phase when the price
//         has dropped far enough below the ORIGINAL entry price.
//
// @details
//   drop = (entry_price - current_price) / entry_price * 100
//   fires when drop >= phases[current_phase].trigger_drop_percent
//
// Only phases[current_phase] is ever considered, so phase N cannot fire
// before phase N-1 has executed even when one price move crosses several
// thresholds. Returns nothing for positions without an enabled plan, with an
// exhausted plan, or that are not active.
//
// The entry price, not the VWAP cost basis, is the reference: otherwise each
// executed phase would pull the reference down and push the next trigger
// further away.
//
// Errors:
//   InvalidInputError if current_price is not finite and > 0.
// -----------------------------------------------------------------------------
class ScaleInPlanner {
 public:
  std::optional<domain::ScaleInPhase> nextPhase(
      const domain::Position& position, double current_price) const;
};

}  // namespace sentinel
