#pragma once

#include "sentinel/domain/exit_action.hpp"
#include "sentinel/domain/position.hpp"

#include <cstdint>
#include <optional>

namespace sentinel {

// -----------------------------------------------------------------------------
// ExitRuleEvaluator — decides whether a position should be (partly) sold
// -----------------------------------------------------------------------------
//
// @brief  Pure decision function over a position snapshot, a price and a
//         clock reading. Holds no state; one instance can be shared freely.
//
// @details
// Rules are checked in a fixed priority order and the first match wins:
//
//   1. Stop-loss      profit <= -stop_loss_percent       FULL_CLOSE STOP_LOSS
//   2. Max hold       now - entry >= max_hold_time       FULL_CLOSE MAX_HOLD
//   3. Take-profit    profit >= take_profit_percent      FULL_CLOSE TAKE_PROFIT
//   4. Trailing stop  armed and retraced far enough      FULL_CLOSE TRAILING_STOP
//   5. Partial level  lowest unexecuted level reached    PARTIAL_CLOSE
//
// A price that satisfies both stop-loss and take-profit (possible only with
// inconsistent rules) therefore always yields STOP_LOSS.
//
// profit is measured against the position's VWAP cost basis, so a scale-in
// buy moves the stop-loss and take-profit lines with it.
//
// Trailing stop: the peak is max(highest_price, current_price). The stop is
// armed once the peak shows trigger_percent profit over the cost basis, and
// fires when (peak - current) / peak * 100 >= distance_percent. A position
// whose peak never reached the trigger never trails out, however far it
// falls from that peak.
//
// Partial levels: scanned in ascending threshold order; the first level that
// is not executed and whose threshold is <= profit is returned. Executed
// levels are skipped, so repeated evaluation of an unchanged position after
// the level was applied returns nothing.
//
// Errors:
//   InvalidInputError if current_price is not finite and > 0, or the
//   position is CLOSED.
// -----------------------------------------------------------------------------
class ExitRuleEvaluator {
 public:
  std::optional<domain::ExitAction> evaluate(const domain::Position& position,
                                             double current_price,
                                             std::int64_t now_ms) const;
};

}  // namespace sentinel
