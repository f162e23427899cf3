#include "sentinel/engine/exit_rule_evaluator.hpp"

#include "sentinel/common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace sentinel {

std::optional<domain::ExitAction> ExitRuleEvaluator::evaluate(
    const domain::Position& position, double current_price,
    std::int64_t now_ms) const {
  using domain::CloseReason;
  using domain::ExitAction;

  if (!std::isfinite(current_price) || current_price <= 0.0) {
    throw InvalidInputError("evaluate: price must be > 0, got " +
                            std::to_string(current_price));
  }
  if (!position.isActive()) {
    throw InvalidInputError("evaluate: position " +
                            std::to_string(position.id) + " is " +
                            domain::toString(position.status));
  }

  const domain::ExitRules& rules = position.exit_rules;
  const double profit = position.profitPercentAt(current_price);

  // 1. Stop-loss
  if (rules.stop_loss_percent && profit <= -*rules.stop_loss_percent) {
    return ExitAction::fullClose(CloseReason::StopLoss);
  }

  // 2. Max hold time
  if (rules.max_hold_time_seconds &&
      now_ms - position.entry_timestamp_ms >=
          *rules.max_hold_time_seconds * 1000) {
    return ExitAction::fullClose(CloseReason::MaxHold);
  }

  // 3. Take-profit
  if (rules.take_profit_percent && profit >= *rules.take_profit_percent) {
    return ExitAction::fullClose(CloseReason::TakeProfit);
  }

  // 4. Trailing stop
  const domain::TrailingStop& trailing = rules.trailing_stop;
  if (trailing.enabled) {
    const double peak = std::max(position.highest_price, current_price);
    const double peak_profit = position.profitPercentAt(peak);
    if (peak_profit >= trailing.trigger_percent) {
      const double retracement = (peak - current_price) / peak * 100.0;
      if (retracement >= trailing.distance_percent) {
        return ExitAction::fullClose(CloseReason::TrailingStop);
      }
    }
  }

  // 5. Partial profit-taking, lowest threshold first
  if (position.amount_remaining > 0.0) {
    for (const auto& level : rules.partial_profit_levels) {
      if (level.executed) {
        continue;
      }
      if (level.threshold_percent <= profit) {
        return ExitAction::partialClose(level.sell_fraction, level.level_id);
      }
      break;
    }
  }

  return std::nullopt;
}

}  // namespace sentinel
