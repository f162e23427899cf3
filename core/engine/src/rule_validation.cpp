#include "sentinel/engine/rule_validation.hpp"

#include "sentinel/common/errors.hpp"

#include <cmath>
#include <string>

namespace sentinel {

namespace {

constexpr double kFractionTolerance = 1e-9;

bool positiveFinite(double value) {
  return std::isfinite(value) && value > 0.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// validateExitRules / validateScaleInPlan
// -----------------------------------------------------------------------------
void validateExitRules(const domain::ExitRules& rules) {
  if (rules.stop_loss_percent && !positiveFinite(*rules.stop_loss_percent)) {
    throw InvalidInputError("stop_loss_percent must be > 0");
  }
  if (rules.take_profit_percent &&
      !positiveFinite(*rules.take_profit_percent)) {
    throw InvalidInputError("take_profit_percent must be > 0");
  }
  if (rules.max_hold_time_seconds && *rules.max_hold_time_seconds <= 0) {
    throw InvalidInputError("max_hold_time_seconds must be > 0");
  }
  const domain::TrailingStop& trailing = rules.trailing_stop;
  if (trailing.enabled) {
    if (!std::isfinite(trailing.trigger_percent) ||
        trailing.trigger_percent < 0.0) {
      throw InvalidInputError("trailing trigger_percent must be >= 0");
    }
    if (!positiveFinite(trailing.distance_percent) ||
        trailing.distance_percent >= 100.0) {
      throw InvalidInputError("trailing distance_percent must be in (0, 100)");
    }
  }

  double total = 0.0;
  for (const auto& level : rules.partial_profit_levels) {
    if (!std::isfinite(level.threshold_percent) ||
        level.threshold_percent < 0.0) {
      throw InvalidInputError("partial level threshold must be >= 0");
    }
    if (!positiveFinite(level.sell_fraction) || level.sell_fraction > 1.0) {
      throw InvalidInputError("partial level sell_fraction must be in (0, 1]");
    }
    total += level.sell_fraction;
  }
  if (total > 1.0 + kFractionTolerance) {
    throw InvalidInputError("partial level sell fractions sum to " +
                            std::to_string(total) + ", above 1.0");
  }
}

void validateScaleInPlan(const domain::ScaleInPlan& plan) {
  double total = 0.0;
  double previous_trigger = 0.0;
  for (const auto& phase : plan.phases) {
    if (!positiveFinite(phase.trigger_drop_percent) ||
        phase.trigger_drop_percent >= 100.0) {
      throw InvalidInputError("scale-in trigger_drop_percent must be in (0, 100)");
    }
    if (phase.trigger_drop_percent < previous_trigger) {
      throw InvalidInputError("scale-in triggers must be non-decreasing");
    }
    if (!positiveFinite(phase.size_fraction) || phase.size_fraction > 1.0) {
      throw InvalidInputError("scale-in size_fraction must be in (0, 1]");
    }
    previous_trigger = phase.trigger_drop_percent;
    total += phase.size_fraction;
  }
  if (total > 1.0 + kFractionTolerance) {
    throw InvalidInputError("scale-in size fractions sum to " +
                            std::to_string(total) + ", above 1.0");
  }
}

}  // namespace sentinel
