#include "sentinel/engine/scale_in_planner.hpp"

#include "sentinel/common/errors.hpp"

#include <cmath>
#include <string>

namespace sentinel {

std::optional<domain::ScaleInPhase> ScaleInPlanner::nextPhase(
    const domain::Position& position, double current_price) const {
  if (!std::isfinite(current_price) || current_price <= 0.0) {
    throw InvalidInputError("nextPhase: price must be > 0, got " +
                            std::to_string(current_price));
  }
  if (!position.isActive() || !position.scale_in_plan) {
    return std::nullopt;
  }

  const domain::ScaleInPlan& plan = *position.scale_in_plan;
  if (!plan.enabled || plan.exhausted()) {
    return std::nullopt;
  }

  const domain::ScaleInPhase& phase = plan.phases[plan.current_phase];
  if (phase.executed) {
    return std::nullopt;
  }

  const double drop =
      (position.entry_price - current_price) / position.entry_price * 100.0;
  if (drop >= phase.trigger_drop_percent) {
    return phase;
  }
  return std::nullopt;
}

}  // namespace sentinel
