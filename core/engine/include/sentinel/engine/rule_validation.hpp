#pragma once

#include "sentinel/domain/exit_rules.hpp"
#include "sentinel/domain/scale_in_plan.hpp"

namespace sentinel {

// -----------------------------------------------------------------------------
// Rule validation shared by position creation and strategy templates
// -----------------------------------------------------------------------------
// Both throw InvalidInputError naming the first offending field.
//
// Exit rules: stop-loss, take-profit and max-hold > 0 when set; trailing
// trigger >= 0 and distance in (0, 100) when enabled; partial thresholds
// >= 0, sell fractions in (0, 1] and summing to <= 1.
//
// Scale-in plan: triggers in (0, 100) and non-decreasing; size fractions in
// (0, 1] and summing to <= 1.
// -----------------------------------------------------------------------------
void validateExitRules(const domain::ExitRules& rules);
void validateScaleInPlan(const domain::ScaleInPlan& plan);

}  // namespace sentinel
