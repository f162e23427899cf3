#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// ScaleInPhase
// -----------------------------------------------------------------------------
// An additional buy triggered when the price has dropped trigger_drop_percent
// below the ORIGINAL entry price. size_fraction is a fraction of the quote
// budget the strategy assigned to the position.
// -----------------------------------------------------------------------------
struct ScaleInPhase {
  std::uint32_t phase_number{0};     // 1-based, equals index + 1
  double trigger_drop_percent{0.0};  // Drop from entry price, in percent
  double size_fraction{0.0};         // (0, 1], fraction of quote budget
  bool executed{false};
  std::optional<std::int64_t> executed_at_ms;
};

// -----------------------------------------------------------------------------
// ScaleInPlan
// -----------------------------------------------------------------------------
//
// @brief  Ordered list of averaging-down buys for one position.
//
// @details
// current_phase indexes the next phase eligible to fire. Phases run strictly
// in order: the planner only ever looks at phases[current_phase], so a price
// gap through several thresholds in one tick still fires one phase per tick.
// current_phase == phases.size() means the plan is exhausted.
// -----------------------------------------------------------------------------
struct ScaleInPlan {
  bool enabled{false};
  std::vector<ScaleInPhase> phases;
  std::size_t current_phase{0};

  bool exhausted() const { return current_phase >= phases.size(); }

  double executedSizeFraction() const {
    double sum = 0.0;
    for (const auto& phase : phases) {
      if (phase.executed) {
        sum += phase.size_fraction;
      }
    }
    return sum;
  }
};

}  // namespace domain
}  // namespace sentinel
