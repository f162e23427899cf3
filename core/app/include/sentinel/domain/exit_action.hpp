#pragma once

#include "sentinel/domain/position.hpp"

#include <cstdint>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// ExitAction
// -----------------------------------------------------------------------------
// Output of the ExitRuleEvaluator. For FullClose only `reason` is meaningful;
// for PartialClose `fraction` and `level_id` identify the ladder rung.
// -----------------------------------------------------------------------------
struct ExitAction {
  ActionKind kind{ActionKind::FullClose};
  CloseReason reason{CloseReason::StopLoss};
  double fraction{0.0};
  std::uint32_t level_id{0};

  static ExitAction fullClose(CloseReason why) {
    ExitAction a;
    a.kind = ActionKind::FullClose;
    a.reason = why;
    return a;
  }

  static ExitAction partialClose(double sell_fraction, std::uint32_t level) {
    ExitAction a;
    a.kind = ActionKind::PartialClose;
    a.reason = CloseReason::PartialTakeProfit;
    a.fraction = sell_fraction;
    a.level_id = level;
    return a;
  }
};

inline bool operator==(const ExitAction& a, const ExitAction& b) {
  return a.kind == b.kind && a.reason == b.reason &&
         a.fraction == b.fraction && a.level_id == b.level_id;
}

}  // namespace domain
}  // namespace sentinel
