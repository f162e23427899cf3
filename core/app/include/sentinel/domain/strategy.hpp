#pragma once

#include "sentinel/domain/exit_rules.hpp"
#include "sentinel/domain/position.hpp"
#include "sentinel/domain/scale_in_plan.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// StrategyLimits — sizing and exposure caps for one strategy
// -----------------------------------------------------------------------------
//
// @brief  Budget rules the EntryExecutor enforces before opening a position.
//
// @details
// All amounts are in the quote currency (the currency positions are bought
// with). available budget = total_budget - sum(quote_budget of the
// strategy's open positions). A new entry is refused when the strategy
// already holds max_concurrent_positions, or when the available budget is
// below half a max_position_size, since a sliver-sized position costs the
// same fees as a full one.
// -----------------------------------------------------------------------------
struct StrategyLimits {
  std::uint32_t max_concurrent_positions{3};
  double max_position_size{0.1};
  double total_budget{1.0};
};

struct StrategyNotifications {
  bool on_entry{true};
  bool on_exit{true};
  bool on_error{true};
};

struct StrategyStats {
  std::uint64_t total_trades{0};
  std::uint64_t successful_trades{0};
  std::uint64_t failed_trades{0};
  double realized_profit{0.0};  // Quote currency, summed over closed sells
};

// -----------------------------------------------------------------------------
// Strategy — named template governing how positions are sized and exited
// -----------------------------------------------------------------------------
// Owned by the StrategyBook. The monitoring path never reads it; only the
// EntryExecutor does, to size new positions and copy the exit/scale-in
// templates into them.
// -----------------------------------------------------------------------------
struct Strategy {
  StrategyId id{0};
  std::string name;
  bool enabled{true};
  StrategyLimits limits;
  ExitRules exit_rules;
  std::optional<ScaleInPlan> scale_in_plan;
  StrategyNotifications notifications;
  StrategyStats stats;
  std::int64_t created_at_ms{0};
  std::optional<std::int64_t> last_run_ms;
};

}  // namespace domain
}  // namespace sentinel
