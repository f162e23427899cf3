#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// TrailingStop
// -----------------------------------------------------------------------------
// Arms once the peak price has shown trigger_percent profit over the cost
// basis, then fires when the price retraces distance_percent off that peak.
// -----------------------------------------------------------------------------
struct TrailingStop {
  bool enabled{false};
  double trigger_percent{0.0};   // Peak profit required to arm the stop
  double distance_percent{0.0};  // Retracement from peak that fires it
};

// -----------------------------------------------------------------------------
// PartialProfitLevel
// -----------------------------------------------------------------------------
// One rung of the partial profit-taking ladder. sell_fraction is a fraction of
// the position's amount_total (not of what remains), so the ladder's total
// exposure is fixed when the rules are captured.
// -----------------------------------------------------------------------------
struct PartialProfitLevel {
  std::uint32_t level_id{0};      // Stable index, assigned at creation
  double threshold_percent{0.0};  // Profit (vs cost basis) that fires it
  double sell_fraction{0.0};      // (0, 1], fraction of amount_total
  bool executed{false};
};

// -----------------------------------------------------------------------------
// ExitRules
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of the exit policy for a single position.
//
// @details
// Captured by value when the position is created (usually copied from the
// owning strategy's template) and never re-read from the strategy again, so
// editing a strategy does not move the goalposts on positions it already
// holds. The only field mutated afterwards is PartialProfitLevel::executed.
//
// Disabled rules are represented by an empty optional rather than a zero,
// since a zero stop-loss would otherwise fire at break-even.
//
// partial_profit_levels is kept sorted ascending by threshold_percent; the
// PositionManager normalizes and assigns level_id on creation.
// -----------------------------------------------------------------------------
struct ExitRules {
  std::optional<double> stop_loss_percent;
  std::optional<double> take_profit_percent;
  TrailingStop trailing_stop;
  std::vector<PartialProfitLevel> partial_profit_levels;
  std::optional<std::int64_t> max_hold_time_seconds;

  // Sum of sell_fraction over levels already executed.
  double executedSellFraction() const {
    double sum = 0.0;
    for (const auto& level : partial_profit_levels) {
      if (level.executed) {
        sum += level.sell_fraction;
      }
    }
    return sum;
  }

  const PartialProfitLevel* findLevel(std::uint32_t level_id) const {
    for (const auto& level : partial_profit_levels) {
      if (level.level_id == level_id) {
        return &level;
      }
    }
    return nullptr;
  }

  PartialProfitLevel* findLevel(std::uint32_t level_id) {
    for (auto& level : partial_profit_levels) {
      if (level.level_id == level_id) {
        return &level;
      }
    }
    return nullptr;
  }
};

}  // namespace domain
}  // namespace sentinel
