#pragma once

#include "sentinel/concurrent/id_generator.hpp"
#include "sentinel/domain/position.hpp"
#include "sentinel/domain/strategy.hpp"
#include "sentinel/eventbus/event_bus.hpp"
#include "sentinel/persistence/i_position_store.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {

// Fields left empty are not changed by updateStrategy().
struct StrategyPatch {
  std::optional<std::string> name;
  std::optional<bool> enabled;
  std::optional<domain::StrategyLimits> limits;
  std::optional<domain::ExitRules> exit_rules;
  std::optional<std::optional<domain::ScaleInPlan>> scale_in_plan;
  std::optional<domain::StrategyNotifications> notifications;
};

struct CapacityCheck {
  bool allowed{false};
  std::string reason;            // Empty when allowed
  std::size_t open_positions{0};
  double committed{0.0};         // Sum of quote_budget over open positions
  double available{0.0};         // total_budget - committed
};

struct StrategyPerformance {
  std::uint64_t total_trades{0};
  std::uint64_t successful_trades{0};
  std::uint64_t failed_trades{0};
  double win_rate_percent{0.0};
  double realized_profit{0.0};
  std::size_t strategies{0};
  std::size_t active_strategies{0};
};

// -----------------------------------------------------------------------------
// StrategyBook — owned collection of trading strategies
// -----------------------------------------------------------------------------
//
// @brief  CRUD over strategies plus the sizing and exposure rules the
//         EntryExecutor applies before opening a position.
//
// @details
// A strategy is a named template: budget limits, the exit rules and scale-in
// plan copied into each position it opens, alert toggles, and running trade
// statistics. Positions keep their own copy of the rules, so editing or
// deleting a strategy never changes positions it already holds.
//
// Capacity:
//   committed = sum(quote_budget) over the strategy's open positions
//   available = total_budget - committed
//   An entry is refused when the strategy is disabled, already holds
//   max_concurrent_positions, or available < max_position_size / 2.
//   The size of an allowed entry is min(max_position_size, available).
//
// Statistics:
//   recordTradeResult() counts entry attempts. attachTo(bus) subscribes to
//   PartialCloseEvent / PositionClosedEvent and accumulates realized_quote
//   into realized_profit.
//
// Every mutation is written through to the IPositionStore. Write failures
// propagate as StorageWriteError after the in-memory change is applied.
//
// Thread model:
//   All methods lock an internal mutex; store calls are made outside it.
// -----------------------------------------------------------------------------
class StrategyBook {
 public:
  StrategyBook(IPositionStore& store, const ITimeProvider& clock);

  StrategyBook(const StrategyBook&) = delete;
  StrategyBook& operator=(const StrategyBook&) = delete;

  // Loads strategies from the store. StorageCorruptionError propagates.
  std::size_t load();

  // Validates and stores a new strategy. `config.id`, stats and timestamps
  // are ignored. InvalidInputError on an empty name, non-positive limits,
  // max_position_size above total_budget or invalid rules.
  domain::Strategy createStrategy(domain::Strategy config);

  // InvalidInputError for unknown ids or an invalid result.
  domain::Strategy updateStrategy(domain::StrategyId id,
                                  const StrategyPatch& patch);

  // Returns false if no such strategy existed.
  bool deleteStrategy(domain::StrategyId id);

  std::optional<domain::Strategy> getStrategy(domain::StrategyId id) const;
  std::vector<domain::Strategy> listStrategies() const;
  domain::Strategy setEnabled(domain::StrategyId id, bool enabled);

  CapacityCheck checkCapacity(
      domain::StrategyId id,
      const std::vector<domain::Position>& open_positions) const;
  double positionSize(domain::StrategyId id, double available) const;

  void recordTradeResult(domain::StrategyId id, bool success);
  void recordRealizedProfit(domain::StrategyId id, double quote);

  StrategyPerformance performance() const;

  // Whether `event` should raise a human-facing alert under its strategy's
  // notification toggles. Manual positions always alert.
  bool wantsAlert(const Event& event) const;

  // Subscribes the realized-profit accounting. Returns the subscription ids.
  std::vector<EventBus::SubscriptionId> attachTo(EventBus& bus);

 private:
  static void validate(const domain::Strategy& strategy);
  void persist(const domain::Strategy& snapshot);

  IPositionStore& store_;
  const ITimeProvider& clock_;
  IdGenerator ids_;

  mutable std::mutex mutex_;
  std::map<domain::StrategyId, domain::Strategy> strategies_;
};

}  // namespace sentinel
