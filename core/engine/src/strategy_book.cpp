#include "sentinel/engine/strategy_book.hpp"

#include "sentinel/common/errors.hpp"
#include "sentinel/engine/rule_validation.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <type_traits>

namespace sentinel {

StrategyBook::StrategyBook(IPositionStore& store, const ITimeProvider& clock)
    : store_(store), clock_(clock) {}

std::size_t StrategyBook::load() {
  std::vector<domain::Strategy> stored = store_.loadAllStrategies();

  domain::StrategyId max_id = 0;
  {
    std::lock_guard lock(mutex_);
    strategies_.clear();
    for (auto& strategy : stored) {
      max_id = std::max(max_id, strategy.id);
      strategies_[strategy.id] = std::move(strategy);
    }
  }
  ids_.ensure_above(max_id);

  std::cout << "[StrategyBook] Loaded " << stored.size()
            << " strategy(ies)\n";
  return stored.size();
}

void StrategyBook::validate(const domain::Strategy& strategy) {
  if (strategy.name.empty()) {
    throw InvalidInputError("strategy name is empty");
  }
  const domain::StrategyLimits& limits = strategy.limits;
  if (limits.max_concurrent_positions == 0) {
    throw InvalidInputError("max_concurrent_positions must be > 0");
  }
  if (!std::isfinite(limits.max_position_size) ||
      limits.max_position_size <= 0.0) {
    throw InvalidInputError("max_position_size must be > 0");
  }
  if (!std::isfinite(limits.total_budget) || limits.total_budget <= 0.0) {
    throw InvalidInputError("total_budget must be > 0");
  }
  if (limits.max_position_size > limits.total_budget) {
    throw InvalidInputError("max_position_size exceeds total_budget");
  }
  validateExitRules(strategy.exit_rules);
  if (strategy.scale_in_plan) {
    validateScaleInPlan(*strategy.scale_in_plan);
  }
}

void StrategyBook::persist(const domain::Strategy& snapshot) {
  store_.saveStrategy(snapshot);
}

domain::Strategy StrategyBook::createStrategy(domain::Strategy config) {
  validate(config);

  config.id = ids_.next_id();
  config.stats = domain::StrategyStats{};
  config.created_at_ms = clock_.now_ms();
  config.last_run_ms.reset();

  {
    std::lock_guard lock(mutex_);
    strategies_[config.id] = config;
  }
  persist(config);

  std::cout << "[StrategyBook] Created strategy " << config.id << " '"
            << config.name << "'\n";
  return config;
}

domain::Strategy StrategyBook::updateStrategy(domain::StrategyId id,
                                              const StrategyPatch& patch) {
  domain::Strategy updated;
  {
    std::lock_guard lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
      throw InvalidInputError("unknown strategy " + std::to_string(id));
    }
    updated = it->second;
    if (patch.name) updated.name = *patch.name;
    if (patch.enabled) updated.enabled = *patch.enabled;
    if (patch.limits) updated.limits = *patch.limits;
    if (patch.exit_rules) updated.exit_rules = *patch.exit_rules;
    if (patch.scale_in_plan) updated.scale_in_plan = *patch.scale_in_plan;
    if (patch.notifications) updated.notifications = *patch.notifications;

    validate(updated);
    it->second = updated;
  }
  persist(updated);
  std::cout << "[StrategyBook] Updated strategy " << id << "\n";
  return updated;
}

bool StrategyBook::deleteStrategy(domain::StrategyId id) {
  {
    std::lock_guard lock(mutex_);
    if (strategies_.erase(id) == 0) {
      return false;
    }
  }
  store_.removeStrategy(id);
  std::cout << "[StrategyBook] Deleted strategy " << id << "\n";
  return true;
}

std::optional<domain::Strategy> StrategyBook::getStrategy(
    domain::StrategyId id) const {
  std::lock_guard lock(mutex_);
  auto it = strategies_.find(id);
  if (it == strategies_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Strategy> StrategyBook::listStrategies() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Strategy> out;
  out.reserve(strategies_.size());
  for (const auto& [id, strategy] : strategies_) {
    out.push_back(strategy);
  }
  return out;
}

domain::Strategy StrategyBook::setEnabled(domain::StrategyId id,
                                          bool enabled) {
  StrategyPatch patch;
  patch.enabled = enabled;
  return updateStrategy(id, patch);
}

// -----------------------------------------------------------------------------
// checkCapacity
// -----------------------------------------------------------------------------
CapacityCheck StrategyBook::checkCapacity(
    domain::StrategyId id,
    const std::vector<domain::Position>& open_positions) const {
  std::lock_guard lock(mutex_);
  auto it = strategies_.find(id);
  if (it == strategies_.end()) {
    throw InvalidInputError("unknown strategy " + std::to_string(id));
  }
  const domain::Strategy& strategy = it->second;

  CapacityCheck check;
  for (const auto& position : open_positions) {
    if (position.strategy_id == id && position.isActive()) {
      ++check.open_positions;
      check.committed += position.quote_budget;
    }
  }
  check.available = strategy.limits.total_budget - check.committed;

  if (!strategy.enabled) {
    check.reason = "strategy is disabled";
  } else if (check.open_positions >=
             strategy.limits.max_concurrent_positions) {
    check.reason = "max concurrent positions reached (" +
                   std::to_string(check.open_positions) + ")";
  } else if (check.available < strategy.limits.max_position_size / 2.0) {
    check.reason = "insufficient budget (available " +
                   std::to_string(check.available) + ")";
  } else {
    check.allowed = true;
  }
  return check;
}

double StrategyBook::positionSize(domain::StrategyId id,
                                  double available) const {
  std::lock_guard lock(mutex_);
  auto it = strategies_.find(id);
  if (it == strategies_.end()) {
    throw InvalidInputError("unknown strategy " + std::to_string(id));
  }
  return std::max(0.0, std::min(it->second.limits.max_position_size,
                                available));
}

// -----------------------------------------------------------------------------
// Statistics
// -----------------------------------------------------------------------------
void StrategyBook::recordTradeResult(domain::StrategyId id, bool success) {
  domain::Strategy snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
      return;
    }
    domain::StrategyStats& stats = it->second.stats;
    ++stats.total_trades;
    if (success) {
      ++stats.successful_trades;
    } else {
      ++stats.failed_trades;
    }
    it->second.last_run_ms = clock_.now_ms();
    snapshot = it->second;
  }
  persist(snapshot);
}

void StrategyBook::recordRealizedProfit(domain::StrategyId id, double quote) {
  domain::Strategy snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
      return;
    }
    it->second.stats.realized_profit += quote;
    snapshot = it->second;
  }
  persist(snapshot);
}

StrategyPerformance StrategyBook::performance() const {
  std::lock_guard lock(mutex_);
  StrategyPerformance perf;
  perf.strategies = strategies_.size();
  for (const auto& [id, strategy] : strategies_) {
    perf.total_trades += strategy.stats.total_trades;
    perf.successful_trades += strategy.stats.successful_trades;
    perf.failed_trades += strategy.stats.failed_trades;
    perf.realized_profit += strategy.stats.realized_profit;
    if (strategy.enabled) {
      ++perf.active_strategies;
    }
  }
  if (perf.total_trades > 0) {
    perf.win_rate_percent = static_cast<double>(perf.successful_trades) /
                            static_cast<double>(perf.total_trades) * 100.0;
  }
  return perf;
}

bool StrategyBook::wantsAlert(const Event& event) const {
  const domain::StrategyId id = eventStrategy(event);
  if (id == domain::kManualStrategy) {
    return true;
  }

  domain::StrategyNotifications toggles;
  {
    std::lock_guard lock(mutex_);
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
      return true;
    }
    toggles = it->second.notifications;
  }

  return std::visit(
      [&toggles](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PositionOpenedEvent> ||
                      std::is_same_v<T, ScaleInEvent>) {
          return toggles.on_entry;
        } else if constexpr (std::is_same_v<T, PartialCloseEvent> ||
                             std::is_same_v<T, PositionClosedEvent>) {
          return toggles.on_exit;
        } else {
          return toggles.on_error;
        }
      },
      event);
}

std::vector<EventBus::SubscriptionId> StrategyBook::attachTo(EventBus& bus) {
  std::vector<EventBus::SubscriptionId> ids;
  ids.push_back(bus.subscribe<PartialCloseEvent>(
      [this](const PartialCloseEvent& e) {
        recordRealizedProfit(e.position.strategy_id, e.realized_quote);
      }));
  // A close produced by the last partial level carries the same
  // realized_quote as its PartialCloseEvent; count it once.
  ids.push_back(bus.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& e) {
        if (e.reason != domain::CloseReason::PartialTakeProfit) {
          recordRealizedProfit(e.position.strategy_id, e.realized_quote);
        }
      }));
  return ids;
}

}  // namespace sentinel
