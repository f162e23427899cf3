#include "sentinel/engine/position_manager.hpp"

#include "sentinel/common/errors.hpp"
#include "sentinel/engine/rule_validation.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace sentinel {

namespace {

bool positiveFinite(double value) {
  return std::isfinite(value) && value > 0.0;
}

// Remainders below this share of amount_total are treated as fully sold.
bool isDust(double remaining, double total) {
  return remaining <= total * 1e-9;
}

}  // namespace

const char* toString(ActionOutcome outcome) {
  switch (outcome) {
    case ActionOutcome::Applied:   return "APPLIED";
    case ActionOutcome::NoOp:      return "NOOP";
    case ActionOutcome::Failed:    return "FAILED";
    case ActionOutcome::Escalated: return "ESCALATED";
    case ActionOutcome::Dropped:   return "DROPPED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// PendingActionGuard
// -----------------------------------------------------------------------------
// Releases the pending_action claim on scope exit. The commit step normally
// clears the flag itself (so the persisted snapshot is clean); the guard
// covers failure and exception paths.
// -----------------------------------------------------------------------------
class PositionManager::PendingActionGuard {
 public:
  PendingActionGuard(PositionManager& manager, domain::PositionId id)
      : manager_(manager), id_(id) {}

  ~PendingActionGuard() {
    std::lock_guard lock(manager_.mutex_);
    auto it = manager_.positions_.find(id_);
    if (it != manager_.positions_.end()) {
      it->second.pending_action.reset();
    }
  }

  PendingActionGuard(const PendingActionGuard&) = delete;
  PendingActionGuard& operator=(const PendingActionGuard&) = delete;

 private:
  PositionManager& manager_;
  domain::PositionId id_;
};

PositionManager::PositionManager(ITradeExecutor& executor,
                                 IPositionStore& store, INotifier& notifier,
                                 const ITimeProvider& clock,
                                 ExecutionPolicy policy)
    : executor_(executor),
      store_(store),
      notifier_(notifier),
      clock_(clock),
      policy_(policy) {}

// -----------------------------------------------------------------------------
// createPosition
// -----------------------------------------------------------------------------
domain::Position PositionManager::createPosition(
    const std::string& token_id, double entry_price, double amount,
    domain::ExitRules exit_rules,
    std::optional<domain::ScaleInPlan> scale_in_plan,
    const EntryContext& context) {
  if (token_id.empty()) {
    throw InvalidInputError("createPosition: token_id is empty");
  }
  if (!positiveFinite(entry_price)) {
    throw InvalidInputError("createPosition: entry_price must be > 0");
  }
  if (!positiveFinite(amount)) {
    throw InvalidInputError("createPosition: amount must be > 0");
  }
  if (!std::isfinite(context.quote_budget) || context.quote_budget < 0.0) {
    throw InvalidInputError("createPosition: quote_budget must be >= 0");
  }
  validateExitRules(exit_rules);

  std::stable_sort(exit_rules.partial_profit_levels.begin(),
                   exit_rules.partial_profit_levels.end(),
                   [](const auto& a, const auto& b) {
                     return a.threshold_percent < b.threshold_percent;
                   });
  for (std::size_t i = 0; i < exit_rules.partial_profit_levels.size(); ++i) {
    exit_rules.partial_profit_levels[i].level_id =
        static_cast<std::uint32_t>(i);
    exit_rules.partial_profit_levels[i].executed = false;
  }

  if (scale_in_plan) {
    validateScaleInPlan(*scale_in_plan);
    for (std::size_t i = 0; i < scale_in_plan->phases.size(); ++i) {
      auto& phase = scale_in_plan->phases[i];
      phase.phase_number = static_cast<std::uint32_t>(i + 1);
      phase.executed = false;
      phase.executed_at_ms.reset();
    }
    scale_in_plan->current_phase = 0;
  }

  const std::int64_t now = clock_.now_ms();
  const double spent = context.quote_spent.value_or(entry_price * amount);

  domain::Position position;
  position.id = ids_.next_id();
  position.token_id = token_id;
  position.entry_price = entry_price;
  position.entry_timestamp_ms = now;
  position.strategy_id = context.strategy_id;
  position.quote_budget =
      context.quote_budget > 0.0 ? context.quote_budget : spent;
  position.amount_total = amount;
  position.amount_remaining = amount;
  position.cost_basis = entry_price;
  position.current_price = entry_price;
  position.highest_price = entry_price;
  position.last_checked_ms = now;
  position.exit_rules = std::move(exit_rules);
  position.scale_in_plan = std::move(scale_in_plan);

  domain::Fill entry;
  entry.kind = domain::Fill::Kind::Entry;
  entry.amount_base = amount;
  entry.amount_quote = spent;
  entry.price = entry_price;
  entry.tx_ref = context.tx_ref;
  entry.reason = "ENTRY";
  entry.timestamp_ms = now;
  position.fills.push_back(std::move(entry));

  {
    std::lock_guard lock(mutex_);
    positions_.emplace(position.id, position);
  }
  created_.fetch_add(1);

  persist(position);
  notifier_.emit(PositionOpenedEvent{position, now});

  std::cout << "[PositionManager] Opened #" << position.id << " "
            << position.token_id << " amount=" << amount
            << " @ " << entry_price << "\n";
  return position;
}

// -----------------------------------------------------------------------------
// Shared helpers
// -----------------------------------------------------------------------------
TradeOptions PositionManager::sellOptions(domain::CloseReason reason) const {
  TradeOptions options;
  options.max_retries = policy_.executor_max_retries;
  if (reason == domain::CloseReason::StopLoss) {
    options.slippage_percent = policy_.stop_loss_slippage_percent;
    options.priority = TradePriority::High;
  } else {
    options.slippage_percent = policy_.sell_slippage_percent;
  }
  return options;
}

TradeOptions PositionManager::buyOptions() const {
  TradeOptions options;
  options.max_retries = policy_.executor_max_retries;
  options.slippage_percent = policy_.buy_slippage_percent;
  return options;
}

domain::Position* PositionManager::lookupForActionLocked(
    domain::PositionId id) {
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    if (id == 0 || id >= ids_.peek()) {
      throw InvalidInputError("unknown position " + std::to_string(id));
    }
    return nullptr;
  }
  domain::Position& position = it->second;
  if (position.pending_action) {
    throw ConcurrencyViolation(
        "position " + std::to_string(id) + " already has " +
        domain::toString(*position.pending_action) + " in flight");
  }
  return &position;
}

void PositionManager::persist(const domain::Position& snapshot) {
  try {
    store_.savePosition(snapshot);
  } catch (const StorageWriteError& e) {
    std::cerr << "[PositionManager] Persist #" << snapshot.id
              << " failed: " << e.what() << "\n";
  }
}

void PositionManager::closeRecord(domain::Position& position,
                                  domain::CloseReason reason,
                                  double exit_price, std::int64_t now_ms) {
  position.amount_remaining = 0.0;
  position.status = domain::PositionStatus::Closed;
  position.exit_price = exit_price;
  position.close_reason = reason;
  position.closed_at_ms = now_ms;
  position.realized_profit_percent = position.profitPercentAt(exit_price);
  position.pending_action.reset();
}

ActionOutcome PositionManager::recordFailure(domain::PositionId id,
                                             domain::ActionKind kind,
                                             const std::string& error) {
  failed_.fetch_add(1);

  std::optional<domain::Position> snapshot;
  std::uint32_t attempts = 0;
  bool escalate = false;
  {
    std::lock_guard lock(mutex_);
    attempts = ++retries_[RetryKey{id, kind}];
    auto it = positions_.find(id);
    if (it != positions_.end()) {
      domain::Position& position = it->second;
      position.last_error = error;
      position.pending_action.reset();
      if (attempts >= policy_.max_action_retries &&
          !position.needs_manual_intervention) {
        position.needs_manual_intervention = true;
        escalate = true;
      }
      snapshot = position;
    }
  }

  std::cerr << "[PositionManager] " << domain::toString(kind) << " on #" << id
            << " failed (attempt " << attempts << "/"
            << policy_.max_action_retries << "): " << error << "\n";

  if (!snapshot) {
    return ActionOutcome::Failed;
  }
  persist(*snapshot);

  if (!escalate) {
    return ActionOutcome::Failed;
  }

  escalated_.fetch_add(1);
  ActionFailedEvent event;
  event.position_id = id;
  event.token_id = snapshot->token_id;
  event.strategy_id = snapshot->strategy_id;
  event.action = kind;
  event.attempts = attempts;
  event.error = error;
  event.timestamp_ms = clock_.now_ms();
  notifier_.emit(std::move(event));

  std::cerr << "[PositionManager] #" << id
            << " needs manual intervention after " << attempts
            << " failed attempts\n";
  return ActionOutcome::Escalated;
}

// -----------------------------------------------------------------------------
// applyFullClose
// -----------------------------------------------------------------------------
ActionOutcome PositionManager::applyFullClose(domain::PositionId id,
                                              double exit_price,
                                              domain::CloseReason reason) {
  if (!positiveFinite(exit_price)) {
    throw InvalidInputError("applyFullClose: exit_price must be > 0");
  }

  std::string token_id;
  double amount = 0.0;
  try {
    std::lock_guard lock(mutex_);
    domain::Position* position = lookupForActionLocked(id);
    if (position == nullptr || !position->isActive()) {
      return ActionOutcome::NoOp;
    }
    position->pending_action = domain::ActionKind::FullClose;
    token_id = position->token_id;
    amount = position->amount_remaining;
  } catch (const ConcurrencyViolation& e) {
    dropped_.fetch_add(1);
    std::cerr << "[PositionManager] Dropped FULL_CLOSE: " << e.what() << "\n";
    return ActionOutcome::Dropped;
  }

  PendingActionGuard guard(*this, id);

  TradeResult result;
  try {
    result = executor_.sell(token_id, amount, sellOptions(reason));
  } catch (const TradeExecutionError& e) {
    return recordFailure(id, domain::ActionKind::FullClose, e.what());
  }
  if (!result.success) {
    return recordFailure(id, domain::ActionKind::FullClose,
                         result.error.empty() ? "sell rejected" : result.error);
  }

  const std::int64_t now = clock_.now_ms();
  domain::Position snapshot;
  PositionClosedEvent event;
  {
    std::lock_guard lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !it->second.isActive()) {
      std::cout << "[PositionManager] #" << id
                << " closed while FULL_CLOSE was in flight, sell "
                << result.tx_ref << " not applied\n";
      return ActionOutcome::NoOp;
    }
    domain::Position& position = it->second;

    domain::Fill fill;
    fill.kind = domain::Fill::Kind::ExitSell;
    fill.amount_base = amount;
    fill.amount_quote = result.amount_out;
    fill.price = exit_price;
    fill.tx_ref = result.tx_ref;
    fill.reason = domain::toString(reason);
    fill.timestamp_ms = now;
    position.fills.push_back(std::move(fill));

    event.realized_quote = result.amount_out - amount * position.cost_basis;
    closeRecord(position, reason, exit_price, now);
    position.needs_manual_intervention = false;
    position.last_error.clear();

    snapshot = position;
    positions_.erase(it);
    retries_.erase(RetryKey{id, domain::ActionKind::FullClose});
    retries_.erase(RetryKey{id, domain::ActionKind::PartialClose});
    retries_.erase(RetryKey{id, domain::ActionKind::ScaleIn});
  }
  applied_.fetch_add(1);

  persist(snapshot);

  event.position = snapshot;
  event.reason = reason;
  event.exit_price = exit_price;
  event.profit_percent = snapshot.realized_profit_percent.value_or(0.0);
  event.quote_received = result.amount_out;
  event.timestamp_ms = now;
  notifier_.emit(std::move(event));

  std::cout << "[PositionManager] Closed #" << id << " "
            << domain::toString(reason) << " @ " << exit_price << " ("
            << snapshot.realized_profit_percent.value_or(0.0) << "%)\n";
  return ActionOutcome::Applied;
}

// -----------------------------------------------------------------------------
// applyPartialClose
// -----------------------------------------------------------------------------
ActionOutcome PositionManager::applyPartialClose(domain::PositionId id,
                                                 double fraction,
                                                 std::uint32_t level_id,
                                                 double price) {
  if (!positiveFinite(fraction) || fraction > 1.0) {
    throw InvalidInputError("applyPartialClose: fraction must be in (0, 1]");
  }
  if (!positiveFinite(price)) {
    throw InvalidInputError("applyPartialClose: price must be > 0");
  }

  std::string token_id;
  double amount = 0.0;
  try {
    std::lock_guard lock(mutex_);
    domain::Position* position = lookupForActionLocked(id);
    if (position == nullptr || !position->isActive()) {
      return ActionOutcome::NoOp;
    }
    const domain::PartialProfitLevel* level =
        position->exit_rules.findLevel(level_id);
    if (level == nullptr) {
      throw InvalidInputError("position " + std::to_string(id) +
                              " has no partial level " +
                              std::to_string(level_id));
    }
    if (level->executed) {
      return ActionOutcome::NoOp;
    }
    amount = std::min(fraction * position->amount_total,
                      position->amount_remaining);
    if (amount <= 0.0) {
      return ActionOutcome::NoOp;
    }
    position->pending_action = domain::ActionKind::PartialClose;
    token_id = position->token_id;
  } catch (const ConcurrencyViolation& e) {
    dropped_.fetch_add(1);
    std::cerr << "[PositionManager] Dropped PARTIAL_CLOSE: " << e.what()
              << "\n";
    return ActionOutcome::Dropped;
  }

  PendingActionGuard guard(*this, id);

  TradeResult result;
  try {
    result = executor_.sell(token_id, amount,
                            sellOptions(domain::CloseReason::PartialTakeProfit));
  } catch (const TradeExecutionError& e) {
    return recordFailure(id, domain::ActionKind::PartialClose, e.what());
  }
  if (!result.success) {
    return recordFailure(id, domain::ActionKind::PartialClose,
                         result.error.empty() ? "sell rejected" : result.error);
  }

  const std::int64_t now = clock_.now_ms();
  domain::Position snapshot;
  PartialCloseEvent partial;
  bool fully_sold = false;
  {
    std::lock_guard lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !it->second.isActive()) {
      std::cout << "[PositionManager] #" << id
                << " closed while PARTIAL_CLOSE was in flight, sell "
                << result.tx_ref << " not applied\n";
      return ActionOutcome::NoOp;
    }
    domain::Position& position = it->second;
    domain::PartialProfitLevel* level = position.exit_rules.findLevel(level_id);
    level->executed = true;

    const double sold = std::min(amount, position.amount_remaining);
    position.amount_remaining -= sold;

    domain::Fill fill;
    fill.kind = domain::Fill::Kind::PartialSell;
    fill.amount_base = sold;
    fill.amount_quote = result.amount_out;
    fill.price = price;
    fill.tx_ref = result.tx_ref;
    fill.reason = "LEVEL_" + std::to_string(level_id);
    fill.timestamp_ms = now;
    position.fills.push_back(std::move(fill));

    partial.level_id = level_id;
    partial.fraction = fraction;
    partial.amount_sold = sold;
    partial.quote_received = result.amount_out;
    partial.price = price;
    partial.profit_percent = position.profitPercentAt(price);
    partial.realized_quote = result.amount_out - sold * position.cost_basis;
    partial.timestamp_ms = now;

    position.last_error.clear();
    position.pending_action.reset();
    if (isDust(position.amount_remaining, position.amount_total)) {
      closeRecord(position, domain::CloseReason::PartialTakeProfit, price,
                  now);
      fully_sold = true;
    } else {
      position.status = domain::PositionStatus::PartiallyClosed;
    }

    snapshot = position;
    retries_.erase(RetryKey{id, domain::ActionKind::PartialClose});
    if (fully_sold) {
      positions_.erase(it);
      retries_.erase(RetryKey{id, domain::ActionKind::FullClose});
      retries_.erase(RetryKey{id, domain::ActionKind::ScaleIn});
    }
  }
  applied_.fetch_add(1);

  persist(snapshot);

  partial.position = snapshot;
  notifier_.emit(partial);

  std::cout << "[PositionManager] Partial #" << id << " level " << level_id
            << " sold " << partial.amount_sold << " @ " << price
            << ", remaining " << snapshot.amount_remaining << "\n";

  if (fully_sold) {
    PositionClosedEvent closed;
    closed.position = snapshot;
    closed.reason = domain::CloseReason::PartialTakeProfit;
    closed.exit_price = price;
    closed.profit_percent = snapshot.realized_profit_percent.value_or(0.0);
    closed.quote_received = result.amount_out;
    closed.realized_quote = partial.realized_quote;
    closed.timestamp_ms = now;
    notifier_.emit(std::move(closed));
    std::cout << "[PositionManager] Closed #" << id
              << " PARTIAL_TAKE_PROFIT, ladder consumed the position\n";
  }
  return ActionOutcome::Applied;
}

// -----------------------------------------------------------------------------
// applyScaleIn
// -----------------------------------------------------------------------------
ActionOutcome PositionManager::applyScaleIn(domain::PositionId id,
                                            const domain::ScaleInPhase& phase,
                                            double price) {
  if (!positiveFinite(price)) {
    throw InvalidInputError("applyScaleIn: price must be > 0");
  }

  std::string token_id;
  double quote = 0.0;
  try {
    std::lock_guard lock(mutex_);
    domain::Position* position = lookupForActionLocked(id);
    if (position == nullptr || !position->isActive()) {
      return ActionOutcome::NoOp;
    }
    if (!position->scale_in_plan || !position->scale_in_plan->enabled) {
      throw InvalidInputError("position " + std::to_string(id) +
                              " has no enabled scale-in plan");
    }
    domain::ScaleInPlan& plan = *position->scale_in_plan;
    if (phase.phase_number == 0 || phase.phase_number > plan.phases.size()) {
      throw InvalidInputError("position " + std::to_string(id) +
                              " has no scale-in phase " +
                              std::to_string(phase.phase_number));
    }
    const domain::ScaleInPhase& stored = plan.phases[phase.phase_number - 1];
    if (stored.executed) {
      return ActionOutcome::NoOp;
    }
    if (phase.phase_number != plan.current_phase + 1) {
      throw InvalidInputError(
          "scale-in phase " + std::to_string(phase.phase_number) +
          " requested before phase " + std::to_string(plan.current_phase + 1));
    }
    quote = stored.size_fraction * position->quote_budget;
    if (quote <= 0.0) {
      throw InvalidInputError("position " + std::to_string(id) +
                              " has no quote budget for scale-in");
    }
    position->pending_action = domain::ActionKind::ScaleIn;
    token_id = position->token_id;
  } catch (const ConcurrencyViolation& e) {
    dropped_.fetch_add(1);
    std::cerr << "[PositionManager] Dropped SCALE_IN: " << e.what() << "\n";
    return ActionOutcome::Dropped;
  }

  PendingActionGuard guard(*this, id);

  TradeResult result;
  try {
    result = executor_.buy(token_id, quote, buyOptions());
  } catch (const TradeExecutionError& e) {
    return recordFailure(id, domain::ActionKind::ScaleIn, e.what());
  }
  if (!result.success || result.amount_out <= 0.0) {
    return recordFailure(id, domain::ActionKind::ScaleIn,
                         result.error.empty() ? "buy rejected" : result.error);
  }

  const std::int64_t now = clock_.now_ms();
  const double spent = result.amount_in > 0.0 ? result.amount_in : quote;
  const double bought = result.amount_out;

  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !it->second.isActive()) {
      std::cerr << "[PositionManager] #" << id
                << " closed while SCALE_IN was in flight, buy "
                << result.tx_ref << " left unattributed\n";
      return ActionOutcome::NoOp;
    }
    domain::Position& position = it->second;
    domain::ScaleInPlan& plan = *position.scale_in_plan;

    const double bought_before = position.amount_total;
    position.cost_basis =
        (bought_before * position.cost_basis + spent) / (bought_before + bought);
    position.amount_total += bought;
    position.amount_remaining += bought;

    domain::ScaleInPhase& stored = plan.phases[phase.phase_number - 1];
    stored.executed = true;
    stored.executed_at_ms = now;
    plan.current_phase = phase.phase_number;

    domain::Fill fill;
    fill.kind = domain::Fill::Kind::ScaleInBuy;
    fill.amount_base = bought;
    fill.amount_quote = spent;
    fill.price = price;
    fill.tx_ref = result.tx_ref;
    fill.reason = "PHASE_" + std::to_string(phase.phase_number);
    fill.timestamp_ms = now;
    position.fills.push_back(std::move(fill));

    position.last_error.clear();
    position.pending_action.reset();
    snapshot = position;
    retries_.erase(RetryKey{id, domain::ActionKind::ScaleIn});
  }
  applied_.fetch_add(1);

  persist(snapshot);

  ScaleInEvent event;
  event.position = snapshot;
  event.phase_number = phase.phase_number;
  event.quote_spent = spent;
  event.amount_bought = bought;
  event.price = price;
  event.new_cost_basis = snapshot.cost_basis;
  event.timestamp_ms = now;
  notifier_.emit(std::move(event));

  std::cout << "[PositionManager] Scale-in #" << id << " phase "
            << phase.phase_number << " bought " << bought << " for " << spent
            << ", cost basis " << snapshot.cost_basis << "\n";
  return ActionOutcome::Applied;
}

// -----------------------------------------------------------------------------
// recordPrice
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionManager::recordPrice(
    domain::PositionId id, double price) {
  if (!positiveFinite(price)) {
    throw InvalidInputError("recordPrice: price must be > 0");
  }
  const std::int64_t now = clock_.now_ms();

  std::lock_guard lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end() || !it->second.isActive()) {
    return std::nullopt;
  }
  domain::Position& position = it->second;
  position.current_price = price;
  position.highest_price = std::max(position.highest_price, price);
  position.last_checked_ms = now;
  return position;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionManager::getOpenPositions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [id, position] : positions_) {
    out.push_back(position);
  }
  return out;
}

std::optional<domain::Position> PositionManager::getPosition(
    domain::PositionId id) const {
  {
    std::lock_guard lock(mutex_);
    auto it = positions_.find(id);
    if (it != positions_.end()) {
      return it->second;
    }
  }
  return store_.loadPosition(id);
}

std::vector<domain::Position> PositionManager::getAllPositions() const {
  std::map<domain::PositionId, domain::Position> merged;
  for (auto& position : store_.loadAllPositions()) {
    const domain::PositionId id = position.id;
    merged.emplace(id, std::move(position));
  }
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, position] : positions_) {
      merged[id] = position;
    }
  }
  std::vector<domain::Position> out;
  out.reserve(merged.size());
  for (auto& [id, position] : merged) {
    out.push_back(std::move(position));
  }
  return out;
}

std::vector<domain::Position> PositionManager::getPositionsByToken(
    const std::string& token_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  for (const auto& [id, position] : positions_) {
    if (position.token_id == token_id) {
      out.push_back(position);
    }
  }
  return out;
}

std::size_t PositionManager::openCount() const {
  std::lock_guard lock(mutex_);
  return positions_.size();
}

PositionManagerStats PositionManager::stats() const {
  PositionManagerStats s;
  s.created = created_.load();
  s.applied = applied_.load();
  s.failed = failed_.load();
  s.escalated = escalated_.load();
  s.dropped = dropped_.load();
  return s;
}

// -----------------------------------------------------------------------------
// resumePosition
// -----------------------------------------------------------------------------
bool PositionManager::resumePosition(domain::PositionId id) {
  domain::Position snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
      throw InvalidInputError("resumePosition: position " +
                              std::to_string(id) + " is not active");
    }
    domain::Position& position = it->second;
    if (!position.needs_manual_intervention) {
      return false;
    }
    position.needs_manual_intervention = false;
    position.last_error.clear();
    retries_.erase(RetryKey{id, domain::ActionKind::FullClose});
    retries_.erase(RetryKey{id, domain::ActionKind::PartialClose});
    retries_.erase(RetryKey{id, domain::ActionKind::ScaleIn});
    snapshot = position;
  }
  persist(snapshot);
  std::cout << "[PositionManager] #" << id << " resumed by operator\n";
  return true;
}

// -----------------------------------------------------------------------------
// hydrate
// -----------------------------------------------------------------------------
std::size_t PositionManager::hydrate() {
  std::vector<domain::Position> stored = store_.loadAllPositions();

  domain::PositionId max_id = 0;
  std::size_t active = 0;
  {
    std::lock_guard lock(mutex_);
    for (auto& position : stored) {
      max_id = std::max(max_id, position.id);
      if (!position.isActive()) {
        continue;
      }
      position.pending_action.reset();
      positions_[position.id] = std::move(position);
      ++active;
    }
  }
  ids_.ensure_above(max_id);

  std::cout << "[PositionManager] Hydrated " << active
            << " active position(s) of " << stored.size() << " stored\n";
  return active;
}

}  // namespace sentinel
