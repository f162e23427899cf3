#pragma once

#include "sentinel/concurrent/id_generator.hpp"
#include "sentinel/domain/exit_rules.hpp"
#include "sentinel/domain/position.hpp"
#include "sentinel/domain/scale_in_plan.hpp"
#include "sentinel/execution/i_trade_executor.hpp"
#include "sentinel/notify/i_notifier.hpp"
#include "sentinel/persistence/i_position_store.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// ActionOutcome — result of one apply* call
// -----------------------------------------------------------------------------
//   Applied    trade succeeded and the record was updated
//   NoOp       nothing to do: level already executed, position already
//              closed, or closed while the trade was in flight
//   Failed     trade failed; condition left unexecuted for the next tick
//   Escalated  trade failed and the retry budget is spent; the position is
//              flagged for manual intervention
//   Dropped    another action was already pending on the position
// -----------------------------------------------------------------------------
enum class ActionOutcome { Applied, NoOp, Failed, Escalated, Dropped };

const char* toString(ActionOutcome outcome);

// -----------------------------------------------------------------------------
// ExecutionPolicy — how the manager parameterizes executor calls
// -----------------------------------------------------------------------------
struct ExecutionPolicy {
  double buy_slippage_percent{1.0};
  double sell_slippage_percent{2.0};
  double stop_loss_slippage_percent{5.0};
  std::uint32_t executor_max_retries{3};
  std::uint32_t max_action_retries{3};
};

// -----------------------------------------------------------------------------
// EntryContext — who opened a position and with what budget
// -----------------------------------------------------------------------------
// quote_budget is the base for scale-in sizing. Zero means "use
// entry_price * amount", which is what a manually opened position gets.
// quote_spent / tx_ref describe the entry buy for the audit trail when the
// caller executed it.
// -----------------------------------------------------------------------------
struct EntryContext {
  domain::StrategyId strategy_id{domain::kManualStrategy};
  double quote_budget{0.0};
  std::optional<double> quote_spent;
  std::string tx_ref;
};

struct PositionManagerStats {
  std::uint64_t created{0};
  std::uint64_t applied{0};
  std::uint64_t failed{0};
  std::uint64_t escalated{0};
  std::uint64_t dropped{0};
};

// -----------------------------------------------------------------------------
// PositionManager — owner of the active position set
// -----------------------------------------------------------------------------
//
// @brief  Creates positions and applies full closes, partial closes and
//         scale-in buys to them through the ITradeExecutor.
//
// @details
// The manager is the only writer of position records. Every mutation
// follows the same shape:
//
//   1. Under mutex_: validate, then claim the position by setting
//      pending_action. A position that already has one is refused
//      (ConcurrencyViolation, logged, ActionOutcome::Dropped).
//   2. Without the lock: call the executor.
//   3. Under mutex_: re-check the position is still active, then commit.
//      A position that was closed in the meantime is left untouched
//      (ActionOutcome::NoOp).
//   4. Without the lock: persist the snapshot and emit the event.
//
// The pending_action claim is released by an RAII guard on every exit path,
// including exceptions thrown by the executor.
//
// Failure policy:
//   A failed trade never changes amounts, status or executed flags. A
//   per-position, per-action-kind counter is incremented. When it reaches
//   ExecutionPolicy::max_action_retries the position is flagged
//   needs_manual_intervention and an ActionFailedEvent is emitted; the
//   monitor then leaves it alone until resumePosition() or a manual close.
//   A successful action resets the counter for its kind.
//
// Cost basis:
//   cost_basis is the volume-weighted average price over every buy (entry
//   and scale-ins): total quote spent / total tokens bought. amount_total
//   only grows on buys, so a scale-in folds in as
//     new = (amount_total * cost + quote_spent) / (amount_total + bought)
//   Partial sells in between do not change the weighting. Sells never change
//   cost_basis.
//
// Closed positions are persisted and removed from the active set.
// getPosition() falls back to the store for them.
//
// Thread model:
//   All public methods are safe from any thread. mutex_ is never held
//   across an executor, store or notifier call.
//
// Ownership:
//   Holds references to the executor, store, notifier and clock; all must
//   outlive the manager.
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  PositionManager(ITradeExecutor& executor, IPositionStore& store,
                  INotifier& notifier, const ITimeProvider& clock,
                  ExecutionPolicy policy = {});

  PositionManager(const PositionManager&) = delete;
  PositionManager& operator=(const PositionManager&) = delete;
  PositionManager(PositionManager&&) = delete;
  PositionManager& operator=(PositionManager&&) = delete;

  // -------------------------------------------------------------------------
  // createPosition(...)
  // -------------------------------------------------------------------------
  // Registers a position whose entry buy has already completed.
  //
  // Validation (InvalidInputError, nothing stored):
  //   token_id non-empty; entry_price and amount finite and > 0;
  //   stop-loss / take-profit / max-hold > 0 when set; trailing distance in
  //   (0, 100) when enabled; level thresholds >= 0 and fractions in (0, 1]
  //   summing to <= 1; scale-in triggers in (0, 100), non-decreasing, size
  //   fractions in (0, 1] summing to <= 1.
  //
  // Normalization: partial levels are sorted by threshold and numbered
  // 0..n-1, scale-in phases are numbered 1..n, all executed flags cleared.
  // -------------------------------------------------------------------------
  domain::Position createPosition(
      const std::string& token_id, double entry_price, double amount,
      domain::ExitRules exit_rules,
      std::optional<domain::ScaleInPlan> scale_in_plan = std::nullopt,
      const EntryContext& context = {});

  // Sells amount_remaining. Closing an already closed position is a NoOp.
  ActionOutcome applyFullClose(domain::PositionId id, double exit_price,
                               domain::CloseReason reason);

  // Sells min(fraction * amount_total, amount_remaining) for `level_id`.
  // A level that is already executed yields NoOp.
  ActionOutcome applyPartialClose(domain::PositionId id, double fraction,
                                  std::uint32_t level_id, double price);

  // Buys phase.size_fraction * quote_budget. `phase` must be the plan's
  // current phase (InvalidInputError otherwise); an already executed phase
  // yields NoOp.
  ActionOutcome applyScaleIn(domain::PositionId id,
                             const domain::ScaleInPhase& phase, double price);

  // Monitor hook: stores the latest price and raises highest_price.
  // Returns the updated snapshot, or nullopt if the position is no longer
  // active.
  std::optional<domain::Position> recordPrice(domain::PositionId id,
                                              double price);

  std::vector<domain::Position> getOpenPositions() const;
  std::optional<domain::Position> getPosition(domain::PositionId id) const;
  std::vector<domain::Position> getAllPositions() const;
  std::vector<domain::Position> getPositionsByToken(
      const std::string& token_id) const;

  // Clears needs_manual_intervention and the retry counters. Returns false
  // if the position was not flagged. InvalidInputError if not active.
  bool resumePosition(domain::PositionId id);

  // Loads active positions from the store. Call once before monitoring
  // starts. StorageCorruptionError propagates.
  std::size_t hydrate();

  std::size_t openCount() const;
  PositionManagerStats stats() const;
  const ExecutionPolicy& policy() const { return policy_; }

 private:
  class PendingActionGuard;

  using RetryKey = std::tuple<domain::PositionId, domain::ActionKind>;

  TradeOptions sellOptions(domain::CloseReason reason) const;
  TradeOptions buyOptions() const;

  // Caller holds mutex_. Returns the active record for `id`, or nullptr if
  // the id was issued but the position is already closed. Throws
  // InvalidInputError for ids never issued and ConcurrencyViolation when an
  // action is already pending.
  domain::Position* lookupForActionLocked(domain::PositionId id);

  // Bookkeeping for a failed trade. Returns Failed or Escalated.
  ActionOutcome recordFailure(domain::PositionId id, domain::ActionKind kind,
                              const std::string& error);

  // Store write; StorageWriteError is logged, never propagated.
  void persist(const domain::Position& snapshot);

  static void closeRecord(domain::Position& position,
                          domain::CloseReason reason, double exit_price,
                          std::int64_t now_ms);

  ITradeExecutor& executor_;
  IPositionStore& store_;
  INotifier& notifier_;
  const ITimeProvider& clock_;
  const ExecutionPolicy policy_;

  IdGenerator ids_;

  mutable std::mutex mutex_;
  std::map<domain::PositionId, domain::Position> positions_;
  std::map<RetryKey, std::uint32_t> retries_;

  std::atomic<std::uint64_t> created_{0};
  std::atomic<std::uint64_t> applied_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> escalated_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace sentinel
