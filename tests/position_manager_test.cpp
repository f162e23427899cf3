// =============================================================================
// position_manager_test.cpp
// =============================================================================
// Unit tests for sentinel::PositionManager.
//
// Validates:
//   - createPosition validation and normalization
//   - Full close, partial close and scale-in bookkeeping (amounts, VWAP,
//     executed flags, events, fills)
//   - Failure policy: failed trades leave the record untouched, the retry
//     budget escalates once, resumePosition() re-arms the position
//   - Pending-action guard: a second action while one is in flight is dropped
//   - Hydration from the store and id continuity
//   - Store write failures never block a state transition
//
// Collaborators: FakeTradeExecutor, RecordingNotifier, MemoryPositionStore
// and a SimulationTimeProvider, all owned by the fixture.
// =============================================================================

#include "sentinel/engine/exit_rule_evaluator.hpp"
#include "sentinel/engine/position_manager.hpp"
#include "sentinel/persistence/memory_position_store.hpp"
#include "sentinel/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using sentinel::ActionOutcome;
using sentinel::domain::CloseReason;
using sentinel::domain::ExitRules;
using sentinel::domain::PositionStatus;
using sentinel::domain::ScaleInPlan;
using sentinel_test::level;
using sentinel_test::phase;
using sentinel_test::stopLossOnly;

namespace {

sentinel::ExecutionPolicy testPolicy() {
  sentinel::ExecutionPolicy policy;
  policy.max_action_retries = 3;
  return policy;
}

ScaleInPlan twoPhasePlan() {
  ScaleInPlan plan;
  plan.enabled = true;
  plan.phases = {phase(1, 5.0, 0.3), phase(2, 15.0, 0.3)};
  return plan;
}

void expectAmountInvariant(const sentinel::domain::Position& p) {
  EXPECT_GE(p.amount_remaining, 0.0);
  EXPECT_LE(p.amount_remaining, p.amount_total + 1e-12);
}

}  // namespace

class PositionManagerTest : public ::testing::Test {
 protected:
  PositionManagerTest()
      : clock(1'000'000),
        manager(executor, store, notifier, clock, testPolicy()) {}

  sentinel::domain::Position open(ExitRules rules,
                                  std::optional<ScaleInPlan> plan = {}) {
    return manager.createPosition("TKN", 100.0, 10.0, std::move(rules),
                                  std::move(plan));
  }

  sentinel::domain::Position get(sentinel::domain::PositionId id) {
    auto p = manager.getPosition(id);
    EXPECT_TRUE(p.has_value());
    return p.value_or(sentinel::domain::Position{});
  }

  sentinel::SimulationTimeProvider clock;
  sentinel_test::FakeTradeExecutor executor;
  sentinel::MemoryPositionStore store;
  sentinel_test::RecordingNotifier notifier;
  sentinel::PositionManager manager;
};

// -----------------------------------------------------------------------------
// 1. Malformed requests are rejected before anything is stored.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, CreateRejectsInvalidInput) {
  EXPECT_THROW(manager.createPosition("", 100.0, 1.0, ExitRules{}),
               sentinel::InvalidInputError);
  EXPECT_THROW(manager.createPosition("TKN", 0.0, 1.0, ExitRules{}),
               sentinel::InvalidInputError);
  EXPECT_THROW(manager.createPosition("TKN", 100.0, -1.0, ExitRules{}),
               sentinel::InvalidInputError);

  ExitRules oversold;
  oversold.partial_profit_levels = {level(0, 10.0, 0.6), level(1, 20.0, 0.6)};
  EXPECT_THROW(manager.createPosition("TKN", 100.0, 1.0, oversold),
               sentinel::InvalidInputError);

  ScaleInPlan descending;
  descending.enabled = true;
  descending.phases = {phase(1, 15.0, 0.3), phase(2, 5.0, 0.3)};
  EXPECT_THROW(
      manager.createPosition("TKN", 100.0, 1.0, ExitRules{}, descending),
      sentinel::InvalidInputError);

  EXPECT_EQ(manager.openCount(), 0u);
  EXPECT_EQ(store.positionWrites(), 0u);
  EXPECT_TRUE(notifier.events().empty());
}

// -----------------------------------------------------------------------------
// 2. Levels are sorted and renumbered; the record is persisted and announced.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, CreateNormalizesAndAnnounces) {
  ExitRules rules;
  rules.partial_profit_levels = {level(7, 15.0, 0.25), level(3, 8.0, 0.25)};

  auto p = open(rules, twoPhasePlan());

  EXPECT_EQ(p.id, 1u);
  EXPECT_EQ(p.status, PositionStatus::Open);
  EXPECT_DOUBLE_EQ(p.cost_basis, 100.0);
  EXPECT_DOUBLE_EQ(p.quote_budget, 1000.0);
  EXPECT_EQ(p.entry_timestamp_ms, 1'000'000);
  ASSERT_EQ(p.exit_rules.partial_profit_levels.size(), 2u);
  EXPECT_EQ(p.exit_rules.partial_profit_levels[0].level_id, 0u);
  EXPECT_DOUBLE_EQ(p.exit_rules.partial_profit_levels[0].threshold_percent,
                   8.0);
  EXPECT_EQ(p.exit_rules.partial_profit_levels[1].level_id, 1u);
  ASSERT_EQ(p.fills.size(), 1u);
  EXPECT_EQ(p.fills[0].kind, sentinel::domain::Fill::Kind::Entry);

  EXPECT_TRUE(store.loadPosition(p.id).has_value());
  EXPECT_EQ(notifier.count<sentinel::PositionOpenedEvent>(), 1u);
}

// -----------------------------------------------------------------------------
// 3. A stop-loss close sells everything with stop-loss slippage and high
//    priority, closes the record and reports realized profit.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, FullCloseAppliesStopLoss) {
  executor.setPrice("TKN", 94.0);
  auto p = open(stopLossOnly(5.0));

  EXPECT_EQ(manager.applyFullClose(p.id, 94.0, CloseReason::StopLoss),
            ActionOutcome::Applied);

  auto closed = get(p.id);
  EXPECT_EQ(closed.status, PositionStatus::Closed);
  EXPECT_DOUBLE_EQ(closed.amount_remaining, 0.0);
  EXPECT_EQ(closed.close_reason, CloseReason::StopLoss);
  EXPECT_DOUBLE_EQ(closed.exit_price.value_or(0.0), 94.0);
  EXPECT_NEAR(closed.realized_profit_percent.value_or(0.0), -6.0, 1e-9);
  EXPECT_EQ(manager.openCount(), 0u);

  auto calls = executor.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_FALSE(calls[0].is_buy);
  EXPECT_DOUBLE_EQ(calls[0].amount, 10.0);
  EXPECT_DOUBLE_EQ(calls[0].options.slippage_percent, 5.0);
  EXPECT_EQ(calls[0].options.priority, sentinel::TradePriority::High);

  auto event = notifier.last<sentinel::PositionClosedEvent>();
  ASSERT_TRUE(event.has_value());
  EXPECT_DOUBLE_EQ(event->quote_received, 940.0);
  EXPECT_DOUBLE_EQ(event->realized_quote, -60.0);
}

TEST_F(PositionManagerTest, NonStopLossSellUsesNormalSlippage) {
  auto p = open(ExitRules{});
  manager.applyFullClose(p.id, 130.0, CloseReason::TakeProfit);

  auto calls = executor.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_DOUBLE_EQ(calls[0].options.slippage_percent, 2.0);
  EXPECT_EQ(calls[0].options.priority, sentinel::TradePriority::Normal);
}

// -----------------------------------------------------------------------------
// 4. Closing a closed position is a no-op and does not trade again.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, FullCloseOnClosedPositionIsNoOp) {
  auto p = open(ExitRules{});
  ASSERT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::Applied);

  EXPECT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::NoOp);
  EXPECT_EQ(executor.calls().size(), 1u);
}

TEST_F(PositionManagerTest, UnknownIdIsInvalidInput) {
  EXPECT_THROW(manager.applyFullClose(42, 100.0, CloseReason::Manual),
               sentinel::InvalidInputError);
  EXPECT_THROW(manager.applyFullClose(0, 100.0, CloseReason::Manual),
               sentinel::InvalidInputError);
}

// -----------------------------------------------------------------------------
// 5. A failed sell leaves the position OPEN with its amount unchanged; the
//    next attempt goes through.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, FailedSellKeepsPositionOpen) {
  auto p = open(stopLossOnly(5.0));
  executor.failNext(1);

  EXPECT_EQ(manager.applyFullClose(p.id, 94.0, CloseReason::StopLoss),
            ActionOutcome::Failed);

  auto after = get(p.id);
  EXPECT_EQ(after.status, PositionStatus::Open);
  EXPECT_DOUBLE_EQ(after.amount_remaining, 10.0);
  EXPECT_FALSE(after.needs_manual_intervention);
  EXPECT_FALSE(after.pending_action.has_value());
  EXPECT_EQ(after.last_error, "venue timeout");

  EXPECT_EQ(manager.applyFullClose(p.id, 94.0, CloseReason::StopLoss),
            ActionOutcome::Applied);
  EXPECT_EQ(get(p.id).status, PositionStatus::Closed);
}

TEST_F(PositionManagerTest, ExecutorExceptionCountsAsFailure) {
  auto p = open(ExitRules{});
  executor.throwNext(1);

  EXPECT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::Failed);
  auto after = get(p.id);
  EXPECT_TRUE(after.isActive());
  EXPECT_FALSE(after.pending_action.has_value());
}

// -----------------------------------------------------------------------------
// 6. Exhausting the retry budget flags the position once and emits a single
//    ActionFailedEvent. resumePosition() clears the flag.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, RetryBudgetEscalatesOnce) {
  auto p = open(ExitRules{});
  executor.failNext(4);

  EXPECT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::Failed);
  EXPECT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::Failed);
  EXPECT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::Escalated);
  EXPECT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::Failed);

  auto flagged = get(p.id);
  EXPECT_TRUE(flagged.needs_manual_intervention);
  EXPECT_TRUE(flagged.isActive());
  EXPECT_DOUBLE_EQ(flagged.amount_remaining, 10.0);

  EXPECT_EQ(notifier.count<sentinel::ActionFailedEvent>(), 1u);
  auto event = notifier.last<sentinel::ActionFailedEvent>();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->attempts, 3u);
  EXPECT_EQ(event->action, sentinel::domain::ActionKind::FullClose);

  EXPECT_TRUE(manager.resumePosition(p.id));
  EXPECT_FALSE(get(p.id).needs_manual_intervention);
  EXPECT_FALSE(manager.resumePosition(p.id));

  EXPECT_EQ(manager.stats().escalated, 1u);
}

TEST_F(PositionManagerTest, ResumeOfClosedPositionIsInvalid) {
  auto p = open(ExitRules{});
  manager.applyFullClose(p.id, 100.0, CloseReason::Manual);
  EXPECT_THROW(manager.resumePosition(p.id), sentinel::InvalidInputError);
}

// -----------------------------------------------------------------------------
// 7. A partial close sells fraction * amount_total, marks the level executed
//    and never sells it twice.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, PartialCloseSellsLevelOnce) {
  executor.setPrice("TKN", 109.0);
  ExitRules rules;
  rules.partial_profit_levels = {level(0, 8.0, 0.25), level(1, 15.0, 0.25)};
  auto p = open(rules);

  EXPECT_EQ(manager.applyPartialClose(p.id, 0.25, 0, 109.0),
            ActionOutcome::Applied);

  auto after = get(p.id);
  EXPECT_EQ(after.status, PositionStatus::PartiallyClosed);
  EXPECT_DOUBLE_EQ(after.amount_remaining, 7.5);
  EXPECT_DOUBLE_EQ(after.amount_total, 10.0);
  EXPECT_TRUE(after.exit_rules.partial_profit_levels[0].executed);
  EXPECT_FALSE(after.exit_rules.partial_profit_levels[1].executed);
  expectAmountInvariant(after);

  EXPECT_EQ(manager.applyPartialClose(p.id, 0.25, 0, 109.0),
            ActionOutcome::NoOp);
  EXPECT_EQ(executor.calls().size(), 1u);

  auto event = notifier.last<sentinel::PartialCloseEvent>();
  ASSERT_TRUE(event.has_value());
  EXPECT_DOUBLE_EQ(event->amount_sold, 2.5);
  EXPECT_DOUBLE_EQ(event->quote_received, 272.5);
  EXPECT_DOUBLE_EQ(event->realized_quote, 22.5);
}

TEST_F(PositionManagerTest, PartialCloseUnknownLevelIsInvalid) {
  auto p = open(ExitRules{});
  EXPECT_THROW(manager.applyPartialClose(p.id, 0.25, 5, 110.0),
               sentinel::InvalidInputError);
}

// -----------------------------------------------------------------------------
// 8. A ladder that sells the whole position closes it.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, PartialLadderConsumingRemainderCloses) {
  ExitRules rules;
  rules.partial_profit_levels = {level(0, 10.0, 0.5), level(1, 20.0, 0.5)};
  auto p = open(rules);

  ASSERT_EQ(manager.applyPartialClose(p.id, 0.5, 0, 110.0),
            ActionOutcome::Applied);
  ASSERT_EQ(manager.applyPartialClose(p.id, 0.5, 1, 120.0),
            ActionOutcome::Applied);

  auto closed = get(p.id);
  EXPECT_EQ(closed.status, PositionStatus::Closed);
  EXPECT_EQ(closed.close_reason, CloseReason::PartialTakeProfit);
  EXPECT_DOUBLE_EQ(closed.amount_remaining, 0.0);
  EXPECT_EQ(manager.openCount(), 0u);
  EXPECT_EQ(notifier.count<sentinel::PartialCloseEvent>(), 2u);
  EXPECT_EQ(notifier.count<sentinel::PositionClosedEvent>(), 1u);
}

// -----------------------------------------------------------------------------
// 9. Scale-in buys size_fraction * quote_budget and moves the cost basis to
//    the VWAP of held and bought amounts.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, ScaleInUpdatesVwapCostBasis) {
  executor.setPrice("TKN", 94.0);
  auto p = open(ExitRules{}, twoPhasePlan());

  EXPECT_EQ(manager.applyScaleIn(p.id, phase(1, 5.0, 0.3), 94.0),
            ActionOutcome::Applied);

  const double bought = 300.0 / 94.0;
  auto after = get(p.id);
  EXPECT_NEAR(after.amount_total, 10.0 + bought, 1e-9);
  EXPECT_NEAR(after.amount_remaining, 10.0 + bought, 1e-9);
  EXPECT_NEAR(after.cost_basis, 1300.0 / (10.0 + bought), 1e-9);
  EXPECT_DOUBLE_EQ(after.entry_price, 100.0);
  EXPECT_EQ(after.status, PositionStatus::Open);
  EXPECT_TRUE(after.scale_in_plan->phases[0].executed);
  EXPECT_EQ(after.scale_in_plan->current_phase, 1u);

  auto calls = executor.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_TRUE(calls[0].is_buy);
  EXPECT_DOUBLE_EQ(calls[0].amount, 300.0);
  EXPECT_DOUBLE_EQ(calls[0].options.slippage_percent, 1.0);

  auto event = notifier.last<sentinel::ScaleInEvent>();
  ASSERT_TRUE(event.has_value());
  EXPECT_NEAR(event->new_cost_basis, after.cost_basis, 1e-12);
}

TEST_F(PositionManagerTest, ScaleInPhasesRunInOrder) {
  auto p = open(ExitRules{}, twoPhasePlan());

  EXPECT_THROW(manager.applyScaleIn(p.id, phase(2, 15.0, 0.3), 85.0),
               sentinel::InvalidInputError);

  ASSERT_EQ(manager.applyScaleIn(p.id, phase(1, 5.0, 0.3), 94.0),
            ActionOutcome::Applied);
  EXPECT_EQ(manager.applyScaleIn(p.id, phase(1, 5.0, 0.3), 94.0),
            ActionOutcome::NoOp);
  EXPECT_EQ(manager.applyScaleIn(p.id, phase(2, 15.0, 0.3), 85.0),
            ActionOutcome::Applied);
  EXPECT_TRUE(get(p.id).scale_in_plan->exhausted());
}

TEST_F(PositionManagerTest, FailedScaleInLeavesPhaseUnexecuted) {
  auto p = open(ExitRules{}, twoPhasePlan());
  executor.failNext(1);

  EXPECT_EQ(manager.applyScaleIn(p.id, phase(1, 5.0, 0.3), 94.0),
            ActionOutcome::Failed);
  auto after = get(p.id);
  EXPECT_FALSE(after.scale_in_plan->phases[0].executed);
  EXPECT_DOUBLE_EQ(after.amount_total, 10.0);
  EXPECT_DOUBLE_EQ(after.cost_basis, 100.0);
}

// -----------------------------------------------------------------------------
// 9b. A partial sell before a scale-in does not change the weighting: cost
//     basis stays total quote spent / total tokens bought.
// How: 10 @ 100 (1000 quote), sell half at 110, then phase 1 buys 300 quote
//      at 94. Averaging only the held 5 tokens would give ~97.66.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, ScaleInAfterPartialSellWeighsAllBuys) {
  ExitRules rules;
  rules.stop_loss_percent = 2.0;
  rules.partial_profit_levels = {level(0, 10.0, 0.5)};
  auto p = open(rules, twoPhasePlan());

  executor.setPrice("TKN", 110.0);
  ASSERT_EQ(manager.applyPartialClose(p.id, 0.5, 0, 110.0),
            ActionOutcome::Applied);
  EXPECT_DOUBLE_EQ(get(p.id).cost_basis, 100.0);

  executor.setPrice("TKN", 94.0);
  ASSERT_EQ(manager.applyScaleIn(p.id, phase(1, 5.0, 0.3), 94.0),
            ActionOutcome::Applied);

  const double bought = 300.0 / 94.0;
  auto after = get(p.id);
  EXPECT_NEAR(after.cost_basis, 1300.0 / (10.0 + bought), 1e-9);
  EXPECT_NEAR(after.cost_basis, 98.5484, 1e-4);
  EXPECT_NEAR(after.amount_total, 10.0 + bought, 1e-9);
  EXPECT_NEAR(after.amount_remaining, 5.0 + bought, 1e-9);

  // The 2% stop-loss now sits near 96.58; 96.0 is below it.
  sentinel::ExitRuleEvaluator evaluator;
  auto action = evaluator.evaluate(after, 96.0, clock.now_ms());
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->kind, sentinel::domain::ActionKind::FullClose);
  EXPECT_EQ(action->reason, CloseReason::StopLoss);
}

// -----------------------------------------------------------------------------
// 10. While an action is in flight, a second action on the same position is
//     dropped, not queued.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, SecondActionWhilePendingIsDropped) {
  ExitRules rules;
  rules.partial_profit_levels = {level(0, 8.0, 0.25)};
  auto p = open(rules);

  std::optional<ActionOutcome> nested;
  executor.setDuringTrade([this, &p, &nested] {
    if (!nested) {
      nested = manager.applyPartialClose(p.id, 0.25, 0, 110.0);
    }
  });

  EXPECT_EQ(manager.applyFullClose(p.id, 110.0, CloseReason::Manual),
            ActionOutcome::Applied);
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(*nested, ActionOutcome::Dropped);
  EXPECT_EQ(manager.stats().dropped, 1u);
  EXPECT_EQ(executor.calls().size(), 1u);
}

// -----------------------------------------------------------------------------
// 10b. A close requested while a scale-in is in flight is dropped; once the
//      buy commits, a close ends the record for good and later actions do
//      not reopen it.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, CloseDuringInFlightScaleInNeverResurrects) {
  auto p = open(stopLossOnly(5.0), twoPhasePlan());

  std::optional<ActionOutcome> nested_close;
  executor.setDuringTrade([this, &p, &nested_close] {
    if (!nested_close) {
      nested_close = manager.applyFullClose(p.id, 94.0, CloseReason::Manual);
    }
  });

  ASSERT_EQ(manager.applyScaleIn(p.id, phase(1, 5.0, 0.3), 94.0),
            ActionOutcome::Applied);
  ASSERT_TRUE(nested_close.has_value());
  EXPECT_EQ(*nested_close, ActionOutcome::Dropped);
  EXPECT_EQ(get(p.id).status, PositionStatus::Open);
  EXPECT_FALSE(get(p.id).pending_action.has_value());

  executor.setDuringTrade({});
  ASSERT_EQ(manager.applyFullClose(p.id, 94.0, CloseReason::Manual),
            ActionOutcome::Applied);

  EXPECT_EQ(manager.applyScaleIn(p.id, phase(2, 15.0, 0.3), 85.0),
            ActionOutcome::NoOp);
  EXPECT_FALSE(manager.recordPrice(p.id, 120.0).has_value());
  auto closed = get(p.id);
  EXPECT_EQ(closed.status, PositionStatus::Closed);
  EXPECT_DOUBLE_EQ(closed.amount_remaining, 0.0);
  EXPECT_EQ(manager.openCount(), 0u);
  EXPECT_EQ(notifier.count<sentinel::PositionClosedEvent>(), 1u);
}

// -----------------------------------------------------------------------------
// 11. amount_remaining stays within [0, amount_total] through a mixed
//     sequence of buys and sells.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, AmountInvariantHoldsThroughLifecycle) {
  ExitRules rules;
  rules.partial_profit_levels = {level(0, 5.0, 0.4), level(1, 10.0, 0.4)};
  auto p = open(rules, twoPhasePlan());
  expectAmountInvariant(get(p.id));

  manager.applyPartialClose(p.id, 0.4, 0, 106.0);
  expectAmountInvariant(get(p.id));

  manager.applyScaleIn(p.id, phase(1, 5.0, 0.3), 94.0);
  expectAmountInvariant(get(p.id));

  manager.applyPartialClose(p.id, 0.4, 1, 111.0);
  expectAmountInvariant(get(p.id));

  manager.applyFullClose(p.id, 90.0, CloseReason::Manual);
  auto closed = get(p.id);
  expectAmountInvariant(closed);
  EXPECT_DOUBLE_EQ(closed.amount_remaining, 0.0);
}

// -----------------------------------------------------------------------------
// 12. recordPrice only ever raises highest_price.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, RecordPriceTracksPeak) {
  auto p = open(ExitRules{});

  clock.advance_by(5'000);
  auto s1 = manager.recordPrice(p.id, 120.0);
  ASSERT_TRUE(s1.has_value());
  EXPECT_DOUBLE_EQ(s1->highest_price, 120.0);
  EXPECT_EQ(s1->last_checked_ms, 1'005'000);

  auto s2 = manager.recordPrice(p.id, 110.0);
  ASSERT_TRUE(s2.has_value());
  EXPECT_DOUBLE_EQ(s2->highest_price, 120.0);
  EXPECT_DOUBLE_EQ(s2->current_price, 110.0);

  manager.applyFullClose(p.id, 110.0, CloseReason::Manual);
  EXPECT_FALSE(manager.recordPrice(p.id, 130.0).has_value());
}

// -----------------------------------------------------------------------------
// 13. Hydration restores only active positions and keeps new ids above every
//     stored id.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, HydrateRestoresActivePositions) {
  auto active = sentinel_test::makePosition(50.0, 4.0, stopLossOnly(10.0));
  active.id = 7;
  active.pending_action = sentinel::domain::ActionKind::FullClose;
  auto closed = sentinel_test::makePosition(50.0, 4.0, ExitRules{});
  closed.id = 9;
  closed.status = PositionStatus::Closed;
  closed.amount_remaining = 0.0;
  store.savePosition(active);
  store.savePosition(closed);

  EXPECT_EQ(manager.hydrate(), 1u);
  EXPECT_EQ(manager.openCount(), 1u);
  EXPECT_FALSE(get(7).pending_action.has_value());

  auto fresh = open(ExitRules{});
  EXPECT_EQ(fresh.id, 10u);
  EXPECT_EQ(manager.getAllPositions().size(), 3u);
}

// -----------------------------------------------------------------------------
// 14. Persistence failures are logged; the transition still happens.
// -----------------------------------------------------------------------------
TEST_F(PositionManagerTest, StoreWriteFailureDoesNotBlockTransitions) {
  store.setFailWrites(true);
  auto p = open(ExitRules{});
  EXPECT_EQ(manager.openCount(), 1u);

  EXPECT_EQ(manager.applyFullClose(p.id, 100.0, CloseReason::Manual),
            ActionOutcome::Applied);
  EXPECT_EQ(manager.openCount(), 0u);
  EXPECT_EQ(notifier.count<sentinel::PositionClosedEvent>(), 1u);
}

TEST_F(PositionManagerTest, QueriesByToken) {
  open(ExitRules{});
  manager.createPosition("OTHER", 2.0, 5.0, ExitRules{});

  EXPECT_EQ(manager.getPositionsByToken("TKN").size(), 1u);
  EXPECT_EQ(manager.getPositionsByToken("OTHER").size(), 1u);
  EXPECT_TRUE(manager.getPositionsByToken("NONE").empty());
  EXPECT_EQ(manager.getOpenPositions().size(), 2u);
}
