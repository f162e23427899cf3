// =============================================================================
// exit_rule_evaluator_test.cpp
// =============================================================================
// Unit tests for sentinel::ExitRuleEvaluator.
//
// Validates:
//   - Stop-loss / take-profit thresholds against the cost basis
//   - Priority: stop-loss > max-hold > take-profit > trailing > partial
//   - Trailing stop arms only after the trigger was crossed
//   - Partial levels fire lowest-first and never twice
//   - Precondition errors (bad price, closed position)
//
// The evaluator is a pure function, so every test builds a Position by hand.
// =============================================================================

#include "sentinel/engine/exit_rule_evaluator.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <limits>

using sentinel::domain::ActionKind;
using sentinel::domain::CloseReason;
using sentinel::domain::ExitRules;
using sentinel_test::level;
using sentinel_test::makePosition;
using sentinel_test::stopLossOnly;

class ExitRuleEvaluatorTest : public ::testing::Test {
 protected:
  sentinel::ExitRuleEvaluator evaluator;
};

// -----------------------------------------------------------------------------
// 1. entry 100, stop-loss 5%: 94 closes, 96 does not.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, StopLossFiresAtThreshold) {
  auto position = makePosition(100.0, 10.0, stopLossOnly(5.0));

  auto at94 = evaluator.evaluate(position, 94.0, 0);
  ASSERT_TRUE(at94.has_value());
  EXPECT_EQ(at94->kind, ActionKind::FullClose);
  EXPECT_EQ(at94->reason, CloseReason::StopLoss);

  EXPECT_FALSE(evaluator.evaluate(position, 96.0, 0).has_value());
}

// -----------------------------------------------------------------------------
// 2. Exactly -5% is a hit (the comparison is inclusive).
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, StopLossBoundaryIsInclusive) {
  auto position = makePosition(100.0, 10.0, stopLossOnly(5.0));
  auto action = evaluator.evaluate(position, 95.0, 0);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->reason, CloseReason::StopLoss);
}

// -----------------------------------------------------------------------------
// 3. Thresholds are measured from the VWAP cost basis, not the entry price.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, StopLossUsesCostBasis) {
  auto position = makePosition(100.0, 10.0, stopLossOnly(5.0));
  position.cost_basis = 90.0;  // after averaging down

  EXPECT_FALSE(evaluator.evaluate(position, 88.0, 0).has_value());
  auto action = evaluator.evaluate(position, 85.0, 0);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->reason, CloseReason::StopLoss);
}

// -----------------------------------------------------------------------------
// 4. A price that satisfies both stop-loss and take-profit yields STOP_LOSS.
// Validation never admits such rules, so the evaluator is fed them directly.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, StopLossBeatsTakeProfit) {
  ExitRules rules;
  rules.stop_loss_percent = 5.0;
  rules.take_profit_percent = -10.0;
  auto position = makePosition(100.0, 10.0, rules);

  auto action = evaluator.evaluate(position, 94.0, 0);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->reason, CloseReason::StopLoss);
}

TEST_F(ExitRuleEvaluatorTest, TakeProfitFires) {
  ExitRules rules;
  rules.take_profit_percent = 30.0;
  auto position = makePosition(100.0, 10.0, rules);

  EXPECT_FALSE(evaluator.evaluate(position, 129.0, 0).has_value());
  auto action = evaluator.evaluate(position, 130.0, 0);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->reason, CloseReason::TakeProfit);
}

// -----------------------------------------------------------------------------
// 5. Max hold is checked before take-profit and after stop-loss.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, MaxHoldOrdering) {
  ExitRules rules;
  rules.stop_loss_percent = 5.0;
  rules.take_profit_percent = 30.0;
  rules.max_hold_time_seconds = 60;
  auto position = makePosition(100.0, 10.0, rules);

  EXPECT_FALSE(evaluator.evaluate(position, 100.0, 59'999).has_value());

  auto expired = evaluator.evaluate(position, 100.0, 60'000);
  ASSERT_TRUE(expired.has_value());
  EXPECT_EQ(expired->reason, CloseReason::MaxHold);

  auto expired_in_profit = evaluator.evaluate(position, 140.0, 60'000);
  ASSERT_TRUE(expired_in_profit.has_value());
  EXPECT_EQ(expired_in_profit->reason, CloseReason::MaxHold);

  auto expired_in_loss = evaluator.evaluate(position, 90.0, 60'000);
  ASSERT_TRUE(expired_in_loss.has_value());
  EXPECT_EQ(expired_in_loss->reason, CloseReason::StopLoss);
}

// -----------------------------------------------------------------------------
// 6. Trailing stop never fires while peak profit stayed below the trigger,
//    however deep the retracement.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, TrailingStopRequiresTrigger) {
  ExitRules rules;
  rules.trailing_stop = {true, 20.0, 5.0};
  auto position = makePosition(100.0, 10.0, rules);
  position.highest_price = 119.0;

  EXPECT_FALSE(evaluator.evaluate(position, 101.0, 0).has_value());
  EXPECT_FALSE(evaluator.evaluate(position, 80.0, 0).has_value());
}

TEST_F(ExitRuleEvaluatorTest, TrailingStopFiresOnRetracementFromPeak) {
  ExitRules rules;
  rules.trailing_stop = {true, 20.0, 10.0};
  auto position = makePosition(100.0, 10.0, rules);
  position.highest_price = 150.0;

  EXPECT_FALSE(evaluator.evaluate(position, 140.0, 0).has_value());

  auto action = evaluator.evaluate(position, 135.0, 0);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->kind, ActionKind::FullClose);
  EXPECT_EQ(action->reason, CloseReason::TrailingStop);
}

// -----------------------------------------------------------------------------
// 7. The current price counts toward the peak even before it is recorded.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, TrailingPeakIncludesCurrentPrice) {
  ExitRules rules;
  rules.trailing_stop = {true, 20.0, 10.0};
  auto position = makePosition(100.0, 10.0, rules);

  EXPECT_FALSE(evaluator.evaluate(position, 125.0, 0).has_value());
}

// -----------------------------------------------------------------------------
// 8. Ladder {8%, 25%}, {15%, 25%}: at 9% only the first level fires, and once
//    it is executed the same price yields nothing.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, PartialLevelFiresOnce) {
  ExitRules rules;
  rules.partial_profit_levels = {level(0, 8.0, 0.25), level(1, 15.0, 0.25)};
  auto position = makePosition(100.0, 10.0, rules);

  auto first = evaluator.evaluate(position, 109.0, 0);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->kind, ActionKind::PartialClose);
  EXPECT_EQ(first->level_id, 0u);
  EXPECT_DOUBLE_EQ(first->fraction, 0.25);

  position.exit_rules.partial_profit_levels[0].executed = true;
  EXPECT_FALSE(evaluator.evaluate(position, 109.0, 0).has_value());
  EXPECT_FALSE(evaluator.evaluate(position, 109.0, 0).has_value());

  auto second = evaluator.evaluate(position, 116.0, 0);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->level_id, 1u);
}

// -----------------------------------------------------------------------------
// 9. A price gap through several levels still returns the lowest one only.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, PartialGapReturnsLowestLevel) {
  ExitRules rules;
  rules.partial_profit_levels = {level(0, 8.0, 0.25), level(1, 15.0, 0.25)};
  auto position = makePosition(100.0, 10.0, rules);

  auto action = evaluator.evaluate(position, 130.0, 0);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->level_id, 0u);
}

// -----------------------------------------------------------------------------
// 10. Take-profit outranks the partial ladder.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, TakeProfitBeatsPartial) {
  ExitRules rules;
  rules.take_profit_percent = 30.0;
  rules.partial_profit_levels = {level(0, 8.0, 0.25)};
  auto position = makePosition(100.0, 10.0, rules);

  auto action = evaluator.evaluate(position, 131.0, 0);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->reason, CloseReason::TakeProfit);
}

TEST_F(ExitRuleEvaluatorTest, NoRulesNoAction) {
  auto position = makePosition(100.0, 10.0, ExitRules{});
  EXPECT_FALSE(evaluator.evaluate(position, 1.0, 0).has_value());
  EXPECT_FALSE(evaluator.evaluate(position, 1000.0, 0).has_value());
}

// -----------------------------------------------------------------------------
// 11. Preconditions: non-positive or NaN price, closed position.
// -----------------------------------------------------------------------------
TEST_F(ExitRuleEvaluatorTest, RejectsBadInput) {
  auto position = makePosition(100.0, 10.0, stopLossOnly(5.0));

  EXPECT_THROW(evaluator.evaluate(position, 0.0, 0),
               sentinel::InvalidInputError);
  EXPECT_THROW(evaluator.evaluate(position, -1.0, 0),
               sentinel::InvalidInputError);
  EXPECT_THROW(evaluator.evaluate(
                   position, std::numeric_limits<double>::quiet_NaN(), 0),
               sentinel::InvalidInputError);

  position.status = sentinel::domain::PositionStatus::Closed;
  EXPECT_THROW(evaluator.evaluate(position, 90.0, 0),
               sentinel::InvalidInputError);
}
