#pragma once

#include "sentinel/domain/position.hpp"
#include "sentinel/engine/position_manager.hpp"
#include "sentinel/engine/strategy_book.hpp"
#include "sentinel/execution/i_trade_executor.hpp"
#include "sentinel/notify/i_notifier.hpp"
#include "sentinel/oracle/i_price_oracle.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// EntryExecutor — opens positions on behalf of strategies and operators
// -----------------------------------------------------------------------------
//
// @brief  Performs the entry buy and hands the filled position to the
//         PositionManager.
//
// @details
// openPosition(strategy_id, token):
//   1. The strategy must exist and be enabled (InvalidInputError).
//   2. StrategyBook::checkCapacity against the manager's open positions.
//      A refused entry throws InvalidInputError with the reason.
//   3. size = StrategyBook::positionSize(available); reference price from
//      the oracle (PriceUnavailableError propagates, nothing is bought).
//   4. Buy `size` quote with buy slippage. On success the position is
//      created with the strategy's exit rules and scale-in plan and the
//      strategy records a successful trade. On failure the strategy records
//      a failed trade, an EntryFailedEvent is emitted and
//      TradeExecutionError is thrown.
//
// openManual(token, quote_amount, rules, plan) follows steps 3 and 4 for a
// position with no strategy.
//
// The entry price is the quote-per-token actually paid
// (amount_in / amount_out), not the reference price.
// -----------------------------------------------------------------------------
class EntryExecutor {
 public:
  EntryExecutor(PositionManager& manager, StrategyBook& strategies,
                ITradeExecutor& executor, IPriceOracle& oracle,
                INotifier& notifier, const ITimeProvider& clock);

  EntryExecutor(const EntryExecutor&) = delete;
  EntryExecutor& operator=(const EntryExecutor&) = delete;

  domain::Position openPosition(domain::StrategyId strategy_id,
                                   const std::string& token_id);

  domain::Position openManual(
      const std::string& token_id, double quote_amount,
      domain::ExitRules exit_rules,
      std::optional<domain::ScaleInPlan> scale_in_plan = std::nullopt);

 private:
  domain::Position buyAndRegister(
      domain::StrategyId strategy_id, const std::string& token_id,
      double quote_amount, domain::ExitRules exit_rules,
      std::optional<domain::ScaleInPlan> scale_in_plan);

  void reportFailure(domain::StrategyId strategy_id,
                     const std::string& token_id, double quote_amount,
                     const std::string& error);

  PositionManager& manager_;
  StrategyBook& strategies_;
  ITradeExecutor& executor_;
  IPriceOracle& oracle_;
  INotifier& notifier_;
  const ITimeProvider& clock_;
};

}  // namespace sentinel
