#include "sentinel/engine/entry_executor.hpp"

#include "sentinel/common/errors.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace sentinel {

EntryExecutor::EntryExecutor(PositionManager& manager,
                             StrategyBook& strategies,
                             ITradeExecutor& executor, IPriceOracle& oracle,
                             INotifier& notifier, const ITimeProvider& clock)
    : manager_(manager),
      strategies_(strategies),
      executor_(executor),
      oracle_(oracle),
      notifier_(notifier),
      clock_(clock) {}

domain::Position EntryExecutor::openPosition(
    domain::StrategyId strategy_id, const std::string& token_id) {
  if (token_id.empty()) {
    throw InvalidInputError("token_id is empty");
  }

  std::optional<domain::Strategy> strategy =
      strategies_.getStrategy(strategy_id);
  if (!strategy) {
    throw InvalidInputError("unknown strategy " +
                            std::to_string(strategy_id));
  }
  if (!strategy->enabled) {
    throw InvalidInputError("strategy " + std::to_string(strategy_id) +
                            " is disabled");
  }

  const CapacityCheck capacity =
      strategies_.checkCapacity(strategy_id, manager_.getOpenPositions());
  if (!capacity.allowed) {
    std::cout << "[EntryExecutor] Strategy " << strategy_id
              << " refused entry for " << token_id << ": " << capacity.reason
              << "\n";
    throw InvalidInputError(capacity.reason);
  }

  const double size =
      strategies_.positionSize(strategy_id, capacity.available);

  domain::Position position =
      buyAndRegister(strategy_id, token_id, size, strategy->exit_rules,
                     strategy->scale_in_plan);
  strategies_.recordTradeResult(strategy_id, true);
  return position;
}

domain::Position EntryExecutor::openManual(
    const std::string& token_id, double quote_amount,
    domain::ExitRules exit_rules,
    std::optional<domain::ScaleInPlan> scale_in_plan) {
  if (token_id.empty()) {
    throw InvalidInputError("token_id is empty");
  }
  if (!std::isfinite(quote_amount) || quote_amount <= 0.0) {
    throw InvalidInputError("quote amount must be > 0");
  }
  return buyAndRegister(domain::kManualStrategy, token_id, quote_amount,
                        std::move(exit_rules), std::move(scale_in_plan));
}

// -----------------------------------------------------------------------------
// buyAndRegister
// -----------------------------------------------------------------------------
// The reference price is read first so a token without a price never reaches
// the executor. Executor exceptions and success == false are handled the
// same way.
// -----------------------------------------------------------------------------
domain::Position EntryExecutor::buyAndRegister(
    domain::StrategyId strategy_id, const std::string& token_id,
    double quote_amount, domain::ExitRules exit_rules,
    std::optional<domain::ScaleInPlan> scale_in_plan) {
  const double reference_price =
      requireUsablePrice(token_id, oracle_.getPrice(token_id));

  const ExecutionPolicy& policy = manager_.policy();
  TradeOptions options;
  options.slippage_percent = policy.buy_slippage_percent;
  options.max_retries = policy.executor_max_retries;

  TradeResult result;
  try {
    result = executor_.buy(token_id, quote_amount, options);
  } catch (const TradeExecutionError& e) {
    result.success = false;
    result.error = e.what();
  }

  if (result.success &&
      (!std::isfinite(result.amount_out) || result.amount_out <= 0.0 ||
       !std::isfinite(result.amount_in) || result.amount_in <= 0.0)) {
    result.success = false;
    result.error = "executor reported an empty fill";
  }

  if (!result.success) {
    reportFailure(strategy_id, token_id, quote_amount, result.error);
    throw TradeExecutionError("entry buy for " + token_id +
                              " failed: " + result.error);
  }

  const double entry_price = result.amount_in / result.amount_out;

  EntryContext context;
  context.strategy_id = strategy_id;
  context.quote_budget = quote_amount;
  context.quote_spent = result.amount_in;
  context.tx_ref = result.tx_ref;

  std::cout << "[EntryExecutor] Bought " << result.amount_out << " "
            << token_id << " for " << result.amount_in
            << " (reference " << reference_price << ", tx "
            << result.tx_ref << ")\n";

  return manager_.createPosition(token_id, entry_price, result.amount_out,
                                 std::move(exit_rules),
                                 std::move(scale_in_plan), context);
}

void EntryExecutor::reportFailure(domain::StrategyId strategy_id,
                                  const std::string& token_id,
                                  double quote_amount,
                                  const std::string& error) {
  std::cerr << "[EntryExecutor] Entry buy for " << token_id
            << " failed: " << error << "\n";

  if (strategy_id != domain::kManualStrategy) {
    strategies_.recordTradeResult(strategy_id, false);
  }

  EntryFailedEvent event;
  event.strategy_id = strategy_id;
  event.token_id = token_id;
  event.quote_amount = quote_amount;
  event.error = error;
  event.timestamp_ms = clock_.now_ms();
  notifier_.emit(std::move(event));
}

}  // namespace sentinel
