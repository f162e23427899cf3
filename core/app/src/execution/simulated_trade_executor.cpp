#include "sentinel/execution/simulated_trade_executor.hpp"

#include "sentinel/common/errors.hpp"

#include <iostream>
#include <sstream>

namespace sentinel {

SimulatedTradeExecutor::SimulatedTradeExecutor(IPriceOracle& oracle,
                                               const ITimeProvider& clock,
                                               std::uint32_t seed,
                                               double failure_rate)
    : oracle_(oracle),
      clock_(clock),
      failure_rate_(failure_rate),
      rng_(seed) {}

bool SimulatedTradeExecutor::rollFailure(std::uint64_t& sequence) {
  std::lock_guard lock(mutex_);
  sequence = ++sequence_;
  if (failure_rate_ <= 0.0) {
    return false;
  }
  std::uniform_real_distribution<double> die(0.0, 1.0);
  const bool fail = die(rng_) < failure_rate_;
  if (fail) {
    ++failed_;
  }
  return fail;
}

std::string SimulatedTradeExecutor::makeTxRef(std::uint64_t sequence) const {
  std::ostringstream os;
  os << "demo_tx_" << std::hex << clock_.now_ms() << std::dec << "_"
     << sequence;
  return os.str();
}

TradeResult SimulatedTradeExecutor::buy(const std::string& token_id,
                                        double amount_quote,
                                        const TradeOptions& options) {
  TradeResult result;
  std::uint64_t sequence = 0;
  if (rollFailure(sequence)) {
    result.error = "simulated failure";
    return result;
  }

  double price = 0.0;
  try {
    price = oracle_.getPrice(token_id);
  } catch (const PriceUnavailableError& e) {
    std::lock_guard lock(mutex_);
    ++failed_;
    result.error = e.what();
    return result;
  }

  result.success = true;
  result.amount_in = amount_quote;
  result.amount_out = amount_quote / price;
  result.tx_ref = makeTxRef(sequence);
  {
    std::lock_guard lock(mutex_);
    ++executed_;
  }
  std::cout << "[SimExecutor] BUY " << token_id << " quote=" << amount_quote
            << " tokens=" << result.amount_out << " slippage<="
            << options.slippage_percent << "% " << result.tx_ref << "\n";
  return result;
}

TradeResult SimulatedTradeExecutor::sell(const std::string& token_id,
                                         double amount_base,
                                         const TradeOptions& options) {
  TradeResult result;
  std::uint64_t sequence = 0;
  if (rollFailure(sequence)) {
    result.error = "simulated failure";
    return result;
  }

  double price = 0.0;
  try {
    price = oracle_.getPrice(token_id);
  } catch (const PriceUnavailableError& e) {
    std::lock_guard lock(mutex_);
    ++failed_;
    result.error = e.what();
    return result;
  }

  result.success = true;
  result.amount_in = amount_base;
  result.amount_out = amount_base * price;
  result.tx_ref = makeTxRef(sequence);
  {
    std::lock_guard lock(mutex_);
    ++executed_;
  }
  std::cout << "[SimExecutor] SELL " << token_id << " tokens=" << amount_base
            << " quote=" << result.amount_out << " slippage<="
            << options.slippage_percent << "% " << result.tx_ref << "\n";
  return result;
}

std::uint64_t SimulatedTradeExecutor::executed() const {
  std::lock_guard lock(mutex_);
  return executed_;
}

std::uint64_t SimulatedTradeExecutor::failed() const {
  std::lock_guard lock(mutex_);
  return failed_;
}

}  // namespace sentinel
