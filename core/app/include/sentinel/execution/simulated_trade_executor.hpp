#pragma once

#include "sentinel/execution/i_trade_executor.hpp"
#include "sentinel/oracle/i_price_oracle.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// SimulatedTradeExecutor — demo-mode swap venue
// -----------------------------------------------------------------------------
//
// @brief  Fills every order at the oracle's current price, optionally with a
//         seeded random failure rate.
//
// @details
// The demo counterpart of a real swap client. Fills are perfect (zero
// slippage) at the price returned by the injected oracle, and tx_ref has the
// form "demo_tx_<hex ms>_<seq>".
//
// failure_rate in [0, 1] makes that fraction of calls return
// success == false with error "simulated failure", so the retry and manual-
// intervention paths can be exercised end-to-end. A price lookup failure is
// reported the same way.
//
// Thread model:
//   buy()/sell() may run concurrently; the generator and counters are
//   mutex-protected. The oracle call is made outside the lock.
// -----------------------------------------------------------------------------
class SimulatedTradeExecutor final : public ITradeExecutor {
 public:
  SimulatedTradeExecutor(IPriceOracle& oracle, const ITimeProvider& clock,
                         std::uint32_t seed = 7, double failure_rate = 0.0);

  TradeResult buy(const std::string& token_id, double amount_quote,
                  const TradeOptions& options) override;

  TradeResult sell(const std::string& token_id, double amount_base,
                   const TradeOptions& options) override;

  std::uint64_t executed() const;
  std::uint64_t failed() const;

 private:
  // Draws the failure die and the next tx sequence under the lock.
  bool rollFailure(std::uint64_t& sequence);
  std::string makeTxRef(std::uint64_t sequence) const;

  IPriceOracle& oracle_;
  const ITimeProvider& clock_;
  const double failure_rate_;

  mutable std::mutex mutex_;
  std::mt19937 rng_;
  std::uint64_t sequence_{0};
  std::uint64_t executed_{0};
  std::uint64_t failed_{0};
};

}  // namespace sentinel
