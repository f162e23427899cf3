#pragma once

#include "sentinel/oracle/i_price_oracle.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace sentinel {

// -----------------------------------------------------------------------------
// SimulatedPriceOracle — demo-mode price source
// -----------------------------------------------------------------------------
//
// @brief  In-process price table with an optional seeded random walk.
//
// @details
// Used by the demo harness and by tests. Prices are set explicitly with
// setPrice(). When volatility_percent > 0, every getPrice() call moves the
// stored price by a uniformly distributed step in
// [-volatility_percent, +volatility_percent] percent before returning it, so
// a demo run exercises stop-losses and take-profits without a live feed.
//
// Tokens never priced, and tokens marked with setUnavailable(), throw
// PriceUnavailableError.
//
// Thread model:
//   All methods lock an internal mutex. The generator is seeded once so a
//   demo run is reproducible for a given seed.
// -----------------------------------------------------------------------------
class SimulatedPriceOracle final : public IPriceOracle {
 public:
  explicit SimulatedPriceOracle(std::uint32_t seed = 42,
                                double volatility_percent = 0.0);

  double getPrice(const std::string& token_id) override;

  void setPrice(const std::string& token_id, double price);
  void setUnavailable(const std::string& token_id, bool unavailable = true);

  std::uint64_t calls() const;

 private:
  mutable std::mutex mutex_;
  std::mt19937 rng_;
  double volatility_percent_;
  std::unordered_map<std::string, double> prices_;
  std::unordered_set<std::string> unavailable_;
  std::uint64_t calls_{0};
};

}  // namespace sentinel
