#include "sentinel/oracle/simulated_price_oracle.hpp"

#include "sentinel/common/errors.hpp"

namespace sentinel {

SimulatedPriceOracle::SimulatedPriceOracle(std::uint32_t seed,
                                           double volatility_percent)
    : rng_(seed), volatility_percent_(volatility_percent) {}

double SimulatedPriceOracle::getPrice(const std::string& token_id) {
  std::lock_guard lock(mutex_);
  ++calls_;

  if (unavailable_.count(token_id) != 0) {
    throw PriceUnavailableError("price feed down for " + token_id);
  }
  auto it = prices_.find(token_id);
  if (it == prices_.end()) {
    throw PriceUnavailableError("no price for " + token_id);
  }

  if (volatility_percent_ > 0.0) {
    std::uniform_real_distribution<double> step(-volatility_percent_,
                                                volatility_percent_);
    it->second *= 1.0 + step(rng_) / 100.0;
  }
  return requireUsablePrice(token_id, it->second);
}

void SimulatedPriceOracle::setPrice(const std::string& token_id,
                                    double price) {
  std::lock_guard lock(mutex_);
  prices_[token_id] = price;
}

void SimulatedPriceOracle::setUnavailable(const std::string& token_id,
                                          bool unavailable) {
  std::lock_guard lock(mutex_);
  if (unavailable) {
    unavailable_.insert(token_id);
  } else {
    unavailable_.erase(token_id);
  }
}

std::uint64_t SimulatedPriceOracle::calls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

}  // namespace sentinel
