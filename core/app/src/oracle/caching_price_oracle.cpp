#include "sentinel/oracle/caching_price_oracle.hpp"

#include <cmath>
#include <iostream>

namespace sentinel {

CachingPriceOracle::CachingPriceOracle(IPriceOracle& upstream,
                                       const ITimeProvider& clock,
                                       std::int64_t ttl_ms,
                                       double log_change_percent)
    : upstream_(upstream),
      clock_(clock),
      ttl_ms_(ttl_ms),
      log_change_percent_(log_change_percent) {}

double CachingPriceOracle::getPrice(const std::string& token_id) {
  const std::int64_t now = clock_.now_ms();
  double previous = 0.0;
  {
    std::lock_guard lock(mutex_);
    auto it = cache_.find(token_id);
    if (it != cache_.end()) {
      if (now - it->second.fetched_at_ms < ttl_ms_) {
        ++hits_;
        return it->second.price;
      }
      previous = it->second.price;
    }
    ++misses_;
  }

  const double price = requireUsablePrice(token_id, upstream_.getPrice(token_id));

  if (previous > 0.0) {
    const double change = (price - previous) / previous * 100.0;
    if (std::fabs(change) > log_change_percent_) {
      std::cout << "[PriceOracle] " << token_id << " moved " << change
                << "% (" << previous << " -> " << price << ")\n";
    }
  }

  std::lock_guard lock(mutex_);
  cache_[token_id] = Entry{price, now};
  return price;
}

void CachingPriceOracle::invalidate(const std::string& token_id) {
  std::lock_guard lock(mutex_);
  cache_.erase(token_id);
}

void CachingPriceOracle::clear() {
  std::lock_guard lock(mutex_);
  cache_.clear();
}

std::uint64_t CachingPriceOracle::hits() const {
  std::lock_guard lock(mutex_);
  return hits_;
}

std::uint64_t CachingPriceOracle::misses() const {
  std::lock_guard lock(mutex_);
  return misses_;
}

}  // namespace sentinel
