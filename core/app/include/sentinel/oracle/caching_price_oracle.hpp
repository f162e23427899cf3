#pragma once

#include "sentinel/oracle/i_price_oracle.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sentinel {

// -----------------------------------------------------------------------------
// CachingPriceOracle — TTL cache in front of another IPriceOracle
// -----------------------------------------------------------------------------
//
// @brief  Serves repeated lookups for the same token from memory for up to
//         ttl_ms, and logs large moves between consecutive upstream prices.
//
// @details
// Several positions commonly hold the same token, and the monitor fetches a
// price per position. The cache collapses those into one upstream call per
// TTL window.
//
// Upstream failures propagate unchanged. An expired entry is never served as
// a fallback: a stale price must not drive a stop-loss.
//
// Whenever an upstream price differs from the previously cached one by more
// than log_change_percent, a "[PriceOracle]" line is written to std::cout.
//
// Thread model:
//   The cache map is mutex-protected. The upstream call is made without the
//   lock held, so two workers missing on the same token at the same instant
//   may both go upstream; the later write wins.
//
// Ownership:
//   Holds non-owning references to the upstream oracle and the clock.
// -----------------------------------------------------------------------------
class CachingPriceOracle final : public IPriceOracle {
 public:
  CachingPriceOracle(IPriceOracle& upstream, const ITimeProvider& clock,
                     std::int64_t ttl_ms, double log_change_percent);

  double getPrice(const std::string& token_id) override;

  void invalidate(const std::string& token_id);
  void clear();

  std::uint64_t hits() const;
  std::uint64_t misses() const;

 private:
  struct Entry {
    double price{0.0};
    std::int64_t fetched_at_ms{0};
  };

  IPriceOracle& upstream_;
  const ITimeProvider& clock_;
  const std::int64_t ttl_ms_;
  const double log_change_percent_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> cache_;
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
};

}  // namespace sentinel
