#pragma once

#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// IPriceOracle — current price source
// -----------------------------------------------------------------------------
//
// @brief  Returns the current quote-currency price of one token.
//
// @details
// Implementations throw PriceUnavailableError when no usable price exists.
// A price of zero, a negative price or a NaN is never returned: callers may
// rely on every returned value being finite and > 0.
//
// Thread model:
//   getPrice() is called concurrently from the monitor's per-position
//   workers, for different tokens and occasionally for the same token.
// -----------------------------------------------------------------------------
class IPriceOracle {
 public:
  virtual ~IPriceOracle() = default;

  virtual double getPrice(const std::string& token_id) = 0;
};

// Throws PriceUnavailableError unless `price` is finite and > 0.
double requireUsablePrice(const std::string& token_id, double price);

}  // namespace sentinel
