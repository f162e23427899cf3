#include "sentinel/common/errors.hpp"
#include "sentinel/oracle/i_price_oracle.hpp"

#include <cmath>
#include <string>

namespace sentinel {

double requireUsablePrice(const std::string& token_id, double price) {
  if (!std::isfinite(price) || price <= 0.0) {
    throw PriceUnavailableError("unusable price " + std::to_string(price) +
                                " for " + token_id);
  }
  return price;
}

}  // namespace sentinel
