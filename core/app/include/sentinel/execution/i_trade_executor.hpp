#pragma once

#include <cstdint>
#include <string>

namespace sentinel {

enum class TradePriority { Normal, High };

// -----------------------------------------------------------------------------
// TradeOptions
// -----------------------------------------------------------------------------
// slippage_percent is the worst acceptable fill relative to the quote the
// executor obtains. max_retries is the executor's own transport-level retry
// budget; the PositionManager's action retry counter sits above it.
// -----------------------------------------------------------------------------
struct TradeOptions {
  double slippage_percent{1.0};
  std::uint32_t max_retries{3};
  TradePriority priority{TradePriority::Normal};
};

// -----------------------------------------------------------------------------
// TradeResult
// -----------------------------------------------------------------------------
// For a buy: amount_in is quote spent, amount_out is tokens received.
// For a sell: amount_in is tokens sold, amount_out is quote received.
// When success is false the amounts are meaningless and error says why.
// -----------------------------------------------------------------------------
struct TradeResult {
  bool success{false};
  double amount_in{0.0};
  double amount_out{0.0};
  std::string tx_ref;
  std::string error;
};

// -----------------------------------------------------------------------------
// ITradeExecutor — the swap venue
// -----------------------------------------------------------------------------
//
// @brief  Executes buys (quote -> token) and sells (token -> quote).
//
// @details
// Implementations report failure either by returning success == false or by
// throwing TradeExecutionError. Callers treat both the same way.
//
// Thread model:
//   Called concurrently for different positions. Never concurrently for the
//   same position.
// -----------------------------------------------------------------------------
class ITradeExecutor {
 public:
  virtual ~ITradeExecutor() = default;

  virtual TradeResult buy(const std::string& token_id, double amount_quote,
                          const TradeOptions& options) = 0;

  virtual TradeResult sell(const std::string& token_id, double amount_base,
                           const TradeOptions& options) = 0;
};

}  // namespace sentinel
