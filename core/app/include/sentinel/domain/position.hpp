#pragma once

#include "sentinel/domain/exit_rules.hpp"
#include "sentinel/domain/position_status.hpp"
#include "sentinel/domain/scale_in_plan.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {
namespace domain {

using PositionId = std::uint64_t;
using StrategyId = std::uint64_t;

// StrategyId 0 marks a position opened manually by an operator.
inline constexpr StrategyId kManualStrategy = 0;

// -----------------------------------------------------------------------------
// ActionKind / CloseReason
// -----------------------------------------------------------------------------
enum class ActionKind {
  FullClose,
  PartialClose,
  ScaleIn,
};

enum class CloseReason {
  StopLoss,
  MaxHold,
  TakeProfit,
  TrailingStop,
  PartialTakeProfit,  // A partial sell consumed the remainder
  Manual,
};

const char* toString(ActionKind kind);
const char* toString(CloseReason reason);

// -----------------------------------------------------------------------------
// Fill — one executed trade against a position (entry, partial, scale-in,
// exit). Kept for audit; the PositionManager appends, nothing else mutates.
// -----------------------------------------------------------------------------
struct Fill {
  enum class Kind { Entry, PartialSell, ScaleInBuy, ExitSell };

  Kind kind{Kind::Entry};
  double amount_base{0.0};   // Tokens bought or sold
  double amount_quote{0.0};  // Quote currency spent or received
  double price{0.0};         // Reference price at execution
  std::string tx_ref;
  std::string reason;
  std::int64_t timestamp_ms{0};
};

const char* toString(Fill::Kind kind);

// -----------------------------------------------------------------------------
// Position — one monitored holding
// -----------------------------------------------------------------------------
//
// @brief  Plain data record for a single open (or closed) position.
//
// @details
// Value semantics, like every domain struct: the authoritative copy lives in
// the PositionManager's map, everything else (events, IPC, persistence) works
// on snapshots.
//
// Immutable after creation: id, token_id, entry_price, entry_timestamp_ms,
// strategy_id, quote_budget. The entry price is kept separately from
// cost_basis because scale-in triggers are measured from the original entry,
// while stop-loss / take-profit / partial levels are measured from the
// volume-weighted cost basis.
//
// Amount invariant: 0 <= amount_remaining <= amount_total. amount_total only
// grows (scale-in buys); amount_remaining shrinks on sells and grows on
// scale-in buys.
//
// pending_action is the per-position re-entrancy guard. While set, no other
// trade action may start for this position.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{0};
  std::string token_id;
  double entry_price{0.0};
  std::int64_t entry_timestamp_ms{0};
  StrategyId strategy_id{kManualStrategy};
  double quote_budget{0.0};

  double amount_total{0.0};
  double amount_remaining{0.0};
  double cost_basis{0.0};  // VWAP over all buys

  double current_price{0.0};
  double highest_price{0.0};  // Monotonically non-decreasing
  std::int64_t last_checked_ms{0};

  PositionStatus status{PositionStatus::Open};
  ExitRules exit_rules;
  std::optional<ScaleInPlan> scale_in_plan;

  std::optional<ActionKind> pending_action;
  bool needs_manual_intervention{false};
  std::string last_error;

  std::vector<Fill> fills;

  std::optional<double> exit_price;
  std::optional<CloseReason> close_reason;
  std::optional<std::int64_t> closed_at_ms;
  std::optional<double> realized_profit_percent;

  bool isActive() const { return domain::isActive(status); }

  // Profit of `price` relative to the cost basis, in percent.
  double profitPercentAt(double price) const {
    return (price - cost_basis) / cost_basis * 100.0;
  }
};

}  // namespace domain
}  // namespace sentinel
