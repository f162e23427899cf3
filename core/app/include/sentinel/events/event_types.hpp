#pragma once

#include "sentinel/domain/position.hpp"

#include <cstdint>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// Trade lifecycle events
// -----------------------------------------------------------------------------
// Emitted by the PositionManager and EntryExecutor through the INotifier.
// Every event is plain data with value semantics so it can be queued and
// consumed on the notifier's worker thread after the originating record has
// moved on. Events that describe a position carry a full snapshot taken right
// after the mutation was committed.
//
// timestamp_ms comes from the injected ITimeProvider.
// -----------------------------------------------------------------------------

struct PositionOpenedEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

struct PartialCloseEvent {
  domain::Position position;
  std::uint32_t level_id{0};
  double fraction{0.0};
  double amount_sold{0.0};
  double quote_received{0.0};
  double price{0.0};
  double profit_percent{0.0};  // vs cost basis at the time of the sell
  double realized_quote{0.0};  // quote_received - amount_sold * cost basis
  std::int64_t timestamp_ms{0};
};

struct ScaleInEvent {
  domain::Position position;
  std::uint32_t phase_number{0};
  double quote_spent{0.0};
  double amount_bought{0.0};
  double price{0.0};
  double new_cost_basis{0.0};
  std::int64_t timestamp_ms{0};
};

struct PositionClosedEvent {
  domain::Position position;
  domain::CloseReason reason{domain::CloseReason::Manual};
  double exit_price{0.0};
  double profit_percent{0.0};
  double quote_received{0.0};
  double realized_quote{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// ActionFailedEvent
// -----------------------------------------------------------------------------
// Raised once the retry budget for an action is exhausted. The position has
// been flagged needs_manual_intervention and is left unmodified otherwise.
// -----------------------------------------------------------------------------
struct ActionFailedEvent {
  domain::PositionId position_id{0};
  std::string token_id;
  domain::StrategyId strategy_id{domain::kManualStrategy};
  domain::ActionKind action{domain::ActionKind::FullClose};
  std::uint32_t attempts{0};
  std::string error;
  std::int64_t timestamp_ms{0};
};

struct EntryFailedEvent {
  domain::StrategyId strategy_id{domain::kManualStrategy};
  std::string token_id;
  double quote_amount{0.0};
  std::string error;
  std::int64_t timestamp_ms{0};
};

}  // namespace sentinel
