#pragma once

#include "sentinel/events/event_types.hpp"

#include <variant>

namespace sentinel {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Envelope carried by the EventBus and the notifier queue. Adding an
// alternative here forces every std::visit site to handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    PositionOpenedEvent,
    PartialCloseEvent,
    ScaleInEvent,
    PositionClosedEvent,
    ActionFailedEvent,
    EntryFailedEvent>;

// Stable wire name of the alternative ("position_opened", "partial_close",
// "scale_in", "position_closed", "action_failed", "entry_failed").
const char* eventName(const Event& event);

// Strategy the event belongs to, kManualStrategy for operator positions.
domain::StrategyId eventStrategy(const Event& event);

}  // namespace sentinel
