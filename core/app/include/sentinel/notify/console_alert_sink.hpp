#pragma once

#include "sentinel/eventbus/event_bus.hpp"

#include <functional>
#include <ostream>

namespace sentinel {

// Decides whether an event should produce a human-facing alert. Typically
// bound to StrategyBook::wantsAlert so per-strategy toggles are honoured.
using AlertFilter = std::function<bool(const Event&)>;

// -----------------------------------------------------------------------------
// attachConsoleAlerts(bus, filter, out, err)
// -----------------------------------------------------------------------------
// Subscribes a sink that renders each lifecycle event as a one-line alert.
// Failures (action_failed, entry_failed) go to `err`, everything else to
// `out`. An empty filter lets every event through.
// -----------------------------------------------------------------------------
EventBus::SubscriptionId attachConsoleAlerts(EventBus& bus, AlertFilter filter,
                                             std::ostream& out,
                                             std::ostream& err);

// One-line human readable rendering, without the trailing newline.
std::string formatAlert(const Event& event);

}  // namespace sentinel
