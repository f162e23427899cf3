#pragma once

#include "sentinel/events/event.hpp"

#include <nlohmann/json.hpp>

namespace sentinel {

// -----------------------------------------------------------------------------
// eventToJson(event)
// -----------------------------------------------------------------------------
// Telemetry encoding published on the IPC PUB socket:
//   { "type": <eventName>, "timestamp_ms": ..., <event fields> }
// Position-carrying events embed the full position record under "position".
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event);

}  // namespace sentinel
