#pragma once

#include "sentinel/events/event.hpp"

namespace sentinel {

// -----------------------------------------------------------------------------
// INotifier — fire-and-forget sink for trade lifecycle events
// -----------------------------------------------------------------------------
//
// @brief  The only way core components report lifecycle side effects.
//
// @details
// emit() must return promptly and must not throw: it is called from the
// monitoring path right after a state transition has been committed, and a
// slow chat API or a full disk must never stall position monitoring.
// Delivery is best-effort.
//
// Thread model:
//   emit() may be called concurrently from any worker.
// -----------------------------------------------------------------------------
class INotifier {
 public:
  virtual ~INotifier() = default;

  virtual void emit(Event event) = 0;
};

}  // namespace sentinel
