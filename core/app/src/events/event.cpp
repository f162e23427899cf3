#include "sentinel/events/event.hpp"

#include <type_traits>

namespace sentinel {

const char* eventName(const Event& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PositionOpenedEvent>) {
          return "position_opened";
        } else if constexpr (std::is_same_v<T, PartialCloseEvent>) {
          return "partial_close";
        } else if constexpr (std::is_same_v<T, ScaleInEvent>) {
          return "scale_in";
        } else if constexpr (std::is_same_v<T, PositionClosedEvent>) {
          return "position_closed";
        } else if constexpr (std::is_same_v<T, ActionFailedEvent>) {
          return "action_failed";
        } else {
          return "entry_failed";
        }
      },
      event);
}

domain::StrategyId eventStrategy(const Event& event) {
  return std::visit(
      [](const auto& e) -> domain::StrategyId {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ActionFailedEvent> ||
                      std::is_same_v<T, EntryFailedEvent>) {
          return e.strategy_id;
        } else {
          return e.position.strategy_id;
        }
      },
      event);
}

}  // namespace sentinel
