#include "sentinel/events/event_json.hpp"

#include "sentinel/persistence/record_codec.hpp"

#include <type_traits>

namespace sentinel {

nlohmann::json eventToJson(const Event& event) {
  nlohmann::json j;
  j["type"] = eventName(event);

  std::visit(
      [&j](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        j["timestamp_ms"] = e.timestamp_ms;
        if constexpr (std::is_same_v<T, PositionOpenedEvent>) {
          j["position"] = e.position;
        } else if constexpr (std::is_same_v<T, PartialCloseEvent>) {
          j["position"] = e.position;
          j["level_id"] = e.level_id;
          j["fraction"] = e.fraction;
          j["amount_sold"] = e.amount_sold;
          j["quote_received"] = e.quote_received;
          j["price"] = e.price;
          j["profit_percent"] = e.profit_percent;
          j["realized_quote"] = e.realized_quote;
        } else if constexpr (std::is_same_v<T, ScaleInEvent>) {
          j["position"] = e.position;
          j["phase_number"] = e.phase_number;
          j["quote_spent"] = e.quote_spent;
          j["amount_bought"] = e.amount_bought;
          j["price"] = e.price;
          j["new_cost_basis"] = e.new_cost_basis;
        } else if constexpr (std::is_same_v<T, PositionClosedEvent>) {
          j["position"] = e.position;
          j["reason"] = domain::toString(e.reason);
          j["exit_price"] = e.exit_price;
          j["profit_percent"] = e.profit_percent;
          j["quote_received"] = e.quote_received;
          j["realized_quote"] = e.realized_quote;
        } else if constexpr (std::is_same_v<T, ActionFailedEvent>) {
          j["position_id"] = e.position_id;
          j["token_id"] = e.token_id;
          j["strategy_id"] = e.strategy_id;
          j["action"] = domain::toString(e.action);
          j["attempts"] = e.attempts;
          j["error"] = e.error;
        } else {
          j["strategy_id"] = e.strategy_id;
          j["token_id"] = e.token_id;
          j["quote_amount"] = e.quote_amount;
          j["error"] = e.error;
        }
      },
      event);
  return j;
}

}  // namespace sentinel
