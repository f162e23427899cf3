#include "sentinel/notify/console_alert_sink.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>

namespace sentinel {

namespace {

std::string shortToken(const std::string& token_id) {
  if (token_id.size() <= 12) {
    return token_id;
  }
  return token_id.substr(0, 8) + "...";
}

}  // namespace

std::string formatAlert(const Event& event) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2);

  std::visit(
      [&os](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PositionOpenedEvent>) {
          os << "Opened #" << e.position.id << " "
             << shortToken(e.position.token_id) << " amount "
             << e.position.amount_total << " @ " << e.position.entry_price;
        } else if constexpr (std::is_same_v<T, PartialCloseEvent>) {
          os << "Partial take-profit #" << e.position.id << " level "
             << e.level_id << " sold " << e.amount_sold << " @ " << e.price
             << " (" << e.profit_percent << "%), remaining "
             << e.position.amount_remaining;
        } else if constexpr (std::is_same_v<T, ScaleInEvent>) {
          os << "Scale-in #" << e.position.id << " phase " << e.phase_number
             << " bought " << e.amount_bought << " @ " << e.price
             << ", cost basis now " << e.new_cost_basis;
        } else if constexpr (std::is_same_v<T, PositionClosedEvent>) {
          os << "Closed #" << e.position.id << " "
             << shortToken(e.position.token_id) << " "
             << domain::toString(e.reason) << " @ " << e.exit_price << " ("
             << e.profit_percent << "%)";
        } else if constexpr (std::is_same_v<T, ActionFailedEvent>) {
          os << "Action " << domain::toString(e.action) << " on #"
             << e.position_id << " failed after " << e.attempts
             << " attempts, manual intervention required: " << e.error;
        } else {
          os << "Entry into " << shortToken(e.token_id) << " for strategy "
             << e.strategy_id << " failed: " << e.error;
        }
      },
      event);
  return os.str();
}

EventBus::SubscriptionId attachConsoleAlerts(EventBus& bus, AlertFilter filter,
                                             std::ostream& out,
                                             std::ostream& err) {
  return bus.subscribe([filter = std::move(filter), &out,
                        &err](const Event& event) {
    if (filter && !filter(event)) {
      return;
    }
    const bool failure = std::holds_alternative<ActionFailedEvent>(event) ||
                         std::holds_alternative<EntryFailedEvent>(event);
    std::ostream& sink = failure ? err : out;
    sink << "[Alert] " << formatAlert(event) << "\n";
  });
}

}  // namespace sentinel
