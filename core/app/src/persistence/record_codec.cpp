#include "sentinel/persistence/record_codec.hpp"

#include "sentinel/common/errors.hpp"

#include <optional>

namespace sentinel {
namespace domain {

namespace {

using nlohmann::json;

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  if (value.has_value()) {
    return json(*value);
  }
  return json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

template <typename T>
void readIfPresent(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    it->get_to(out);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Enum parsing
// -----------------------------------------------------------------------------
PositionStatus parsePositionStatus(const std::string& text) {
  if (text == "OPEN") return PositionStatus::Open;
  if (text == "PARTIALLY_CLOSED") return PositionStatus::PartiallyClosed;
  if (text == "CLOSED") return PositionStatus::Closed;
  throw InvalidInputError("unknown position status '" + text + "'");
}

ActionKind parseActionKind(const std::string& text) {
  if (text == "FULL_CLOSE") return ActionKind::FullClose;
  if (text == "PARTIAL_CLOSE") return ActionKind::PartialClose;
  if (text == "SCALE_IN") return ActionKind::ScaleIn;
  throw InvalidInputError("unknown action kind '" + text + "'");
}

CloseReason parseCloseReason(const std::string& text) {
  if (text == "STOP_LOSS") return CloseReason::StopLoss;
  if (text == "MAX_HOLD") return CloseReason::MaxHold;
  if (text == "TAKE_PROFIT") return CloseReason::TakeProfit;
  if (text == "TRAILING_STOP") return CloseReason::TrailingStop;
  if (text == "PARTIAL_TAKE_PROFIT") return CloseReason::PartialTakeProfit;
  if (text == "MANUAL") return CloseReason::Manual;
  throw InvalidInputError("unknown close reason '" + text + "'");
}

Fill::Kind parseFillKind(const std::string& text) {
  if (text == "ENTRY") return Fill::Kind::Entry;
  if (text == "PARTIAL_SELL") return Fill::Kind::PartialSell;
  if (text == "SCALE_IN_BUY") return Fill::Kind::ScaleInBuy;
  if (text == "EXIT_SELL") return Fill::Kind::ExitSell;
  throw InvalidInputError("unknown fill kind '" + text + "'");
}

// -----------------------------------------------------------------------------
// Exit rules
// -----------------------------------------------------------------------------
void to_json(json& j, const TrailingStop& t) {
  j = json{{"enabled", t.enabled},
           {"trigger_percent", t.trigger_percent},
           {"distance_percent", t.distance_percent}};
}

void from_json(const json& j, TrailingStop& t) {
  readIfPresent(j, "enabled", t.enabled);
  readIfPresent(j, "trigger_percent", t.trigger_percent);
  readIfPresent(j, "distance_percent", t.distance_percent);
}

void to_json(json& j, const PartialProfitLevel& l) {
  j = json{{"level_id", l.level_id},
           {"threshold_percent", l.threshold_percent},
           {"sell_fraction", l.sell_fraction},
           {"executed", l.executed}};
}

void from_json(const json& j, PartialProfitLevel& l) {
  readIfPresent(j, "level_id", l.level_id);
  j.at("threshold_percent").get_to(l.threshold_percent);
  j.at("sell_fraction").get_to(l.sell_fraction);
  readIfPresent(j, "executed", l.executed);
}

void to_json(json& j, const ExitRules& r) {
  j = json{{"stop_loss_percent", optionalToJson(r.stop_loss_percent)},
           {"take_profit_percent", optionalToJson(r.take_profit_percent)},
           {"trailing_stop", r.trailing_stop},
           {"partial_profit_levels", r.partial_profit_levels},
           {"max_hold_time_seconds", optionalToJson(r.max_hold_time_seconds)}};
}

void from_json(const json& j, ExitRules& r) {
  r.stop_loss_percent = optionalFromJson<double>(j, "stop_loss_percent");
  r.take_profit_percent = optionalFromJson<double>(j, "take_profit_percent");
  readIfPresent(j, "trailing_stop", r.trailing_stop);
  readIfPresent(j, "partial_profit_levels", r.partial_profit_levels);
  r.max_hold_time_seconds =
      optionalFromJson<std::int64_t>(j, "max_hold_time_seconds");
}

// -----------------------------------------------------------------------------
// Scale-in plan
// -----------------------------------------------------------------------------
void to_json(json& j, const ScaleInPhase& p) {
  j = json{{"phase_number", p.phase_number},
           {"trigger_drop_percent", p.trigger_drop_percent},
           {"size_fraction", p.size_fraction},
           {"executed", p.executed},
           {"executed_at_ms", optionalToJson(p.executed_at_ms)}};
}

void from_json(const json& j, ScaleInPhase& p) {
  readIfPresent(j, "phase_number", p.phase_number);
  j.at("trigger_drop_percent").get_to(p.trigger_drop_percent);
  j.at("size_fraction").get_to(p.size_fraction);
  readIfPresent(j, "executed", p.executed);
  p.executed_at_ms = optionalFromJson<std::int64_t>(j, "executed_at_ms");
}

void to_json(json& j, const ScaleInPlan& p) {
  j = json{{"enabled", p.enabled},
           {"phases", p.phases},
           {"current_phase", p.current_phase}};
}

void from_json(const json& j, ScaleInPlan& p) {
  p.enabled = j.value("enabled", true);
  readIfPresent(j, "phases", p.phases);
  readIfPresent(j, "current_phase", p.current_phase);
}

// -----------------------------------------------------------------------------
// Fill / Position
// -----------------------------------------------------------------------------
void to_json(json& j, const Fill& f) {
  j = json{{"kind", toString(f.kind)},
           {"amount_base", f.amount_base},
           {"amount_quote", f.amount_quote},
           {"price", f.price},
           {"tx_ref", f.tx_ref},
           {"reason", f.reason},
           {"timestamp_ms", f.timestamp_ms}};
}

void from_json(const json& j, Fill& f) {
  f.kind = parseFillKind(j.at("kind").get<std::string>());
  j.at("amount_base").get_to(f.amount_base);
  j.at("amount_quote").get_to(f.amount_quote);
  j.at("price").get_to(f.price);
  readIfPresent(j, "tx_ref", f.tx_ref);
  readIfPresent(j, "reason", f.reason);
  readIfPresent(j, "timestamp_ms", f.timestamp_ms);
}

void to_json(json& j, const Position& p) {
  j = json{
      {"schema_version", kSchemaVersion},
      {"id", p.id},
      {"token_id", p.token_id},
      {"entry_price", p.entry_price},
      {"entry_timestamp_ms", p.entry_timestamp_ms},
      {"strategy_id", p.strategy_id},
      {"quote_budget", p.quote_budget},
      {"amount_total", p.amount_total},
      {"amount_remaining", p.amount_remaining},
      {"cost_basis", p.cost_basis},
      {"current_price", p.current_price},
      {"highest_price", p.highest_price},
      {"last_checked_ms", p.last_checked_ms},
      {"status", toString(p.status)},
      {"exit_rules", p.exit_rules},
      {"pending_action", p.pending_action
                             ? json(toString(*p.pending_action))
                             : json(nullptr)},
      {"needs_manual_intervention", p.needs_manual_intervention},
      {"last_error", p.last_error},
      {"fills", p.fills},
      {"exit_price", optionalToJson(p.exit_price)},
      {"close_reason", p.close_reason ? json(toString(*p.close_reason))
                                      : json(nullptr)},
      {"closed_at_ms", optionalToJson(p.closed_at_ms)},
      {"realized_profit_percent", optionalToJson(p.realized_profit_percent)},
  };
  j["scale_in_plan"] =
      p.scale_in_plan ? json(*p.scale_in_plan) : json(nullptr);
}

// pending_action is never restored. A record written while an action was in
// flight describes a trade that did not complete in this process.
void from_json(const json& j, Position& p) {
  j.at("id").get_to(p.id);
  j.at("token_id").get_to(p.token_id);
  j.at("entry_price").get_to(p.entry_price);
  j.at("entry_timestamp_ms").get_to(p.entry_timestamp_ms);
  readIfPresent(j, "strategy_id", p.strategy_id);
  readIfPresent(j, "quote_budget", p.quote_budget);
  j.at("amount_total").get_to(p.amount_total);
  j.at("amount_remaining").get_to(p.amount_remaining);
  p.cost_basis = j.value("cost_basis", p.entry_price);
  readIfPresent(j, "current_price", p.current_price);
  p.highest_price = j.value("highest_price", p.entry_price);
  readIfPresent(j, "last_checked_ms", p.last_checked_ms);
  p.status = parsePositionStatus(j.at("status").get<std::string>());
  readIfPresent(j, "exit_rules", p.exit_rules);
  p.scale_in_plan = optionalFromJson<ScaleInPlan>(j, "scale_in_plan");
  p.pending_action.reset();
  readIfPresent(j, "needs_manual_intervention", p.needs_manual_intervention);
  readIfPresent(j, "last_error", p.last_error);
  readIfPresent(j, "fills", p.fills);
  p.exit_price = optionalFromJson<double>(j, "exit_price");
  if (auto reason = optionalFromJson<std::string>(j, "close_reason")) {
    p.close_reason = parseCloseReason(*reason);
  }
  p.closed_at_ms = optionalFromJson<std::int64_t>(j, "closed_at_ms");
  p.realized_profit_percent =
      optionalFromJson<double>(j, "realized_profit_percent");
}

// -----------------------------------------------------------------------------
// Strategy
// -----------------------------------------------------------------------------
void to_json(json& j, const StrategyLimits& l) {
  j = json{{"max_concurrent_positions", l.max_concurrent_positions},
           {"max_position_size", l.max_position_size},
           {"total_budget", l.total_budget}};
}

void from_json(const json& j, StrategyLimits& l) {
  readIfPresent(j, "max_concurrent_positions", l.max_concurrent_positions);
  readIfPresent(j, "max_position_size", l.max_position_size);
  readIfPresent(j, "total_budget", l.total_budget);
}

void to_json(json& j, const StrategyNotifications& n) {
  j = json{{"on_entry", n.on_entry},
           {"on_exit", n.on_exit},
           {"on_error", n.on_error}};
}

void from_json(const json& j, StrategyNotifications& n) {
  readIfPresent(j, "on_entry", n.on_entry);
  readIfPresent(j, "on_exit", n.on_exit);
  readIfPresent(j, "on_error", n.on_error);
}

void to_json(json& j, const StrategyStats& s) {
  j = json{{"total_trades", s.total_trades},
           {"successful_trades", s.successful_trades},
           {"failed_trades", s.failed_trades},
           {"realized_profit", s.realized_profit}};
}

void from_json(const json& j, StrategyStats& s) {
  readIfPresent(j, "total_trades", s.total_trades);
  readIfPresent(j, "successful_trades", s.successful_trades);
  readIfPresent(j, "failed_trades", s.failed_trades);
  readIfPresent(j, "realized_profit", s.realized_profit);
}

void to_json(json& j, const Strategy& s) {
  j = json{{"schema_version", kSchemaVersion},
           {"id", s.id},
           {"name", s.name},
           {"enabled", s.enabled},
           {"limits", s.limits},
           {"exit_rules", s.exit_rules},
           {"notifications", s.notifications},
           {"stats", s.stats},
           {"created_at_ms", s.created_at_ms},
           {"last_run_ms", optionalToJson(s.last_run_ms)}};
  j["scale_in_plan"] =
      s.scale_in_plan ? json(*s.scale_in_plan) : json(nullptr);
}

void from_json(const json& j, Strategy& s) {
  readIfPresent(j, "id", s.id);
  j.at("name").get_to(s.name);
  readIfPresent(j, "enabled", s.enabled);
  readIfPresent(j, "limits", s.limits);
  readIfPresent(j, "exit_rules", s.exit_rules);
  s.scale_in_plan = optionalFromJson<ScaleInPlan>(j, "scale_in_plan");
  readIfPresent(j, "notifications", s.notifications);
  readIfPresent(j, "stats", s.stats);
  readIfPresent(j, "created_at_ms", s.created_at_ms);
  s.last_run_ms = optionalFromJson<std::int64_t>(j, "last_run_ms");
}

}  // namespace domain
}  // namespace sentinel
