#pragma once

#include "sentinel/domain/exit_rules.hpp"
#include "sentinel/domain/position.hpp"
#include "sentinel/domain/scale_in_plan.hpp"
#include "sentinel/domain/strategy.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sentinel {

// Version stamped into every persisted record and file.
inline constexpr int kSchemaVersion = 1;

namespace domain {

// -----------------------------------------------------------------------------
// nlohmann::json ADL hooks for the domain records
// -----------------------------------------------------------------------------
// Found by argument-dependent lookup, so `nlohmann::json j = position;` and
// `j.get<domain::Position>()` work anywhere the header is included.
//
// Encoding: snake_case keys matching the member names, enums as the strings
// returned by toString(), absent optionals as JSON null.
//
// Decoding is lenient about optional and defaulted fields (missing keys keep
// the struct default) and strict about required ones (id, token_id, prices,
// amounts). Required keys that are missing or mistyped raise
// nlohmann::json::exception; unknown enum strings raise InvalidInputError.
// Callers translate either into the error that fits their layer.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const TrailingStop& t);
void from_json(const nlohmann::json& j, TrailingStop& t);

void to_json(nlohmann::json& j, const PartialProfitLevel& l);
void from_json(const nlohmann::json& j, PartialProfitLevel& l);

void to_json(nlohmann::json& j, const ExitRules& r);
void from_json(const nlohmann::json& j, ExitRules& r);

void to_json(nlohmann::json& j, const ScaleInPhase& p);
void from_json(const nlohmann::json& j, ScaleInPhase& p);

void to_json(nlohmann::json& j, const ScaleInPlan& p);
void from_json(const nlohmann::json& j, ScaleInPlan& p);

void to_json(nlohmann::json& j, const Fill& f);
void from_json(const nlohmann::json& j, Fill& f);

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const StrategyLimits& l);
void from_json(const nlohmann::json& j, StrategyLimits& l);

void to_json(nlohmann::json& j, const StrategyNotifications& n);
void from_json(const nlohmann::json& j, StrategyNotifications& n);

void to_json(nlohmann::json& j, const StrategyStats& s);
void from_json(const nlohmann::json& j, StrategyStats& s);

void to_json(nlohmann::json& j, const Strategy& s);
void from_json(const nlohmann::json& j, Strategy& s);

// Inverse of toString(). Throw InvalidInputError on unknown input.
PositionStatus parsePositionStatus(const std::string& text);
ActionKind parseActionKind(const std::string& text);
CloseReason parseCloseReason(const std::string& text);
Fill::Kind parseFillKind(const std::string& text);

}  // namespace domain
}  // namespace sentinel
