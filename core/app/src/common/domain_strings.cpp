#include "sentinel/domain/position.hpp"
#include "sentinel/domain/position_status.hpp"

namespace sentinel {
namespace domain {

const char* toString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Open:            return "OPEN";
    case PositionStatus::PartiallyClosed: return "PARTIALLY_CLOSED";
    case PositionStatus::Closed:          return "CLOSED";
  }
  return "UNKNOWN";
}

const char* toString(ActionKind kind) {
  switch (kind) {
    case ActionKind::FullClose:    return "FULL_CLOSE";
    case ActionKind::PartialClose: return "PARTIAL_CLOSE";
    case ActionKind::ScaleIn:      return "SCALE_IN";
  }
  return "UNKNOWN";
}

const char* toString(CloseReason reason) {
  switch (reason) {
    case CloseReason::StopLoss:          return "STOP_LOSS";
    case CloseReason::MaxHold:           return "MAX_HOLD";
    case CloseReason::TakeProfit:        return "TAKE_PROFIT";
    case CloseReason::TrailingStop:      return "TRAILING_STOP";
    case CloseReason::PartialTakeProfit: return "PARTIAL_TAKE_PROFIT";
    case CloseReason::Manual:            return "MANUAL";
  }
  return "UNKNOWN";
}

const char* toString(Fill::Kind kind) {
  switch (kind) {
    case Fill::Kind::Entry:       return "ENTRY";
    case Fill::Kind::PartialSell: return "PARTIAL_SELL";
    case Fill::Kind::ScaleInBuy:  return "SCALE_IN_BUY";
    case Fill::Kind::ExitSell:    return "EXIT_SELL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace sentinel
