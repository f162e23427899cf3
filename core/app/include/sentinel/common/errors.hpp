#pragma once

#include <stdexcept>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types raised across the engine. All derive from
//         SentinelError so a tick boundary can catch the whole family with a
//         single handler while still logging the concrete kind.
//
// @details
//   InvalidInputError       malformed request to the PositionManager or an
//                           evaluator precondition violation. Thrown before
//                           any state is touched.
//   PriceUnavailableError   the price oracle could not produce a usable
//                           price. The position is skipped for that tick.
//   TradeExecutionError     a buy/sell failed. The triggering condition is
//                           left unexecuted so the next tick re-evaluates it.
//   ConcurrencyViolation    an action was attempted while another is pending
//                           on the same position. Logged and dropped.
//   StorageCorruptionError  persisted records could not be decoded. The only
//                           error allowed to abort start-up.
//   StorageWriteError       a record could not be written. In-memory state
//                           stays authoritative; the next save retries.
//   ConfigError             configuration file is unreadable or mistyped.
// -----------------------------------------------------------------------------
class SentinelError : public std::runtime_error {
 public:
  explicit SentinelError(const std::string& message)
      : std::runtime_error(message) {}
};

class InvalidInputError : public SentinelError {
 public:
  using SentinelError::SentinelError;
};

class PriceUnavailableError : public SentinelError {
 public:
  using SentinelError::SentinelError;
};

class TradeExecutionError : public SentinelError {
 public:
  using SentinelError::SentinelError;
};

class ConcurrencyViolation : public SentinelError {
 public:
  using SentinelError::SentinelError;
};

class StorageCorruptionError : public SentinelError {
 public:
  using SentinelError::SentinelError;
};

class StorageWriteError : public SentinelError {
 public:
  using SentinelError::SentinelError;
};

class ConfigError : public SentinelError {
 public:
  using SentinelError::SentinelError;
};

}  // namespace sentinel
