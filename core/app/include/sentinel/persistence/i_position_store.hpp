#pragma once

#include "sentinel/domain/position.hpp"
#include "sentinel/domain/strategy.hpp"

#include <optional>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// IPositionStore — durable record storage
// -----------------------------------------------------------------------------
//
// @brief  Keyed save/load of position and strategy records.
//
// @details
// save*() is an upsert by id. Closed positions are saved like any other and
// are never deleted, so getPosition() can still answer for them after they
// leave the PositionManager's active set.
//
// Errors:
//   save*()  throws StorageWriteError when the record could not be written.
//   load*()  throws StorageCorruptionError when stored data cannot be
//            decoded.
//
// Thread model:
//   Implementations serialize access internally; the PositionManager and the
//   StrategyBook call in from monitor workers and the IPC thread.
// -----------------------------------------------------------------------------
class IPositionStore {
 public:
  virtual ~IPositionStore() = default;

  virtual void savePosition(const domain::Position& position) = 0;
  virtual std::optional<domain::Position> loadPosition(
      domain::PositionId id) = 0;
  virtual std::vector<domain::Position> loadAllPositions() = 0;

  virtual void saveStrategy(const domain::Strategy& strategy) = 0;
  virtual std::optional<domain::Strategy> loadStrategy(
      domain::StrategyId id) = 0;
  virtual std::vector<domain::Strategy> loadAllStrategies() = 0;
  virtual void removeStrategy(domain::StrategyId id) = 0;
};

}  // namespace sentinel
