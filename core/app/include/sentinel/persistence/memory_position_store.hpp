#pragma once

#include "sentinel/persistence/i_position_store.hpp"

#include <cstdint>
#include <map>
#include <mutex>

namespace sentinel {

// -----------------------------------------------------------------------------
// MemoryPositionStore — non-durable IPositionStore
// -----------------------------------------------------------------------------
// Backing store for tests and for runs without a data directory. Records are
// kept in id order. setFailWrites() makes every save throw StorageWriteError,
// which tests use to check that a failed write never rolls back a committed
// transition.
// -----------------------------------------------------------------------------
class MemoryPositionStore final : public IPositionStore {
 public:
  void savePosition(const domain::Position& position) override;
  std::optional<domain::Position> loadPosition(domain::PositionId id) override;
  std::vector<domain::Position> loadAllPositions() override;

  void saveStrategy(const domain::Strategy& strategy) override;
  std::optional<domain::Strategy> loadStrategy(domain::StrategyId id) override;
  std::vector<domain::Strategy> loadAllStrategies() override;
  void removeStrategy(domain::StrategyId id) override;

  void setFailWrites(bool fail);
  std::uint64_t positionWrites() const;

 private:
  mutable std::mutex mutex_;
  std::map<domain::PositionId, domain::Position> positions_;
  std::map<domain::StrategyId, domain::Strategy> strategies_;
  bool fail_writes_{false};
  std::uint64_t position_writes_{0};
};

}  // namespace sentinel
