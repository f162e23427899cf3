#include "sentinel/persistence/memory_position_store.hpp"

#include "sentinel/common/errors.hpp"

#include <string>

namespace sentinel {

void MemoryPositionStore::savePosition(const domain::Position& position) {
  std::lock_guard lock(mutex_);
  if (fail_writes_) {
    throw StorageWriteError("write refused for position " +
                            std::to_string(position.id));
  }
  positions_[position.id] = position;
  ++position_writes_;
}

std::optional<domain::Position> MemoryPositionStore::loadPosition(
    domain::PositionId id) {
  std::lock_guard lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> MemoryPositionStore::loadAllPositions() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [id, position] : positions_) {
    out.push_back(position);
  }
  return out;
}

void MemoryPositionStore::saveStrategy(const domain::Strategy& strategy) {
  std::lock_guard lock(mutex_);
  if (fail_writes_) {
    throw StorageWriteError("write refused for strategy " +
                            std::to_string(strategy.id));
  }
  strategies_[strategy.id] = strategy;
}

std::optional<domain::Strategy> MemoryPositionStore::loadStrategy(
    domain::StrategyId id) {
  std::lock_guard lock(mutex_);
  auto it = strategies_.find(id);
  if (it == strategies_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Strategy> MemoryPositionStore::loadAllStrategies() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Strategy> out;
  out.reserve(strategies_.size());
  for (const auto& [id, strategy] : strategies_) {
    out.push_back(strategy);
  }
  return out;
}

void MemoryPositionStore::removeStrategy(domain::StrategyId id) {
  std::lock_guard lock(mutex_);
  strategies_.erase(id);
}

void MemoryPositionStore::setFailWrites(bool fail) {
  std::lock_guard lock(mutex_);
  fail_writes_ = fail;
}

std::uint64_t MemoryPositionStore::positionWrites() const {
  std::lock_guard lock(mutex_);
  return position_writes_;
}

}  // namespace sentinel
