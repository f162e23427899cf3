#pragma once

#include "sentinel/persistence/i_position_store.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// JsonFileStore — IPositionStore backed by two JSON documents
// -----------------------------------------------------------------------------
//
// @brief  Persists positions to <data_dir>/positions.json and strategies to
//         <data_dir>/strategies.json.
//
// @details
// File layout:
//   { "schema_version": 1, "positions": [ <Position>, ... ] }
//   { "schema_version": 1, "strategies": [ <Strategy>, ... ] }
//
// open() creates data_dir if needed and loads both files into an in-memory
// mirror. A missing file is an empty collection. Anything else that does not
// decode (bad JSON, a newer schema_version, a record with a missing required
// field, duplicate ids) throws StorageCorruptionError, and the store stays
// unusable.
//
// Every save rewrites the whole affected document: the mirror is serialized
// to "<file>.tmp" and renamed over the original, so a crash mid-write leaves
// the previous version intact. Record counts are small (a handful of
// strategies, tens to hundreds of positions) so the rewrite is cheap.
//
// Thread model:
//   One mutex serializes all access, including file I/O.
// -----------------------------------------------------------------------------
class JsonFileStore final : public IPositionStore {
 public:
  explicit JsonFileStore(std::filesystem::path data_dir);

  JsonFileStore(const JsonFileStore&) = delete;
  JsonFileStore& operator=(const JsonFileStore&) = delete;

  // Loads both documents. Throws StorageCorruptionError.
  void open();

  void savePosition(const domain::Position& position) override;
  std::optional<domain::Position> loadPosition(domain::PositionId id) override;
  std::vector<domain::Position> loadAllPositions() override;

  void saveStrategy(const domain::Strategy& strategy) override;
  std::optional<domain::Strategy> loadStrategy(domain::StrategyId id) override;
  std::vector<domain::Strategy> loadAllStrategies() override;
  void removeStrategy(domain::StrategyId id) override;

  const std::filesystem::path& positionsFile() const { return positions_file_; }
  const std::filesystem::path& strategiesFile() const {
    return strategies_file_;
  }

 private:
  void requireOpen() const;
  void loadPositionsLocked();
  void loadStrategiesLocked();
  void writePositionsLocked();
  void writeStrategiesLocked();

  const std::filesystem::path data_dir_;
  const std::filesystem::path positions_file_;
  const std::filesystem::path strategies_file_;

  mutable std::mutex mutex_;
  bool open_{false};
  std::map<domain::PositionId, domain::Position> positions_;
  std::map<domain::StrategyId, domain::Strategy> strategies_;
};

}  // namespace sentinel
