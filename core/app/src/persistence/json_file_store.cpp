#include "sentinel/persistence/json_file_store.hpp"

#include "sentinel/common/errors.hpp"
#include "sentinel/persistence/record_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <system_error>

namespace sentinel {

namespace {

using nlohmann::json;

// Reads and validates the envelope. Returns the record array under
// `collection`, or an empty array when the file does not exist.
json readDocument(const std::filesystem::path& file,
                  const char* collection) {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    return json::array();
  }

  std::ifstream in(file);
  if (!in) {
    throw StorageCorruptionError("cannot open " + file.string());
  }

  json doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw StorageCorruptionError(file.string() + " is not a JSON object");
  }

  auto version = doc.find("schema_version");
  if (version == doc.end() || !version->is_number_integer()) {
    throw StorageCorruptionError(file.string() + " has no schema_version");
  }
  if (version->get<int>() > kSchemaVersion) {
    throw StorageCorruptionError(
        file.string() + " has schema_version " +
        std::to_string(version->get<int>()) + ", newest supported is " +
        std::to_string(kSchemaVersion));
  }

  auto records = doc.find(collection);
  if (records == doc.end()) {
    return json::array();
  }
  if (!records->is_array()) {
    throw StorageCorruptionError(file.string() + ": '" + collection +
                                 "' is not an array");
  }
  return *records;
}

void writeDocument(const std::filesystem::path& file, const json& doc) {
  const std::filesystem::path tmp = file.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw StorageWriteError("cannot open " + tmp.string() + " for writing");
    }
    out << doc.dump(2);
    out.flush();
    if (!out) {
      throw StorageWriteError("short write to " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, file, ec);
  if (ec) {
    throw StorageWriteError("rename " + tmp.string() + " -> " +
                            file.string() + ": " + ec.message());
  }
}

}  // namespace

JsonFileStore::JsonFileStore(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)),
      positions_file_(data_dir_ / "positions.json"),
      strategies_file_(data_dir_ / "strategies.json") {}

void JsonFileStore::open() {
  std::lock_guard lock(mutex_);

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    throw StorageCorruptionError("cannot create data directory " +
                                 data_dir_.string() + ": " + ec.message());
  }

  positions_.clear();
  strategies_.clear();
  loadPositionsLocked();
  loadStrategiesLocked();
  open_ = true;

  std::cout << "[JsonFileStore] Loaded " << positions_.size()
            << " position(s) and " << strategies_.size()
            << " strategy(ies) from " << data_dir_.string() << "\n";
}

void JsonFileStore::requireOpen() const {
  if (!open_) {
    throw StorageWriteError("store at " + data_dir_.string() +
                            " has not been opened");
  }
}

// -----------------------------------------------------------------------------
// loadPositionsLocked / loadStrategiesLocked
// -----------------------------------------------------------------------------
// Any decode failure inside a record (missing key, wrong type, unknown enum)
// is reported with the record index so an operator can find it in the file.
// -----------------------------------------------------------------------------
void JsonFileStore::loadPositionsLocked() {
  const json records = readDocument(positions_file_, "positions");
  for (std::size_t i = 0; i < records.size(); ++i) {
    domain::Position position;
    try {
      position = records[i].get<domain::Position>();
    } catch (const json::exception& e) {
      throw StorageCorruptionError(positions_file_.string() + " record " +
                                   std::to_string(i) + ": " + e.what());
    } catch (const InvalidInputError& e) {
      throw StorageCorruptionError(positions_file_.string() + " record " +
                                   std::to_string(i) + ": " + e.what());
    }
    if (position.amount_remaining < 0.0 ||
        position.amount_remaining > position.amount_total ||
        position.entry_price <= 0.0) {
      throw StorageCorruptionError(positions_file_.string() + " record " +
                                   std::to_string(i) +
                                   ": amounts or entry price out of range");
    }
    if (!positions_.emplace(position.id, std::move(position)).second) {
      throw StorageCorruptionError(positions_file_.string() +
                                   ": duplicate position id in record " +
                                   std::to_string(i));
    }
  }
}

void JsonFileStore::loadStrategiesLocked() {
  const json records = readDocument(strategies_file_, "strategies");
  for (std::size_t i = 0; i < records.size(); ++i) {
    domain::Strategy strategy;
    try {
      strategy = records[i].get<domain::Strategy>();
    } catch (const json::exception& e) {
      throw StorageCorruptionError(strategies_file_.string() + " record " +
                                   std::to_string(i) + ": " + e.what());
    } catch (const InvalidInputError& e) {
      throw StorageCorruptionError(strategies_file_.string() + " record " +
                                   std::to_string(i) + ": " + e.what());
    }
    if (!strategies_.emplace(strategy.id, std::move(strategy)).second) {
      throw StorageCorruptionError(strategies_file_.string() +
                                   ": duplicate strategy id in record " +
                                   std::to_string(i));
    }
  }
}

void JsonFileStore::writePositionsLocked() {
  json records = json::array();
  for (const auto& [id, position] : positions_) {
    records.push_back(position);
  }
  writeDocument(positions_file_,
                json{{"schema_version", kSchemaVersion},
                     {"positions", std::move(records)}});
}

void JsonFileStore::writeStrategiesLocked() {
  json records = json::array();
  for (const auto& [id, strategy] : strategies_) {
    records.push_back(strategy);
  }
  writeDocument(strategies_file_,
                json{{"schema_version", kSchemaVersion},
                     {"strategies", std::move(records)}});
}

void JsonFileStore::savePosition(const domain::Position& position) {
  std::lock_guard lock(mutex_);
  requireOpen();
  positions_[position.id] = position;
  writePositionsLocked();
}

std::optional<domain::Position> JsonFileStore::loadPosition(
    domain::PositionId id) {
  std::lock_guard lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> JsonFileStore::loadAllPositions() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [id, position] : positions_) {
    out.push_back(position);
  }
  return out;
}

void JsonFileStore::saveStrategy(const domain::Strategy& strategy) {
  std::lock_guard lock(mutex_);
  requireOpen();
  strategies_[strategy.id] = strategy;
  writeStrategiesLocked();
}

std::optional<domain::Strategy> JsonFileStore::loadStrategy(
    domain::StrategyId id) {
  std::lock_guard lock(mutex_);
  auto it = strategies_.find(id);
  if (it == strategies_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Strategy> JsonFileStore::loadAllStrategies() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Strategy> out;
  out.reserve(strategies_.size());
  for (const auto& [id, strategy] : strategies_) {
    out.push_back(strategy);
  }
  return out;
}

void JsonFileStore::removeStrategy(domain::StrategyId id) {
  std::lock_guard lock(mutex_);
  requireOpen();
  if (strategies_.erase(id) != 0) {
    writeStrategiesLocked();
  }
}

}  // namespace sentinel
