#pragma once

#include "sentinel/config/engine_config.hpp"
#include "sentinel/engine/entry_executor.hpp"
#include "sentinel/engine/position_manager.hpp"
#include "sentinel/engine/position_monitor.hpp"
#include "sentinel/engine/strategy_book.hpp"
#include "sentinel/eventbus/event_bus.hpp"
#include "sentinel/execution/i_trade_executor.hpp"
#include "sentinel/network/ipc_server.hpp"
#include "sentinel/notify/async_notifier.hpp"
#include "sentinel/oracle/caching_price_oracle.hpp"
#include "sentinel/oracle/i_price_oracle.hpp"
#include "sentinel/oracle/simulated_price_oracle.hpp"
#include "sentinel/persistence/i_position_store.hpp"
#include "sentinel/persistence/json_file_store.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// EngineOverrides — externally owned collaborators
// -----------------------------------------------------------------------------
// Any pointer left null is replaced by the engine's own implementation:
//   oracle    SimulatedPriceOracle seeded from EngineConfig::demo
//   executor  SimulatedTradeExecutor filling at the (cached) oracle price
//   store     JsonFileStore under data_dir, or MemoryPositionStore when
//             data_dir is empty
//   clock     LiveTimeProvider
// Non-null pointers must outlive the engine.
// -----------------------------------------------------------------------------
struct EngineOverrides {
  IPriceOracle* oracle{nullptr};
  ITradeExecutor* executor{nullptr};
  IPositionStore* store{nullptr};
  const ITimeProvider* clock{nullptr};
  std::ostream* alert_out{nullptr};  // Defaults to std::cout
  std::ostream* alert_err{nullptr};  // Defaults to std::cerr
};

// -----------------------------------------------------------------------------
// SentinelEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root: owns and wires every component, exposes the
//         lifecycle (start/stop) and the JSON command surface.
//
// @details
// Thread layout while running:
//
//   monitor thread      PositionMonitor scheduler, std::async batches for
//                       per-position checks
//   notifier thread     AsyncNotifier worker, runs the event bus
//                       subscribers (console alerts, strategy statistics,
//                       IPC telemetry)
//   ipc thread          IpcServer REP/PUB loop, calls executeCommand()
//   main thread         start(), wait for shutdown, stop()
//
// Event bus subscribers (wired in start()):
//   1. Console alerts filtered by StrategyBook::wantsAlert.
//   2. StrategyBook realized-profit accounting.
//   3. IPC telemetry (every event), when IPC is enabled.
//
// Ownership:
//   SentinelEngine
//    ├── config_            (EngineConfig, value member)
//    ├── owned_clock_       (unique_ptr<ITimeProvider>, unless overridden)
//    ├── demo_oracle_       (unique_ptr<SimulatedPriceOracle>, unless
//    │                       overridden)
//    ├── price_cache_       (unique_ptr<CachingPriceOracle>)
//    ├── owned_executor_    (unique_ptr<ITradeExecutor>, unless overridden)
//    ├── file_store_ / owned_store_
//    ├── notifier_          (unique_ptr<AsyncNotifier>)
//    ├── manager_, strategies_, entries_, monitor_
//    └── ipc_server_        (unique_ptr<IpcServer>, only when IPC enabled)
//
// Members are declared in dependency order so the implicit destruction
// order tears consumers down before the components they reference.
//
// The engine is single-shot: once stopped it cannot be started again.
// -----------------------------------------------------------------------------
class SentinelEngine {
 public:
  explicit SentinelEngine(EngineConfig config, EngineOverrides overrides = {});
  ~SentinelEngine();

  SentinelEngine(const SentinelEngine&) = delete;
  SentinelEngine& operator=(const SentinelEngine&) = delete;
  SentinelEngine(SentinelEngine&&) = delete;
  SentinelEngine& operator=(SentinelEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Startup sequence:
  //   1. Open the file store (StorageCorruptionError propagates).
  //   2. Hydrate open positions and load strategies.
  //   3. Wire event bus subscribers and start the notifier.
  //   4. Start the IPC server (zmq::error_t from bind propagates).
  //   5. Start the monitor LAST, so every subscriber is live before the
  //      first tick can emit anything.
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Stops monitor, IPC and notifier in that order, flushing queued alerts.
  // Idempotent.
  void stop();

  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one operator command and returns a JSON reply.
  //
  // @details
  // `cmd` is either a bare command name ("PING") or a JSON object with a
  // "cmd" field and arguments:
  //
  //   PING                                   {"response":"PONG"}
  //   STATUS                                 engine / monitor / notifier state
  //   POSITIONS {all?, token?}               open positions (all: every record)
  //   POSITION {id}
  //   OPEN {token, price, amount, rules?, scale_in?}
  //                                          register an already bought
  //                                          position
  //   OPEN {token, quote, rules?, scale_in?} buy `quote` and register
  //   OPEN_FOR_STRATEGY {strategy_id, token}
  //   CLOSE {id, price?}                     manual full close; price
  //                                          defaults to the oracle price
  //   RESUME {id}
  //   STRATEGIES
  //   CREATE_STRATEGY {strategy}
  //   UPDATE_STRATEGY {id, name?, enabled?, limits?, exit_rules?,
  //                    scale_in_plan?, notifications?}
  //   SET_STRATEGY_ENABLED {id, enabled}
  //   DELETE_STRATEGY {id}
  //   STATS                                  strategy performance + counters
  //   TICK                                   run one monitor tick now
  //
  // Every reply carries "status": "ok" or "error". SentinelError and JSON
  // errors become {"status":"error","error":...}.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  PositionManager& positions() { return *manager_; }
  StrategyBook& strategies() { return *strategies_; }
  EntryExecutor& entries() { return *entries_; }
  PositionMonitor& monitor() { return *monitor_; }
  AsyncNotifier& notifier() { return *notifier_; }
  EventBus& eventBus() { return notifier_->bus(); }
  const EngineConfig& config() const { return config_; }

  // Null when the oracle was overridden.
  SimulatedPriceOracle* demoOracle() { return demo_oracle_.get(); }

 private:
  nlohmann::json dispatch(const std::string& name, const nlohmann::json& args);

  nlohmann::json statusJson() const;
  nlohmann::json statsJson() const;
  nlohmann::json openCommand(const nlohmann::json& args);
  nlohmann::json closeCommand(const nlohmann::json& args);
  nlohmann::json createStrategyCommand(const nlohmann::json& args);
  nlohmann::json updateStrategyCommand(const nlohmann::json& args);

  void wireSubscribers();
  void unwireSubscribers();

  EngineConfig config_;
  std::ostream& alert_out_;
  std::ostream& alert_err_;

  std::unique_ptr<ITimeProvider> owned_clock_;
  const ITimeProvider& clock_;

  std::unique_ptr<SimulatedPriceOracle> demo_oracle_;
  IPriceOracle& upstream_oracle_;
  std::unique_ptr<CachingPriceOracle> price_cache_;

  std::unique_ptr<ITradeExecutor> owned_executor_;
  ITradeExecutor& executor_;

  std::unique_ptr<JsonFileStore> file_store_;
  std::unique_ptr<IPositionStore> owned_store_;
  IPositionStore& store_;

  std::unique_ptr<AsyncNotifier> notifier_;
  std::unique_ptr<PositionManager> manager_;
  std::unique_ptr<StrategyBook> strategies_;
  std::unique_ptr<EntryExecutor> entries_;
  std::unique_ptr<PositionMonitor> monitor_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
  bool running_{false};
  bool stopped_{false};
};

}  // namespace sentinel
