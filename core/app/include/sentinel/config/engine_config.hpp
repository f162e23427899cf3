#pragma once

#include "sentinel/domain/exit_rules.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// DemoConfig — knobs for the simulated oracle and executor
// -----------------------------------------------------------------------------
struct DemoConfig {
  std::uint32_t seed{42};
  double price_volatility_percent{2.0};  // Random-walk step per price read
  double trade_failure_rate{0.0};        // [0, 1]
};

// -----------------------------------------------------------------------------
// EngineConfig — process-wide settings
// -----------------------------------------------------------------------------
//
// @brief  Everything the SentinelEngine needs to wire itself up.
//
// @details
// Plain value struct, copied into components at construction and constant
// for the engine's lifetime. Every field has a working default, so a missing
// config file yields a runnable demo engine.
//
// Slippage policy for sells mirrors how urgent the exit is: a stop-loss
// accepts up to stop_loss_slippage_percent and is sent at high priority,
// every other sell uses sell_slippage_percent.
//
// default_exit_rules is applied to positions opened through the OPEN command
// without explicit rules.
// -----------------------------------------------------------------------------
struct EngineConfig {
  // Monitoring loop
  std::int64_t tick_interval_ms{8000};
  std::size_t max_concurrent_checks{5};
  std::uint32_t max_action_retries{3};

  // Price oracle cache
  std::int64_t price_cache_ttl_ms{30000};
  double price_change_log_percent{1.0};

  // Trade execution
  double buy_slippage_percent{1.0};
  double sell_slippage_percent{2.0};
  double stop_loss_slippage_percent{5.0};
  std::uint32_t executor_max_retries{3};

  // Persistence. Empty data_dir keeps everything in memory.
  std::string data_dir{"data"};

  // Notifier
  std::size_t notifier_queue_capacity{1024};

  // IPC
  bool ipc_enabled{true};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  DemoConfig demo;

  domain::ExitRules default_exit_rules{defaultExitRules()};

  // Stop-loss 10%, take-profit 30%, partial ladder 30/20, 50/30, 100/40.
  static domain::ExitRules defaultExitRules();
};

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// Reads a JSON object and overlays it on the defaults. Unknown keys are
// ignored. Throws ConfigError if the file cannot be read, is not a JSON
// object, has a known key with the wrong type, or has an out-of-range value
// (non-positive tick interval, zero concurrency, negative slippage, failure
// rate outside [0, 1]).
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

// Same as loadEngineConfig() but from an in-memory JSON document.
EngineConfig parseEngineConfig(const std::string& json_text);

}  // namespace sentinel
