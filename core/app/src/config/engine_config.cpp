#include "sentinel/config/engine_config.hpp"

#include "sentinel/common/errors.hpp"
#include "sentinel/persistence/record_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace sentinel {

namespace {

using nlohmann::json;

template <typename T>
void overlay(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    it->get_to(out);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

void validate(const EngineConfig& config) {
  if (config.tick_interval_ms <= 0) {
    throw ConfigError("tick_interval_ms must be > 0");
  }
  if (config.max_concurrent_checks == 0) {
    throw ConfigError("max_concurrent_checks must be > 0");
  }
  if (config.price_cache_ttl_ms < 0) {
    throw ConfigError("price_cache_ttl_ms must be >= 0");
  }
  if (config.buy_slippage_percent < 0.0 ||
      config.sell_slippage_percent < 0.0 ||
      config.stop_loss_slippage_percent < 0.0) {
    throw ConfigError("slippage percents must be >= 0");
  }
  if (config.notifier_queue_capacity == 0) {
    throw ConfigError("notifier_queue_capacity must be > 0");
  }
  if (config.demo.trade_failure_rate < 0.0 ||
      config.demo.trade_failure_rate > 1.0) {
    throw ConfigError("demo.trade_failure_rate must be within [0, 1]");
  }
  if (config.demo.price_volatility_percent < 0.0) {
    throw ConfigError("demo.price_volatility_percent must be >= 0");
  }
}

}  // namespace

domain::ExitRules EngineConfig::defaultExitRules() {
  domain::ExitRules rules;
  rules.stop_loss_percent = 10.0;
  rules.take_profit_percent = 30.0;
  rules.partial_profit_levels = {
      {0, 30.0, 0.20, false},
      {1, 50.0, 0.30, false},
      {2, 100.0, 0.40, false},
  };
  return rules;
}

EngineConfig parseEngineConfig(const std::string& json_text) {
  json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    throw ConfigError("configuration is not a JSON object");
  }

  EngineConfig config;
  overlay(j, "tick_interval_ms", config.tick_interval_ms);
  overlay(j, "max_concurrent_checks", config.max_concurrent_checks);
  overlay(j, "max_action_retries", config.max_action_retries);
  overlay(j, "price_cache_ttl_ms", config.price_cache_ttl_ms);
  overlay(j, "price_change_log_percent", config.price_change_log_percent);
  overlay(j, "buy_slippage_percent", config.buy_slippage_percent);
  overlay(j, "sell_slippage_percent", config.sell_slippage_percent);
  overlay(j, "stop_loss_slippage_percent", config.stop_loss_slippage_percent);
  overlay(j, "executor_max_retries", config.executor_max_retries);
  overlay(j, "data_dir", config.data_dir);
  overlay(j, "notifier_queue_capacity", config.notifier_queue_capacity);
  overlay(j, "ipc_enabled", config.ipc_enabled);
  overlay(j, "ipc_cmd_endpoint", config.ipc_cmd_endpoint);
  overlay(j, "ipc_pub_endpoint", config.ipc_pub_endpoint);

  if (auto demo = j.find("demo"); demo != j.end() && !demo->is_null()) {
    if (!demo->is_object()) {
      throw ConfigError("config key 'demo' must be an object");
    }
    overlay(*demo, "seed", config.demo.seed);
    overlay(*demo, "price_volatility_percent",
            config.demo.price_volatility_percent);
    overlay(*demo, "trade_failure_rate", config.demo.trade_failure_rate);
  }

  if (auto rules = j.find("default_exit_rules");
      rules != j.end() && !rules->is_null()) {
    try {
      config.default_exit_rules = rules->get<domain::ExitRules>();
    } catch (const json::exception& e) {
      throw ConfigError(std::string("config key 'default_exit_rules': ") +
                        e.what());
    }
  }

  validate(config);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace sentinel
