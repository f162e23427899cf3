#include "sentinel/engine/sentinel_engine.hpp"

#include "sentinel/common/errors.hpp"
#include "sentinel/engine/rule_validation.hpp"
#include "sentinel/execution/simulated_trade_executor.hpp"
#include "sentinel/notify/console_alert_sink.hpp"
#include "sentinel/persistence/memory_position_store.hpp"
#include "sentinel/persistence/record_codec.hpp"
#include "sentinel/time/live_time_provider.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <utility>

namespace sentinel {

using nlohmann::json;

namespace {

constexpr auto kShutdownFlushTimeout = std::chrono::milliseconds(2000);

std::unique_ptr<ITimeProvider> makeClock(const EngineOverrides& overrides) {
  if (overrides.clock != nullptr) {
    return nullptr;
  }
  return std::make_unique<LiveTimeProvider>();
}

std::unique_ptr<SimulatedPriceOracle> makeDemoOracle(
    const EngineOverrides& overrides, const DemoConfig& demo) {
  if (overrides.oracle != nullptr) {
    return nullptr;
  }
  return std::make_unique<SimulatedPriceOracle>(demo.seed,
                                                demo.price_volatility_percent);
}

std::unique_ptr<ITradeExecutor> makeExecutor(const EngineOverrides& overrides,
                                             IPriceOracle& oracle,
                                             const ITimeProvider& clock,
                                             const DemoConfig& demo) {
  if (overrides.executor != nullptr) {
    return nullptr;
  }
  return std::make_unique<SimulatedTradeExecutor>(oracle, clock, demo.seed + 1,
                                                  demo.trade_failure_rate);
}

std::unique_ptr<JsonFileStore> makeFileStore(const EngineOverrides& overrides,
                                             const EngineConfig& config) {
  if (overrides.store != nullptr || config.data_dir.empty()) {
    return nullptr;
  }
  return std::make_unique<JsonFileStore>(config.data_dir);
}

std::unique_ptr<IPositionStore> makeMemoryStore(
    const EngineOverrides& overrides, const EngineConfig& config) {
  if (overrides.store != nullptr || !config.data_dir.empty()) {
    return nullptr;
  }
  return std::make_unique<MemoryPositionStore>();
}

ExecutionPolicy policyFrom(const EngineConfig& config) {
  ExecutionPolicy policy;
  policy.buy_slippage_percent = config.buy_slippage_percent;
  policy.sell_slippage_percent = config.sell_slippage_percent;
  policy.stop_loss_slippage_percent = config.stop_loss_slippage_percent;
  policy.executor_max_retries = config.executor_max_retries;
  policy.max_action_retries = config.max_action_retries;
  return policy;
}

MonitorOptions monitorOptionsFrom(const EngineConfig& config) {
  MonitorOptions options;
  options.tick_interval_ms = config.tick_interval_ms;
  options.max_concurrent_checks = config.max_concurrent_checks;
  return options;
}

json ok() { return json{{"status", "ok"}}; }

json positionsToJson(const std::vector<domain::Position>& positions) {
  json out = json::array();
  for (const auto& position : positions) {
    out.push_back(position);
  }
  return out;
}

json tickToJson(const TickReport& report) {
  return json{{"checked", report.checked},
              {"skipped", report.skipped},
              {"price_failures", report.price_failures},
              {"errors", report.errors},
              {"applied", report.applied},
              {"failed", report.failed},
              {"dropped", report.dropped}};
}

// Rules from the request, else the configured defaults.
domain::ExitRules rulesArg(const json& args, const domain::ExitRules& fallback) {
  if (args.contains("rules") && !args.at("rules").is_null()) {
    return args.at("rules").get<domain::ExitRules>();
  }
  return fallback;
}

std::optional<domain::ScaleInPlan> planArg(const json& args) {
  if (args.contains("scale_in") && !args.at("scale_in").is_null()) {
    return args.at("scale_in").get<domain::ScaleInPlan>();
  }
  return std::nullopt;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the component graph, nothing runs yet
// -----------------------------------------------------------------------------
SentinelEngine::SentinelEngine(EngineConfig config, EngineOverrides overrides)
    : config_(std::move(config)),
      alert_out_(overrides.alert_out ? *overrides.alert_out : std::cout),
      alert_err_(overrides.alert_err ? *overrides.alert_err : std::cerr),
      owned_clock_(makeClock(overrides)),
      clock_(overrides.clock ? *overrides.clock : *owned_clock_),
      demo_oracle_(makeDemoOracle(overrides, config_.demo)),
      upstream_oracle_(overrides.oracle ? *overrides.oracle : *demo_oracle_),
      price_cache_(std::make_unique<CachingPriceOracle>(
          upstream_oracle_, clock_, config_.price_cache_ttl_ms,
          config_.price_change_log_percent)),
      owned_executor_(
          makeExecutor(overrides, *price_cache_, clock_, config_.demo)),
      executor_(overrides.executor ? *overrides.executor : *owned_executor_),
      file_store_(makeFileStore(overrides, config_)),
      owned_store_(makeMemoryStore(overrides, config_)),
      store_(overrides.store ? *overrides.store
             : file_store_   ? static_cast<IPositionStore&>(*file_store_)
                             : *owned_store_) {
  try {
    validateExitRules(config_.default_exit_rules);
  } catch (const InvalidInputError& e) {
    throw ConfigError(std::string("default_exit_rules: ") + e.what());
  }

  notifier_ = std::make_unique<AsyncNotifier>(config_.notifier_queue_capacity);
  manager_ = std::make_unique<PositionManager>(executor_, store_, *notifier_,
                                               clock_, policyFrom(config_));
  strategies_ = std::make_unique<StrategyBook>(store_, clock_);
  entries_ = std::make_unique<EntryExecutor>(*manager_, *strategies_,
                                             executor_, *price_cache_,
                                             *notifier_, clock_);
  monitor_ = std::make_unique<PositionMonitor>(
      *manager_, *price_cache_, clock_, monitorOptionsFrom(config_));
}

SentinelEngine::~SentinelEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SentinelEngine::start() {
  if (running_) {
    return;
  }
  if (stopped_) {
    throw SentinelError("engine cannot be restarted after stop()");
  }

  // ---  1) Open persistent storage ------------------------------------------
  if (file_store_) {
    file_store_->open();
  }

  // ---  2) Restore state ----------------------------------------------------
  const std::size_t positions = manager_->hydrate();
  const std::size_t strategies = strategies_->load();

  // ---  3) Subscribers first, then the notifier worker ----------------------
  if (config_.ipc_enabled) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
  }
  wireSubscribers();
  notifier_->start();

  // ---  4) IPC. A bind failure unwinds step 3 and propagates. ------------
  if (ipc_server_) {
    try {
      ipc_server_->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[SentinelEngine] IPC bind failed: " << e.what() << "\n";
      notifier_->stop();
      unwireSubscribers();
      ipc_server_.reset();
      stopped_ = true;
      throw;
    }
  }

  // ---  5) Monitor LAST -----------------------------------------------------
  monitor_->start();

  running_ = true;
  std::cout << "[SentinelEngine] started. positions=" << positions
            << " strategies=" << strategies
            << " ipc=" << (ipc_server_ ? "on" : "off")
            << " store=" << (file_store_ ? config_.data_dir : "memory")
            << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SentinelEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new actions ---------------------------------------------------
  monitor_->stop();

  // ---  2) IPC (joins its thread before components it queries go away) -----
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  3) Deliver what is queued, then stop the worker ---------------------
  if (!notifier_->flush(kShutdownFlushTimeout)) {
    std::cerr << "[SentinelEngine] Notifier flush timed out; pending alerts "
                 "dropped\n";
  }
  notifier_->stop();
  unwireSubscribers();
  ipc_server_.reset();

  running_ = false;
  stopped_ = true;
  std::cout << "[SentinelEngine] stopped. open positions="
            << manager_->openCount() << "\n";
}

void SentinelEngine::wireSubscribers() {
  EventBus& bus = notifier_->bus();

  StrategyBook* book = strategies_.get();
  subscriptions_.push_back(attachConsoleAlerts(
      bus, [book](const Event& e) { return book->wantsAlert(e); },
      alert_out_, alert_err_));

  for (auto id : strategies_->attachTo(bus)) {
    subscriptions_.push_back(id);
  }

  if (ipc_server_) {
    IpcServer* server = ipc_server_.get();
    subscriptions_.push_back(
        bus.subscribe([server](const Event& e) { server->pushTelemetry(e); }));
  }
}

void SentinelEngine::unwireSubscribers() {
  for (auto id : subscriptions_) {
    notifier_->bus().unsubscribe(id);
  }
  subscriptions_.clear();
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, wrap errors
// -----------------------------------------------------------------------------
std::string SentinelEngine::executeCommand(const std::string& cmd) {
  json reply;
  try {
    std::string name;
    json args = json::object();

    const auto first = cmd.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && cmd[first] == '{') {
      args = json::parse(cmd);
      name = args.at("cmd").get<std::string>();
    } else {
      name = cmd;
      while (!name.empty() && (name.back() == '\n' || name.back() == '\r' ||
                               name.back() == ' ')) {
        name.pop_back();
      }
    }

    reply = dispatch(name, args);
  } catch (const SentinelError& e) {
    reply = json{{"status", "error"}, {"error", e.what()}};
  } catch (const json::exception& e) {
    reply = json{{"status", "error"},
                 {"error", std::string("malformed command: ") + e.what()}};
  }
  return reply.dump();
}

json SentinelEngine::dispatch(const std::string& name, const json& args) {
  if (name == "PING") {
    json r = ok();
    r["response"] = "PONG";
    return r;
  }
  if (name == "STATUS") {
    return statusJson();
  }
  if (name == "POSITIONS") {
    json r = ok();
    if (args.contains("token")) {
      r["positions"] = positionsToJson(
          manager_->getPositionsByToken(args.at("token").get<std::string>()));
    } else if (args.value("all", false)) {
      r["positions"] = positionsToJson(manager_->getAllPositions());
    } else {
      r["positions"] = positionsToJson(manager_->getOpenPositions());
    }
    return r;
  }
  if (name == "POSITION") {
    const auto id = args.at("id").get<domain::PositionId>();
    auto position = manager_->getPosition(id);
    if (!position) {
      throw InvalidInputError("position " + std::to_string(id) +
                              " not found");
    }
    json r = ok();
    r["position"] = *position;
    return r;
  }
  if (name == "OPEN") {
    return openCommand(args);
  }
  if (name == "OPEN_FOR_STRATEGY") {
    domain::Position position = entries_->openPosition(
        args.at("strategy_id").get<domain::StrategyId>(),
        args.at("token").get<std::string>());
    json r = ok();
    r["position"] = position;
    return r;
  }
  if (name == "CLOSE") {
    return closeCommand(args);
  }
  if (name == "RESUME") {
    json r = ok();
    r["resumed"] = manager_->resumePosition(args.at("id").get<domain::PositionId>());
    return r;
  }
  if (name == "STRATEGIES") {
    json list = json::array();
    for (const auto& strategy : strategies_->listStrategies()) {
      list.push_back(strategy);
    }
    json r = ok();
    r["strategies"] = std::move(list);
    return r;
  }
  if (name == "CREATE_STRATEGY") {
    return createStrategyCommand(args);
  }
  if (name == "UPDATE_STRATEGY") {
    return updateStrategyCommand(args);
  }
  if (name == "SET_STRATEGY_ENABLED") {
    json r = ok();
    r["strategy"] =
        strategies_->setEnabled(args.at("id").get<domain::StrategyId>(),
                                args.at("enabled").get<bool>());
    return r;
  }
  if (name == "DELETE_STRATEGY") {
    json r = ok();
    r["deleted"] =
        strategies_->deleteStrategy(args.at("id").get<domain::StrategyId>());
    return r;
  }
  if (name == "STATS") {
    return statsJson();
  }
  if (name == "TICK") {
    json r = ok();
    r["ran"] = monitor_->tickOnce();
    r["report"] = tickToJson(monitor_->lastTick());
    return r;
  }

  json r;
  r["status"] = "error";
  r["error"] = "Unknown command: " + name;
  return r;
}

json SentinelEngine::statusJson() const {
  json r = ok();
  r["running"] = running_;
  r["monitor_state"] = toString(monitor_->state());
  r["open_positions"] = manager_->openCount();
  r["tick_interval_ms"] = monitor_->options().tick_interval_ms;

  const TickReport last = monitor_->lastTick();
  r["last_tick"] = tickToJson(last);

  r["notifier"] = json{{"delivered", notifier_->delivered()},
                       {"dropped", notifier_->dropped()}};
  r["price_cache"] = json{{"hits", price_cache_->hits()},
                          {"misses", price_cache_->misses()}};
  r["ipc"] = ipc_server_ != nullptr && ipc_server_->running();
  return r;
}

json SentinelEngine::statsJson() const {
  const StrategyPerformance perf = strategies_->performance();
  const PositionManagerStats pm = manager_->stats();
  const MonitorStats ms = monitor_->stats();

  json r = ok();
  r["strategies"] = json{{"total_trades", perf.total_trades},
                         {"successful_trades", perf.successful_trades},
                         {"failed_trades", perf.failed_trades},
                         {"win_rate_percent", perf.win_rate_percent},
                         {"realized_profit", perf.realized_profit},
                         {"count", perf.strategies},
                         {"active", perf.active_strategies}};
  r["positions"] = json{{"open", manager_->openCount()},
                        {"created", pm.created},
                        {"applied", pm.applied},
                        {"failed", pm.failed},
                        {"escalated", pm.escalated},
                        {"dropped", pm.dropped}};
  r["monitor"] = json{{"ticks", ms.ticks},
                      {"missed_ticks", ms.missed_ticks},
                      {"aborted_ticks", ms.aborted_ticks},
                      {"actions_applied", ms.actions_applied},
                      {"price_failures", ms.price_failures},
                      {"errors", ms.errors}};
  return r;
}

// -----------------------------------------------------------------------------
// OPEN: register a filled position, or buy `quote` first
// -----------------------------------------------------------------------------
json SentinelEngine::openCommand(const json& args) {
  const auto token = args.at("token").get<std::string>();
  domain::ExitRules rules = rulesArg(args, config_.default_exit_rules);
  std::optional<domain::ScaleInPlan> plan = planArg(args);

  domain::Position position;
  if (args.contains("quote")) {
    position = entries_->openManual(token, args.at("quote").get<double>(),
                                    std::move(rules), std::move(plan));
  } else {
    position = manager_->createPosition(token, args.at("price").get<double>(),
                                        args.at("amount").get<double>(),
                                        std::move(rules), std::move(plan));
  }

  json r = ok();
  r["position"] = position;
  return r;
}

json SentinelEngine::closeCommand(const json& args) {
  const auto id = args.at("id").get<domain::PositionId>();

  double price = 0.0;
  if (args.contains("price")) {
    price = args.at("price").get<double>();
  } else {
    auto position = manager_->getPosition(id);
    if (!position) {
      throw InvalidInputError("position " + std::to_string(id) +
                              " not found");
    }
    price = requireUsablePrice(position->token_id,
                               price_cache_->getPrice(position->token_id));
  }

  const ActionOutcome outcome =
      manager_->applyFullClose(id, price, domain::CloseReason::Manual);

  json r;
  r["status"] = (outcome == ActionOutcome::Applied ||
                 outcome == ActionOutcome::NoOp)
                    ? "ok"
                    : "error";
  r["outcome"] = toString(outcome);
  if (auto position = manager_->getPosition(id)) {
    r["position"] = *position;
  }
  return r;
}

json SentinelEngine::createStrategyCommand(const json& args) {
  const json& body = args.contains("strategy") ? args.at("strategy") : args;
  auto config = body.get<domain::Strategy>();
  if (!body.contains("exit_rules")) {
    config.exit_rules = config_.default_exit_rules;
  }

  json r = ok();
  r["strategy"] = strategies_->createStrategy(std::move(config));
  return r;
}

json SentinelEngine::updateStrategyCommand(const json& args) {
  const auto id = args.at("id").get<domain::StrategyId>();

  StrategyPatch patch;
  if (args.contains("name")) {
    patch.name = args.at("name").get<std::string>();
  }
  if (args.contains("enabled")) {
    patch.enabled = args.at("enabled").get<bool>();
  }
  if (args.contains("limits")) {
    // Partial limits overlay the current ones.
    auto current = strategies_->getStrategy(id);
    if (!current) {
      throw InvalidInputError("unknown strategy " + std::to_string(id));
    }
    domain::StrategyLimits limits = current->limits;
    domain::from_json(args.at("limits"), limits);
    patch.limits = limits;
  }
  if (args.contains("exit_rules")) {
    patch.exit_rules = args.at("exit_rules").get<domain::ExitRules>();
  }
  if (args.contains("scale_in_plan")) {
    const json& plan = args.at("scale_in_plan");
    patch.scale_in_plan =
        plan.is_null() ? std::optional<domain::ScaleInPlan>{}
                       : std::optional<domain::ScaleInPlan>{
                             plan.get<domain::ScaleInPlan>()};
  }
  if (args.contains("notifications")) {
    patch.notifications =
        args.at("notifications").get<domain::StrategyNotifications>();
  }

  json r = ok();
  r["strategy"] = strategies_->updateStrategy(id, patch);
  return r;
}

}  // namespace sentinel
