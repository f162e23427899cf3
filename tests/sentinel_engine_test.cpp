// =============================================================================
// sentinel_engine_test.cpp
// =============================================================================
// Integration tests for sentinel::SentinelEngine through its operator
// command surface.
//
// The engine runs with IPC disabled, an in-memory store, a simulated clock
// and oracle, and the scriptable FakeTradeExecutor. The monitor interval is
// an hour so the scheduler never ticks by itself; TICK drives it instead.
// The price cache TTL is zero so every price change is seen immediately.
// =============================================================================

#include "sentinel/common/errors.hpp"
#include "sentinel/engine/sentinel_engine.hpp"
#include "sentinel/oracle/simulated_price_oracle.hpp"
#include "sentinel/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

using nlohmann::json;

class SentinelEngineTest : public ::testing::Test {
 protected:
  SentinelEngineTest() : clock(1'700'000'000'000), oracle(11, 0.0) {}

  static sentinel::EngineConfig testConfig() {
    sentinel::EngineConfig config;
    config.ipc_enabled = false;
    config.data_dir = "";
    config.price_cache_ttl_ms = 0;
    config.tick_interval_ms = 3'600'000;
    return config;
  }

  void SetUp() override {
    quote("TKN", 100.0);

    sentinel::EngineOverrides overrides;
    overrides.oracle = &oracle;
    overrides.executor = &executor;
    overrides.clock = &clock;
    overrides.alert_out = &alerts_out;
    overrides.alert_err = &alerts_err;
    engine = std::make_unique<sentinel::SentinelEngine>(testConfig(),
                                                        overrides);
    engine->start();
  }

  void TearDown() override { engine->stop(); }

  void quote(const std::string& token, double price) {
    oracle.setPrice(token, price);
    executor.setPrice(token, price);
  }

  json run(const json& command) {
    return json::parse(engine->executeCommand(command.dump()));
  }

  json run(const std::string& command) {
    return json::parse(engine->executeCommand(command));
  }

  sentinel::SimulationTimeProvider clock;
  sentinel::SimulatedPriceOracle oracle;
  sentinel_test::FakeTradeExecutor executor;
  std::ostringstream alerts_out;
  std::ostringstream alerts_err;
  std::unique_ptr<sentinel::SentinelEngine> engine;
};

// -----------------------------------------------------------------------------
// 1. Bare names and JSON objects both reach the dispatcher.
// -----------------------------------------------------------------------------
TEST_F(SentinelEngineTest, PingInBothForms) {
  EXPECT_EQ(run(std::string("PING"))["response"], "PONG");
  EXPECT_EQ(run(std::string("PING\n"))["response"], "PONG");
  json reply = run(json{{"cmd", "PING"}});
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["response"], "PONG");
}

TEST_F(SentinelEngineTest, UnknownAndMalformedCommands) {
  json unknown = run(std::string("FLY"));
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["error"], "Unknown command: FLY");

  json malformed = run(std::string("{\"cmd\": "));
  EXPECT_EQ(malformed["status"], "error");
  EXPECT_NE(malformed["error"].get<std::string>().find("malformed command"),
            std::string::npos);

  json missing_arg = run(json{{"cmd", "POSITION"}});
  EXPECT_EQ(missing_arg["status"], "error");
}

TEST_F(SentinelEngineTest, StatusReportsComponents) {
  json status = run(std::string("STATUS"));
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["running"], true);
  EXPECT_EQ(status["monitor_state"], "IDLE");
  EXPECT_EQ(status["open_positions"], 0);
  EXPECT_EQ(status["ipc"], false);
  EXPECT_TRUE(status.contains("notifier"));
  EXPECT_TRUE(status.contains("price_cache"));
}

// -----------------------------------------------------------------------------
// 2. OPEN registers a filled position; CLOSE sells it; a second CLOSE is a
//    no-op.
// -----------------------------------------------------------------------------
TEST_F(SentinelEngineTest, OpenThenManualClose) {
  json opened = run(json{{"cmd", "OPEN"},
                         {"token", "TKN"},
                         {"price", 100.0},
                         {"amount", 10.0},
                         {"rules", {{"stop_loss_percent", 5.0}}}});
  ASSERT_EQ(opened["status"], "ok");
  const auto id = opened["position"]["id"].get<std::uint64_t>();
  EXPECT_EQ(opened["position"]["status"], "OPEN");
  EXPECT_EQ(opened["position"]["exit_rules"]["stop_loss_percent"], 5.0);

  json closed = run(json{{"cmd", "CLOSE"}, {"id", id}, {"price", 120.0}});
  EXPECT_EQ(closed["status"], "ok");
  EXPECT_EQ(closed["outcome"], "APPLIED");
  EXPECT_EQ(closed["position"]["status"], "CLOSED");
  EXPECT_EQ(closed["position"]["close_reason"], "MANUAL");

  json again = run(json{{"cmd", "CLOSE"}, {"id", id}, {"price", 120.0}});
  EXPECT_EQ(again["status"], "ok");
  EXPECT_EQ(again["outcome"], "NOOP");

  json all = run(json{{"cmd", "POSITIONS"}, {"all", true}});
  EXPECT_EQ(all["positions"].size(), 1u);
  EXPECT_TRUE(run(std::string("POSITIONS"))["positions"].empty());
}

TEST_F(SentinelEngineTest, OpenWithoutRulesUsesConfiguredDefaults) {
  json opened = run(json{{"cmd", "OPEN"},
                         {"token", "TKN"},
                         {"price", 100.0},
                         {"amount", 1.0}});
  ASSERT_EQ(opened["status"], "ok");
  EXPECT_EQ(opened["position"]["exit_rules"]["stop_loss_percent"], 10.0);
  EXPECT_EQ(opened["position"]["exit_rules"]["partial_profit_levels"].size(),
            3u);
}

TEST_F(SentinelEngineTest, OpenWithQuoteBuysFirst) {
  quote("TKN", 0.5);
  json opened = run(json{{"cmd", "OPEN"}, {"token", "TKN"}, {"quote", 2.0}});
  ASSERT_EQ(opened["status"], "ok");
  EXPECT_DOUBLE_EQ(opened["position"]["amount_total"].get<double>(), 4.0);
  EXPECT_DOUBLE_EQ(opened["position"]["entry_price"].get<double>(), 0.5);
  EXPECT_EQ(executor.calls().size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. A failed manual close is reported as an error and the position stays.
// -----------------------------------------------------------------------------
TEST_F(SentinelEngineTest, FailedCloseReportsError) {
  json opened = run(json{{"cmd", "OPEN"},
                         {"token", "TKN"},
                         {"price", 100.0},
                         {"amount", 10.0}});
  const auto id = opened["position"]["id"].get<std::uint64_t>();
  executor.failNext(1, "route unavailable");

  json closed = run(json{{"cmd", "CLOSE"}, {"id", id}});
  EXPECT_EQ(closed["status"], "error");
  EXPECT_EQ(closed["outcome"], "FAILED");
  EXPECT_EQ(closed["position"]["status"], "OPEN");
  EXPECT_EQ(closed["position"]["last_error"], "route unavailable");
}

TEST_F(SentinelEngineTest, UnknownPositionIsAnError) {
  EXPECT_EQ(run(json{{"cmd", "POSITION"}, {"id", 42}})["status"], "error");
  EXPECT_EQ(run(json{{"cmd", "CLOSE"}, {"id", 42}, {"price", 1.0}})["status"],
            "error");
}

// -----------------------------------------------------------------------------
// 4. TICK runs the monitor; the resulting close reaches the alert stream.
// -----------------------------------------------------------------------------
TEST_F(SentinelEngineTest, TickAppliesStopLossAndAlerts) {
  run(json{{"cmd", "OPEN"},
           {"token", "TKN"},
           {"price", 100.0},
           {"amount", 10.0},
           {"rules", {{"stop_loss_percent", 5.0}}}});
  quote("TKN", 94.0);

  json tick = run(std::string("TICK"));
  EXPECT_EQ(tick["ran"], true);
  EXPECT_EQ(tick["report"]["applied"], 1);
  EXPECT_EQ(engine->positions().openCount(), 0u);

  ASSERT_TRUE(engine->notifier().flush(std::chrono::seconds(2)));
  EXPECT_NE(alerts_out.str().find("Closed #1"), std::string::npos);
  EXPECT_NE(alerts_out.str().find("STOP_LOSS"), std::string::npos);

  json stats = run(std::string("STATS"));
  EXPECT_EQ(stats["monitor"]["ticks"], 1);
  EXPECT_EQ(stats["positions"]["applied"], 1);
}

// -----------------------------------------------------------------------------
// 5. Strategy lifecycle over the command surface.
// -----------------------------------------------------------------------------
TEST_F(SentinelEngineTest, StrategyLifecycle) {
  json created = run(json{
      {"cmd", "CREATE_STRATEGY"},
      {"strategy",
       {{"name", "breakout"},
        {"limits",
         {{"max_concurrent_positions", 1},
          {"max_position_size", 0.5},
          {"total_budget", 1.0}}}}}});
  ASSERT_EQ(created["status"], "ok");
  const auto id = created["strategy"]["id"].get<std::uint64_t>();
  EXPECT_EQ(created["strategy"]["exit_rules"]["stop_loss_percent"], 10.0);

  json entry = run(json{{"cmd", "OPEN_FOR_STRATEGY"},
                        {"strategy_id", id},
                        {"token", "TKN"}});
  ASSERT_EQ(entry["status"], "ok");
  EXPECT_EQ(entry["position"]["strategy_id"], id);
  EXPECT_DOUBLE_EQ(entry["position"]["quote_budget"].get<double>(), 0.5);

  json refused = run(json{{"cmd", "OPEN_FOR_STRATEGY"},
                          {"strategy_id", id},
                          {"token", "TKN"}});
  EXPECT_EQ(refused["status"], "error");
  EXPECT_NE(refused["error"].get<std::string>().find("max concurrent"),
            std::string::npos);

  json updated = run(json{{"cmd", "UPDATE_STRATEGY"},
                          {"id", id},
                          {"limits", {{"max_concurrent_positions", 2}}}});
  ASSERT_EQ(updated["status"], "ok");
  EXPECT_EQ(updated["strategy"]["limits"]["max_concurrent_positions"], 2);
  EXPECT_EQ(updated["strategy"]["limits"]["total_budget"], 1.0);

  json disabled = run(json{{"cmd", "SET_STRATEGY_ENABLED"},
                           {"id", id},
                           {"enabled", false}});
  EXPECT_EQ(disabled["strategy"]["enabled"], false);
  EXPECT_EQ(run(json{{"cmd", "OPEN_FOR_STRATEGY"},
                     {"strategy_id", id},
                     {"token", "TKN"}})["status"],
            "error");

  json stats = run(std::string("STATS"));
  EXPECT_EQ(stats["strategies"]["total_trades"], 1);
  EXPECT_EQ(stats["strategies"]["count"], 1);
  EXPECT_EQ(stats["strategies"]["active"], 0);

  EXPECT_EQ(run(std::string("STRATEGIES"))["strategies"].size(), 1u);
  EXPECT_EQ(run(json{{"cmd", "DELETE_STRATEGY"}, {"id", id}})["deleted"],
            true);
  EXPECT_TRUE(run(std::string("STRATEGIES"))["strategies"].empty());
}

TEST_F(SentinelEngineTest, ResumeClearsEscalation) {
  json opened = run(json{{"cmd", "OPEN"},
                         {"token", "TKN"},
                         {"price", 100.0},
                         {"amount", 10.0},
                         {"rules", {{"stop_loss_percent", 5.0}}}});
  const auto id = opened["position"]["id"].get<std::uint64_t>();
  quote("TKN", 90.0);
  executor.failNext(3);
  for (int i = 0; i < 3; ++i) {
    run(std::string("TICK"));
  }
  EXPECT_EQ(run(json{{"cmd", "POSITION"}, {"id", id}})["position"]
                ["needs_manual_intervention"],
            true);

  EXPECT_EQ(run(json{{"cmd", "RESUME"}, {"id", id}})["resumed"], true);
  run(std::string("TICK"));
  EXPECT_EQ(run(json{{"cmd", "POSITION"}, {"id", id}})["position"]["status"],
            "CLOSED");
}

// -----------------------------------------------------------------------------
// 6. Lifecycle rules: stop() is final.
// -----------------------------------------------------------------------------
TEST_F(SentinelEngineTest, CannotRestartAfterStop) {
  engine->stop();
  EXPECT_FALSE(engine->running());
  EXPECT_NO_THROW(engine->stop());
  EXPECT_THROW(engine->start(), sentinel::SentinelError);
}

TEST(SentinelEngineConfigTest, InvalidDefaultRulesRejected) {
  sentinel::EngineConfig config;
  config.ipc_enabled = false;
  config.data_dir = "";
  config.default_exit_rules.stop_loss_percent = -5.0;
  EXPECT_THROW(sentinel::SentinelEngine engine(config),
               sentinel::ConfigError);
}
