// -----------------------------------------------------------------------------
// sentinel — single executable entry point.
//
//   sentinel [config.json] [--demo]
//
//   1) Load EngineConfig from the optional JSON file (defaults otherwise).
//   2) Create the SentinelEngine and start it: storage is opened, open
//      positions are hydrated, the notifier, IPC server and monitor start.
//   3) With --demo, seed the simulated oracle with a few tokens, create a
//      demo strategy if none exists and open one position per token.
//   4) Idle on the main thread until Ctrl-C, then stop the engine.
//
// Thread layout:
//   main thread      → start(), wait for SIGINT, stop()
//   monitor thread   → PositionMonitor ticks
//   notifier thread  → alerts, strategy statistics, IPC telemetry
//   ipc thread       → ZeroMQ REP/PUB loop
// -----------------------------------------------------------------------------

#include "sentinel/common/errors.hpp"
#include "sentinel/config/engine_config.hpp"
#include "sentinel/engine/sentinel_engine.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// The only global: a flag the SIGINT handler sets and main() polls.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void sigint_handler(int /*signum*/) { g_shutdown_requested = 1; }

namespace {

constexpr const char* kDemoTokens[] = {"DEMO_ALPHA", "DEMO_BETA", "DEMO_GAMMA"};
constexpr double kDemoPrices[] = {0.0025, 0.0180, 1.2500};

// Seeds prices, ensures a strategy exists and opens a position per token.
// Entry failures are reported and skipped.
void seedDemo(sentinel::SentinelEngine& engine) {
  sentinel::SimulatedPriceOracle* oracle = engine.demoOracle();
  if (oracle == nullptr) {
    return;
  }
  for (std::size_t i = 0; i < std::size(kDemoTokens); ++i) {
    oracle->setPrice(kDemoTokens[i], kDemoPrices[i]);
  }

  sentinel::domain::StrategyId strategy_id = 0;
  auto existing = engine.strategies().listStrategies();
  if (existing.empty()) {
    sentinel::domain::Strategy demo;
    demo.name = "demo";
    demo.limits.max_concurrent_positions = 3;
    demo.limits.max_position_size = 0.1;
    demo.limits.total_budget = 0.5;
    demo.exit_rules = engine.config().default_exit_rules;
    demo.exit_rules.trailing_stop = {true, 20.0, 10.0};

    sentinel::domain::ScaleInPlan plan;
    plan.enabled = true;
    plan.phases.push_back({1, 5.0, 0.3, false, std::nullopt});
    plan.phases.push_back({2, 15.0, 0.3, false, std::nullopt});
    demo.scale_in_plan = plan;

    strategy_id = engine.strategies().createStrategy(demo).id;
  } else {
    strategy_id = existing.front().id;
  }

  for (const char* token : kDemoTokens) {
    try {
      auto position = engine.entries().openPosition(strategy_id, token);
      std::cout << "[main] Demo position " << position.id << " opened on "
                << token << "\n";
    } catch (const sentinel::SentinelError& e) {
      std::cerr << "[main] Demo entry on " << token
                << " skipped: " << e.what() << "\n";
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool demo = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--demo") {
      demo = true;
    } else {
      config_path = arg;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  sentinel::EngineConfig config;
  if (!config_path.empty()) {
    try {
      config = sentinel::loadEngineConfig(config_path);
    } catch (const sentinel::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 2;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Engine. StorageCorruptionError is the one fatal start-up error.
  // -------------------------------------------------------------------------
  try {
    sentinel::SentinelEngine engine(config);
    engine.start();

    // -----------------------------------------------------------------------
    // 3) Demo seed
    // -----------------------------------------------------------------------
    if (demo) {
      seedDemo(engine);
    }

    // -----------------------------------------------------------------------
    // 4) Wait for Ctrl-C
    // -----------------------------------------------------------------------
    std::signal(SIGINT, sigint_handler);
    std::signal(SIGTERM, sigint_handler);
    std::cout << "[main] Monitoring every " << config.tick_interval_ms
              << " ms. Press Ctrl-C to shut down.\n";

    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const sentinel::StorageCorruptionError& e) {
    std::cerr << "[main] Refusing to start, stored records are corrupt: "
              << e.what() << "\n";
    return 3;
  } catch (const sentinel::SentinelError& e) {
    std::cerr << "[main] Fatal: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] IPC endpoint unavailable: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
