#pragma once

#include "sentinel/engine/exit_rule_evaluator.hpp"
#include "sentinel/engine/position_manager.hpp"
#include "sentinel/engine/scale_in_planner.hpp"
#include "sentinel/oracle/i_price_oracle.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace sentinel {

struct MonitorOptions {
  std::int64_t tick_interval_ms{8000};
  std::size_t max_concurrent_checks{5};
};

// Counters for one tick.
struct TickReport {
  std::size_t checked{0};         // Positions looked at
  std::size_t skipped{0};         // Pending action or awaiting an operator
  std::size_t price_failures{0};  // PriceUnavailableError
  std::size_t errors{0};          // Any other error caught at the boundary
  std::size_t applied{0};
  std::size_t failed{0};          // Failed or Escalated
  std::size_t dropped{0};
};

struct MonitorStats {
  std::uint64_t ticks{0};
  std::uint64_t missed_ticks{0};  // Scheduled ticks skipped due to overrun
  std::uint64_t actions_applied{0};
  std::uint64_t price_failures{0};
  std::uint64_t errors{0};
  std::uint64_t aborted_ticks{0};  // Scheduled ticks that threw as a whole
};

// -----------------------------------------------------------------------------
// PositionMonitor — the periodic tick driver
// -----------------------------------------------------------------------------
//
// @brief  Re-prices every open position on a fixed period and applies at
//         most one exit or scale-in action per position per tick.
//
// @details
// State machine: IDLE -> TICKING -> IDLE. tickOnce() moves to TICKING with a
// compare-exchange; if a tick is already running it returns false and does
// nothing, so ticks never overlap.
//
// One tick:
//   1. Snapshot the open positions. Skip those with a pending action or
//      flagged for manual intervention.
//   2. Process the rest in batches of max_concurrent_checks, each position
//      on its own std::async task; a batch is joined before the next starts.
//   3. Per position: price from the oracle, recordPrice(), then the
//      ScaleInPlanner; only if no phase is due, the ExitRuleEvaluator. The
//      resulting action (if any) is applied through the PositionManager.
//
// Every error is caught at the per-position boundary, logged and counted;
// one position's failure never aborts the tick for the others. A failure of
// the tick as a whole (std::async unable to start a thread, allocation) is
// rethrown by tickOnce(); the scheduler thread logs it, counts it in
// aborted_ticks and keeps its schedule.
//
// Scheduling:
//   start() runs ticks on a dedicated thread against std::chrono::
//   steady_clock deadlines. When a tick overruns one or more deadlines the
//   missed ones are skipped and counted in missed_ticks rather than run back
//   to back. A scheduled tick that finds a manual tickOnce() in progress is
//   also counted as missed.
//
// Thread model:
//   start()/stop() from the owning thread. tickOnce() from any thread.
// -----------------------------------------------------------------------------
class PositionMonitor {
 public:
  enum class State { Idle, Ticking };

  PositionMonitor(PositionManager& manager, IPriceOracle& oracle,
                  const ITimeProvider& clock, MonitorOptions options = {});
  virtual ~PositionMonitor();

  PositionMonitor(const PositionMonitor&) = delete;
  PositionMonitor& operator=(const PositionMonitor&) = delete;
  PositionMonitor(PositionMonitor&&) = delete;
  PositionMonitor& operator=(PositionMonitor&&) = delete;

  void start();
  void stop();

  // Runs one tick on the calling thread. false if a tick was in progress.
  // Exceptions from the tick as a whole propagate; the state is back to
  // IDLE either way.
  bool tickOnce();

  State state() const;
  bool running() const { return running_.load(); }
  TickReport lastTick() const;
  MonitorStats stats() const;
  const MonitorOptions& options() const { return options_; }

 protected:
  // One pass over the open positions. Subclasses that override it must
  // call stop() in their own destructor.
  virtual TickReport runTick();

 private:
  enum class CheckResult {
    Idle, Applied, Failed, Dropped, PriceUnavailable, Error
  };

  void run();
  CheckResult checkPosition(const domain::Position& position);
  static void tally(TickReport& report, CheckResult result);

  PositionManager& manager_;
  IPriceOracle& oracle_;
  const ITimeProvider& clock_;
  const MonitorOptions options_;

  ExitRuleEvaluator evaluator_;
  ScaleInPlanner planner_;

  std::atomic<bool> ticking_{false};
  std::atomic<bool> running_{false};
  std::thread thread_;
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  mutable std::mutex stats_mutex_;
  TickReport last_tick_;
  MonitorStats stats_;
};

const char* toString(PositionMonitor::State state);

}  // namespace sentinel
