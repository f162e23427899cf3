#include "sentinel/engine/position_monitor.hpp"

#include "sentinel/common/errors.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <vector>

namespace sentinel {

const char* toString(PositionMonitor::State state) {
  switch (state) {
    case PositionMonitor::State::Idle:    return "IDLE";
    case PositionMonitor::State::Ticking: return "TICKING";
  }
  return "UNKNOWN";
}

PositionMonitor::PositionMonitor(PositionManager& manager,
                                 IPriceOracle& oracle,
                                 const ITimeProvider& clock,
                                 MonitorOptions options)
    : manager_(manager),
      oracle_(oracle),
      clock_(clock),
      options_(options) {
  if (options_.tick_interval_ms <= 0) {
    throw InvalidInputError("tick_interval_ms must be > 0");
  }
  if (options_.max_concurrent_checks == 0) {
    throw InvalidInputError("max_concurrent_checks must be > 0");
  }
}

PositionMonitor::~PositionMonitor() { stop(); }

void PositionMonitor::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[PositionMonitor] Started, interval "
            << options_.tick_interval_ms << " ms, batch "
            << options_.max_concurrent_checks << "\n";
}

void PositionMonitor::stop() {
  {
    std::lock_guard lock(wake_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::cout << "[PositionMonitor] Stopped\n";
}

PositionMonitor::State PositionMonitor::state() const {
  return ticking_.load() ? State::Ticking : State::Idle;
}

TickReport PositionMonitor::lastTick() const {
  std::lock_guard lock(stats_mutex_);
  return last_tick_;
}

MonitorStats PositionMonitor::stats() const {
  std::lock_guard lock(stats_mutex_);
  return stats_;
}

// -----------------------------------------------------------------------------
// run(): scheduler loop
// -----------------------------------------------------------------------------
void PositionMonitor::run() {
  using Clock = std::chrono::steady_clock;
  const auto interval = std::chrono::milliseconds(options_.tick_interval_ms);
  auto deadline = Clock::now() + interval;

  while (running_.load()) {
    {
      std::unique_lock lock(wake_mutex_);
      wake_cv_.wait_until(lock, deadline, [this] { return !running_.load(); });
    }
    if (!running_.load()) {
      break;
    }

    try {
      if (!tickOnce()) {
        std::lock_guard lock(stats_mutex_);
        ++stats_.missed_ticks;
      }
    } catch (const std::exception& e) {
      std::lock_guard lock(stats_mutex_);
      ++stats_.aborted_ticks;
      std::cerr << "[PositionMonitor] Scheduled tick aborted, next one "
                << "stays on schedule: " << e.what() << "\n";
    }

    deadline += interval;
    const auto now = Clock::now();
    if (now >= deadline) {
      const auto behind = (now - deadline) / interval + 1;
      deadline += behind * interval;
      {
        std::lock_guard lock(stats_mutex_);
        stats_.missed_ticks += static_cast<std::uint64_t>(behind);
      }
      std::cerr << "[PositionMonitor] Tick overran, skipped " << behind
                << " scheduled tick(s)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// tickOnce(): IDLE -> TICKING -> IDLE
// -----------------------------------------------------------------------------
bool PositionMonitor::tickOnce() {
  bool expected = false;
  if (!ticking_.compare_exchange_strong(expected, true)) {
    return false;
  }

  struct IdleOnExit {
    std::atomic<bool>& flag;
    ~IdleOnExit() { flag.store(false); }
  };

  TickReport report;
  {
    IdleOnExit idle{ticking_};
    report = runTick();
  }

  {
    std::lock_guard lock(stats_mutex_);
    last_tick_ = report;
    ++stats_.ticks;
    stats_.actions_applied += report.applied;
    stats_.price_failures += report.price_failures;
    stats_.errors += report.errors;
  }
  return true;
}

TickReport PositionMonitor::runTick() {
  TickReport report;

  std::vector<domain::Position> work;
  for (auto& position : manager_.getOpenPositions()) {
    if (position.pending_action || position.needs_manual_intervention) {
      ++report.skipped;
      continue;
    }
    work.push_back(std::move(position));
  }

  const std::size_t batch = options_.max_concurrent_checks;
  for (std::size_t begin = 0; begin < work.size(); begin += batch) {
    const std::size_t end = std::min(work.size(), begin + batch);

    std::vector<std::future<CheckResult>> futures;
    futures.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
      futures.push_back(std::async(std::launch::async,
                                   [this, &position = work[i]] {
                                     return checkPosition(position);
                                   }));
    }
    for (auto& future : futures) {
      tally(report, future.get());
      ++report.checked;
    }
  }
  return report;
}

void PositionMonitor::tally(TickReport& report, CheckResult result) {
  switch (result) {
    case CheckResult::Idle:             break;
    case CheckResult::Applied:          ++report.applied; break;
    case CheckResult::Failed:           ++report.failed; break;
    case CheckResult::Dropped:          ++report.dropped; break;
    case CheckResult::PriceUnavailable: ++report.price_failures; break;
    case CheckResult::Error:            ++report.errors; break;
  }
}

// -----------------------------------------------------------------------------
// checkPosition(): one position, one price, at most one action
// -----------------------------------------------------------------------------
PositionMonitor::CheckResult PositionMonitor::checkPosition(
    const domain::Position& position) {
  const domain::PositionId id = position.id;
  try {
    const double price = oracle_.getPrice(position.token_id);
    std::optional<domain::Position> current = manager_.recordPrice(id, price);
    if (!current) {
      return CheckResult::Idle;
    }

    ActionOutcome outcome = ActionOutcome::NoOp;
    if (auto phase = planner_.nextPhase(*current, price)) {
      outcome = manager_.applyScaleIn(id, *phase, price);
    } else if (auto action =
                   evaluator_.evaluate(*current, price, clock_.now_ms())) {
      if (action->kind == domain::ActionKind::FullClose) {
        outcome = manager_.applyFullClose(id, price, action->reason);
      } else {
        outcome = manager_.applyPartialClose(id, action->fraction,
                                             action->level_id, price);
      }
    }

    switch (outcome) {
      case ActionOutcome::Applied:   return CheckResult::Applied;
      case ActionOutcome::Failed:
      case ActionOutcome::Escalated: return CheckResult::Failed;
      case ActionOutcome::Dropped:   return CheckResult::Dropped;
      case ActionOutcome::NoOp:      return CheckResult::Idle;
    }
    return CheckResult::Idle;
  } catch (const PriceUnavailableError& e) {
    std::cerr << "[PositionMonitor] #" << id << " skipped this tick: "
              << e.what() << "\n";
    return CheckResult::PriceUnavailable;
  } catch (const std::exception& e) {
    std::cerr << "[PositionMonitor] #" << id << " check failed: " << e.what()
              << "\n";
    return CheckResult::Error;
  }
}

}  // namespace sentinel
