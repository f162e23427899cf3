#pragma once

#include "sentinel/concurrent/thread_safe_queue.hpp"
#include "sentinel/eventbus/event_bus.hpp"
#include "sentinel/notify/i_notifier.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace sentinel {

// -----------------------------------------------------------------------------
// AsyncNotifier — bounded queue + worker thread + EventBus
// -----------------------------------------------------------------------------
//
// @brief  INotifier that decouples event production from event handling.
//
// @details
// emit() pushes onto a bounded ThreadSafeQueue and returns. A dedicated
// worker pops events and publishes them on the owned EventBus, where the
// console alert sink, IPC telemetry and strategy statistics subscribe.
//
// When the queue is full the oldest pending event is dropped; dropped()
// reports how many were lost.
//
// Lifecycle:
//   Subscribe on bus() before start(). stop() closes the queue, lets the
//   worker drain what is already queued, then joins. emit() after stop() is
//   a silent no-op.
//
// Thread model:
//   emit() from any thread. Subscribers run on the notifier worker only.
//
// Ownership:
//   Owned by SentinelEngine. Components receive it as INotifier&.
// -----------------------------------------------------------------------------
class AsyncNotifier final : public INotifier {
 public:
  explicit AsyncNotifier(std::size_t queue_capacity = 1024);
  ~AsyncNotifier() override;

  AsyncNotifier(const AsyncNotifier&) = delete;
  AsyncNotifier& operator=(const AsyncNotifier&) = delete;
  AsyncNotifier(AsyncNotifier&&) = delete;
  AsyncNotifier& operator=(AsyncNotifier&&) = delete;

  void emit(Event event) override;

  void start();
  void stop();

  EventBus& bus() { return bus_; }

  // -------------------------------------------------------------------------
  // flush(timeout)
  // -------------------------------------------------------------------------
  // Blocks until every event emitted so far has been published or dropped.
  // Returns false on timeout. Used by tests and by shutdown.
  // -------------------------------------------------------------------------
  bool flush(std::chrono::milliseconds timeout);

  std::uint64_t dropped() const { return queue_.dropped_count(); }
  std::uint64_t delivered() const { return delivered_.load(); }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::thread worker_;
  std::atomic<bool> running_{false};

  std::mutex progress_mutex_;
  std::condition_variable progress_cv_;
  std::uint64_t accepted_{0};  // Guarded by progress_mutex_
  std::atomic<std::uint64_t> delivered_{0};
};

}  // namespace sentinel
