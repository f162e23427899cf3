#include "sentinel/notify/async_notifier.hpp"

#include <iostream>

namespace sentinel {

AsyncNotifier::AsyncNotifier(std::size_t queue_capacity)
    : queue_(queue_capacity) {}

AsyncNotifier::~AsyncNotifier() { stop(); }

void AsyncNotifier::emit(Event event) {
  {
    std::lock_guard lock(progress_mutex_);
    if (!queue_.push(std::move(event))) {
      return;
    }
    ++accepted_;
  }
}

void AsyncNotifier::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  worker_ = std::thread(&AsyncNotifier::run, this);
  std::cout << "[Notifier] Started (capacity " << queue_.capacity() << ")\n";
}

void AsyncNotifier::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  queue_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
  std::cout << "[Notifier] Stopped. delivered=" << delivered_.load()
            << " dropped=" << queue_.dropped_count() << "\n";
}

// -----------------------------------------------------------------------------
// run(): worker loop. pop() returns nullopt only once closed and drained.
// -----------------------------------------------------------------------------
void AsyncNotifier::run() {
  while (auto event = queue_.pop()) {
    bus_.publish(*event);
    {
      std::lock_guard lock(progress_mutex_);
      delivered_.fetch_add(1);
    }
    progress_cv_.notify_all();
  }
  progress_cv_.notify_all();
}

bool AsyncNotifier::flush(std::chrono::milliseconds timeout) {
  std::unique_lock lock(progress_mutex_);
  return progress_cv_.wait_for(lock, timeout, [this] {
    return delivered_.load() + queue_.dropped_count() >= accepted_;
  });
}

}  // namespace sentinel
