#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace sentinel {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  FIFO hand-off between producer threads and one or more consumers,
//         optionally bounded with drop-oldest overflow.
//
// @details
// The notifier pushes alerts from the monitoring path and drains them on its
// own worker. The monitoring path must never block on a slow alert consumer,
// so push() never waits: when a capacity is set and the queue is full, the
// oldest element is discarded and dropped_count() is incremented.
//
// capacity == 0 means unbounded.
//
// close() wakes every blocked consumer. After close(), push() is ignored and
// pop() returns std::nullopt once the queue has been drained, which is how
// worker threads learn to exit.
//
// Thread model:
//   All methods are safe from any thread. Multiple producers, multiple
//   consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;
  explicit ThreadSafeQueue(std::size_t capacity) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends value. If bounded and full, the front element is evicted first.
  // Returns false only if the queue has been closed.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      if (capacity_ != 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // Non-blocking. Empty optional when nothing is queued.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop()
  // -------------------------------------------------------------------------
  // Blocks until an item is available or the queue is closed. Returns
  // std::nullopt only when closed and empty.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Like pop() but gives up after `timeout`.
  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout,
                        [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

  std::uint64_t dropped_count() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  const std::size_t capacity_{0};

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  std::uint64_t dropped_{0};
  bool closed_{false};
};

}  // namespace sentinel
