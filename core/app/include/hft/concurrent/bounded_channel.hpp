#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace hft {

// -----------------------------------------------------------------------------
// ReadinessSignal
// -----------------------------------------------------------------------------
// Responsibility: Lets one consumer wait on several BoundedChannels at once.
// Every channel attached to the signal bumps a generation counter when it
// receives an item or is closed. The consumer reads generation() BEFORE it
// polls its channels and, if every poll came back empty, calls wait_for()
// with that generation. Any push that raced with the polls has already
// advanced the counter, so the wait returns immediately: no lost wake-ups.
//
// Thread model: notify() from any producer thread, wait_for() from the
// single consumer.
// -----------------------------------------------------------------------------
class ReadinessSignal {
 public:
  using Generation = std::uint64_t;

  ReadinessSignal() = default;
  ReadinessSignal(const ReadinessSignal&) = delete;
  ReadinessSignal& operator=(const ReadinessSignal&) = delete;

  Generation generation() const {
    std::lock_guard lock(mutex_);
    return generation_;
  }

  void notify() {
    {
      std::lock_guard lock(mutex_);
      ++generation_;
    }
    condition_.notify_all();
  }

  // Blocks until the generation moves past `seen` or the timeout expires.
  // Returns true if the generation changed.
  bool wait_for(Generation seen, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return condition_.wait_for(lock, timeout,
                               [this, seen] { return generation_ != seen; });
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  Generation generation_{0};
};

// -----------------------------------------------------------------------------
// BoundedChannel<T>
// -----------------------------------------------------------------------------
//
// @brief  Fixed-capacity FIFO between one producer thread and the pipeline
//         thread. A full channel blocks the producer instead of dropping.
//
// @details
// Quotes and fills must never be lost: a dropped quote corrupts the circuit
// breaker's price history, a dropped fill corrupts position accounting. So
// push() waits for space (backpressure) and only fails once the channel is
// closed.
//
// Closing is the shutdown signal. After close():
//   - push() returns false immediately, and wakes producers blocked on a
//     full channel;
//   - pop()/try_pop() keep returning queued items until the channel is
//     drained, then pop() returns std::nullopt.
//
// An optional ReadinessSignal is notified on every push and on close() so a
// consumer can select over two channels (see Pipeline::run()).
//
// Thread model: all methods are thread-safe. Items are delivered strictly in
// push order.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedChannel {
 public:
  // @throws std::invalid_argument if capacity is zero.
  explicit BoundedChannel(std::size_t capacity,
                          ReadinessSignal* readiness = nullptr)
      : capacity_(capacity), readiness_(readiness) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedChannel capacity must be > 0");
    }
  }

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;
  BoundedChannel(BoundedChannel&&) = delete;
  BoundedChannel& operator=(BoundedChannel&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Blocks while the channel is full and open. Returns false if the channel
  // is (or becomes) closed before the value could be enqueued.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock,
                     [this] { return closed_ || queue_.size() < capacity_; });
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    notifyReadiness();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::optional<T> value;
    {
      std::unique_lock lock(mutex_);
      not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
      if (queue_.empty()) {
        return std::nullopt;
      }
      value.emplace(std::move(queue_.front()));
      queue_.pop_front();
    }
    not_full_.notify_one();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::optional<T> value;
    {
      std::lock_guard lock(mutex_);
      if (queue_.empty()) {
        return std::nullopt;
      }
      value.emplace(std::move(queue_.front()));
      queue_.pop_front();
    }
    not_full_.notify_one();
    return value;
  }

  // Idempotent. Wakes every blocked producer and consumer.
  void close() {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return;
      }
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
    notifyReadiness();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // True once the channel is closed and every queued item has been popped.
  bool drained() const {
    std::lock_guard lock(mutex_);
    return closed_ && queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  void notifyReadiness() {
    if (readiness_ != nullptr) {
      readiness_->notify();
    }
  }

  const std::size_t capacity_;
  ReadinessSignal* readiness_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace hft
