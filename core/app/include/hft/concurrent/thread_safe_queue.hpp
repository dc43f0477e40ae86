#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace hft {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO handed between two threads. Provides blocking
// pop() (wait until an item is available or the queue is closed) and
// non-blocking try_pop().
//
// Why unbounded: The pipeline thread dispatches admitted orders into the
// venue thread through this queue. The pipeline is also the only consumer of
// the bounded fill channel the venue writes to, so a bounded order queue
// could deadlock both threads (pipeline blocked on a full order queue while
// the venue is blocked on a full fill channel). Admission is already capped
// by the Risk Gate's rate limit, which bounds the growth of this queue.
//
// Thread model: Safe for multiple producers and multiple consumers. close()
// wakes every blocked consumer; pop() returns std::nullopt once the queue is
// closed and drained.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition_variable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one blocked consumer.
  // Output: false if the queue was already closed (the item is discarded).
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken thread does not immediately block
    // on the mutex we still hold.
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting while the queue is
  // empty and open. Returns std::nullopt when the queue is closed and every
  // item pushed before close() has been consumed.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
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
  // close()
  // -------------------------------------------------------------------------
  // What: Refuses further pushes and wakes all blocked consumers. Items
  // already queued remain poppable. Idempotent.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  // Snapshot only: another thread may push or pop immediately after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

 private:
  // mutable so empty() and closed() can lock while staying const.
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace hft
