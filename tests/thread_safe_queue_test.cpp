// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for hft::ThreadSafeQueue<T>, the unbounded order queue between
// the pipeline thread and the venue thread.
//
// Validates:
//   - FIFO ordering and non-blocking try_pop()
//   - Blocking pop() waits for a producer
//   - close(): rejects pushes, wakes consumers, keeps queued items poppable
//   - Multi-producer / multi-consumer completeness
// =============================================================================

#include "hft/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  hft::ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.closed());
}

// -----------------------------------------------------------------------------
// 1. Items come back in submission order.
// Why: The venue must execute orders in the order the gate admitted them.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    EXPECT_TRUE(queue.push(i));
  }

  for (int i = 0; i < kCount; ++i) {
    auto value = queue.pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

TEST_F(ThreadSafeQueueTest, TryPopEmptyReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST_F(ThreadSafeQueueTest, TryPopNonEmpty) {
  queue.push(99);
  auto result = queue.try_pop();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 99);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. Blocking pop() waits until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] {
    auto value = queue.pop();
    received.store(value ? *value : -2);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 3. close() wakes a consumer blocked on an empty queue with std::nullopt.
// Why: This is how VenueThread learns the pipeline has finished.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseWakesBlockedConsumer) {
  std::atomic<bool> got_nullopt{false};

  std::thread consumer([this, &got_nullopt] {
    got_nullopt.store(!queue.pop().has_value());
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();

  EXPECT_TRUE(got_nullopt.load());
  EXPECT_TRUE(queue.closed());
}

TEST_F(ThreadSafeQueueTest, CloseRejectsPushButKeepsQueuedItems) {
  queue.push(1);
  queue.push(2);
  queue.close();

  EXPECT_FALSE(queue.push(3));

  auto first = queue.pop();
  auto second = queue.pop();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, 1);
  EXPECT_EQ(*second, 2);
  EXPECT_FALSE(queue.pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. Concurrent multi-producer, multi-consumer: every value popped once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  // Consumers block in pop() and exit once close() has drained the queue.
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &per_consumer] {
      while (auto item = queue.pop()) {
        per_consumer[c].push_back(*item);
      }
    });
  }

  for (auto& t : producers) t.join();
  queue.close();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
