// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for tickrisk::ThreadSafeQueue<T>, the channel between the stream
// thread and the price loop.
//
// Validates:
//   - FIFO order (quotes for a symbol are applied in arrival order)
//   - try_pop() / pop_for() return std::nullopt instead of blocking forever
//   - pop_for() wakes as soon as a producer pushes
//   - No loss or duplication under concurrent producers and consumers
// =============================================================================

#include "tickrisk/concurrent/thread_safe_queue.hpp"
#include "tickrisk/domain/price_quote.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  tickrisk::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// Why: The price loop relies on this to apply a later quote after an
//      earlier one for the same symbol.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesFifoOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. Quotes keep their payload through the queue.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueQuotes, QuoteSurvivesTransfer) {
  tickrisk::ThreadSafeQueue<tickrisk::domain::PriceQuote> quotes;

  tickrisk::domain::PriceQuote q;
  q.symbol = "EUR/USD";
  q.bid = 1.09990;
  q.ask = 1.10010;
  q.timestamp_ms = 1'700'000'000'123;
  quotes.push(q);

  auto out = quotes.try_pop();
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->symbol, "EUR/USD");
  EXPECT_DOUBLE_EQ(out->bid, 1.09990);
  EXPECT_DOUBLE_EQ(out->ask, 1.10010);
  EXPECT_EQ(out->timestamp_ms, 1'700'000'000'123);
}

// -----------------------------------------------------------------------------
// 3. try_pop() on an empty queue returns immediately.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. pop_for() times out on an empty queue.
// Why: EventLoopThread uses pop_for() so it can notice stop() while idle.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  const auto start = std::chrono::steady_clock::now();
  auto result = queue.pop_for(20ms);
  const auto waited = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.has_value());
  EXPECT_GE(waited, 15ms);
}

// -----------------------------------------------------------------------------
// 5. pop_for() wakes when a producer pushes before the timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::optional<int> received;
  std::thread consumer([this, &received] { received = queue.pop_for(2s); });

  std::this_thread::sleep_for(20ms);
  queue.push(77);
  consumer.join();

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, 77);
}

// -----------------------------------------------------------------------------
// 6. Concurrent producers and consumers: every item popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 3;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> seen(kConsumers);

  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &seen] {
      while (consumed.load() < kTotal) {
        if (auto item = queue.pop_for(5ms)) {
          seen[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = p * kPerProducer; i < (p + 1) * kPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : seen) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
