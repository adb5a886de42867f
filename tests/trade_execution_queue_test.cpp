// =============================================================================
// trade_execution_queue_test.cpp
// =============================================================================
// Unit tests for tickrisk::TradeExecutionQueue.
//
// Validates:
//   - FIFO dequeue, ids "TRD-n" assigned, retries reset on enqueue
//   - A trade failing four times is dropped (three retries) and never
//     reappears; processing returns to zero
//   - At most one close per position in flight
//   - Journal sees enqueue / finish records; restore() resumes pending trades
//     and continues the id sequence
//   - shutdown() wakes a blocked dequeueFor()
// =============================================================================

#include "tickrisk/execution/trade_execution_queue.hpp"
#include "tickrisk/time/manual_clock.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using tickrisk::RequeueOutcome;
using tickrisk::domain::QueuedTrade;
using tickrisk::domain::TradeAction;

using namespace std::chrono_literals;

namespace {

class RecordingJournal final : public tickrisk::ITradeJournal {
 public:
  void recordEnqueued(const QueuedTrade& trade) override {
    enqueued.push_back(trade);
  }
  void recordFinished(const std::string& trade_id) override {
    finished.push_back(trade_id);
  }
  std::vector<QueuedTrade> replay() override { return to_replay; }

  std::vector<QueuedTrade> enqueued;
  std::vector<std::string> finished;
  std::vector<QueuedTrade> to_replay;
};

QueuedTrade closeTrade(const std::string& position_id) {
  QueuedTrade t;
  t.user_id = "u1";
  t.position_id = position_id;
  t.action = TradeAction::Close;
  t.payload = {{"exit_price", 1.0949}, {"reason", "stop_loss"}};
  return t;
}

}  // namespace

class TradeExecutionQueueTest : public ::testing::Test {
 protected:
  tickrisk::ManualClock clock{5'000};
  RecordingJournal journal;
  tickrisk::TradeExecutionQueue queue{clock, &journal};
};

// -----------------------------------------------------------------------------
// 1. Enqueue stamps id and time; dequeue moves into processing.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionQueueTest, EnqueueAssignsIdAndTimestamp) {
  QueuedTrade t = closeTrade("p1");
  t.retries = 7;

  auto id = queue.enqueue(t);
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, "TRD-1");

  auto out = queue.dequeue();
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->id, "TRD-1");
  EXPECT_EQ(out->timestamp_ms, 5'000);
  EXPECT_EQ(out->retries, 0);
  EXPECT_EQ(queue.stats().processing, 1u);

  EXPECT_TRUE(queue.complete(*out));
  EXPECT_FALSE(queue.complete(*out));
  auto stats = queue.stats();
  EXPECT_EQ(stats.processing, 0u);
  EXPECT_EQ(stats.completed, 1u);
  ASSERT_EQ(journal.finished.size(), 1u);
  EXPECT_EQ(journal.finished[0], "TRD-1");
}

TEST_F(TradeExecutionQueueTest, DequeuesInFifoOrder) {
  queue.enqueue(closeTrade("p1"));
  queue.enqueue(closeTrade("p2"));
  queue.enqueue(closeTrade("p3"));

  EXPECT_EQ(queue.dequeue()->position_id, "p1");
  EXPECT_EQ(queue.dequeue()->position_id, "p2");
  EXPECT_EQ(queue.dequeue()->position_id, "p3");
  EXPECT_FALSE(queue.dequeue().has_value());
}

// -----------------------------------------------------------------------------
// 2. Four consecutive failures: three retries, then dropped.
// Why: A poisoned trade must not circulate forever.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionQueueTest, DropsAfterMaxRetries) {
  queue.enqueue(closeTrade("p1"));

  for (int attempt = 1; attempt <= 3; ++attempt) {
    auto t = queue.dequeue();
    ASSERT_TRUE(t.has_value()) << "attempt " << attempt;
    EXPECT_EQ(t->retries, attempt - 1);
    EXPECT_EQ(queue.requeue(*t, "store unavailable"), RequeueOutcome::Requeued);
  }

  auto last = queue.dequeue();
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->retries, 3);
  EXPECT_EQ(queue.requeue(*last, "store unavailable"), RequeueOutcome::Dropped);

  auto stats = queue.stats();
  EXPECT_EQ(stats.pending, 0u);
  EXPECT_EQ(stats.processing, 0u);
  EXPECT_EQ(stats.retried, 3u);
  EXPECT_EQ(stats.dropped, 1u);
  EXPECT_FALSE(queue.dequeue().has_value());
  EXPECT_FALSE(queue.closeInFlight("p1"));

  EXPECT_EQ(queue.requeue(*last, "again"), RequeueOutcome::NotProcessing);
}

// -----------------------------------------------------------------------------
// 3. Second close for the same position is refused while the first is
//    pending or processing.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionQueueTest, RejectsSecondCloseInFlight) {
  ASSERT_TRUE(queue.enqueue(closeTrade("p1")).has_value());
  EXPECT_TRUE(queue.closeInFlight("p1"));
  EXPECT_FALSE(queue.enqueue(closeTrade("p1")).has_value());

  auto t = queue.dequeue();
  ASSERT_TRUE(t.has_value());
  EXPECT_FALSE(queue.enqueue(closeTrade("p1")).has_value());

  queue.complete(*t);
  EXPECT_FALSE(queue.closeInFlight("p1"));
  EXPECT_TRUE(queue.enqueue(closeTrade("p1")).has_value());

  // Other actions on the same position are not restricted.
  QueuedTrade modify = closeTrade("p1");
  modify.action = TradeAction::Modify;
  EXPECT_TRUE(queue.enqueue(modify).has_value());
}

TEST_F(TradeExecutionQueueTest, RejectsDuplicateId) {
  QueuedTrade t = closeTrade("p1");
  t.id = "EXT-9";
  ASSERT_TRUE(queue.enqueue(t).has_value());

  QueuedTrade again = closeTrade("p2");
  again.id = "EXT-9";
  EXPECT_FALSE(queue.enqueue(again).has_value());
}

// -----------------------------------------------------------------------------
// 4. Restore resumes journaled trades and keeps ids unique.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionQueueTest, RestoreResumesPendingTrades) {
  QueuedTrade a = closeTrade("p1");
  a.id = "TRD-41";
  a.retries = 2;
  QueuedTrade b = closeTrade("p2");
  b.id = "TRD-7";
  journal.to_replay = {a, b};

  EXPECT_EQ(queue.restore(), 2u);

  auto first = queue.dequeue();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->id, "TRD-41");
  EXPECT_EQ(first->retries, 2);

  auto id = queue.enqueue(closeTrade("p9"));
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, "TRD-42");
}

// -----------------------------------------------------------------------------
// 5. Blocking dequeue: wakes on push, returns on shutdown.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionQueueTest, DequeueForWakesAndShutsDown) {
  EXPECT_FALSE(queue.dequeueFor(10ms).has_value());

  std::thread producer([this] {
    std::this_thread::sleep_for(20ms);
    queue.enqueue(closeTrade("p1"));
  });
  auto t = queue.dequeueFor(2s);
  producer.join();
  ASSERT_TRUE(t.has_value());

  std::thread stopper([this] {
    std::this_thread::sleep_for(20ms);
    queue.shutdown();
  });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.dequeueFor(5s).has_value());
  stopper.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}
