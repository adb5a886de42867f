// =============================================================================
// settlement_worker_pool_test.cpp
// =============================================================================
// Unit tests for tickrisk::SettlementWorkerPool against InMemoryPositionStore.
//
// Validates:
//   - Open -> indexed; trigger -> close settled, capital updated, closure
//     recorded, position gone from the index
//   - Transient store failures are retried; a fourth failure drops the trade
//     and publishes TradeDroppedEvent
//   - A close the store reports as already done completes without a second
//     closure record or settled event
//   - Modify updates levels in the store and the index
//   - Malformed payloads fail without throwing
//   - Background workers drain the queue and join on stop()
// =============================================================================

#include "tickrisk/execution/settlement_worker_pool.hpp"
#include "tickrisk/risk/trigger_monitor.hpp"
#include "tickrisk/store/in_memory_position_store.hpp"
#include "tickrisk/time/manual_clock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using tickrisk::domain::CloseReason;
using tickrisk::domain::QueuedTrade;
using tickrisk::domain::TradeAction;

using namespace std::chrono_literals;

namespace {

class RecordingSink final : public tickrisk::INotificationSink {
 public:
  struct Closure {
    std::string position_id;
    double pnl;
    CloseReason reason;
  };

  void recordClosure(const std::string& position_id, double pnl,
                     CloseReason reason) override {
    std::lock_guard lock(mutex);
    closures.push_back({position_id, pnl, reason});
  }

  std::mutex mutex;
  std::vector<Closure> closures;
};

}  // namespace

class SettlementWorkerPoolTest : public ::testing::Test {
 protected:
  void SetUp() override { store.addAccount("u1", "ctx", 10'000.0); }

  tickrisk::SettlementWorkerPool::EventSink sink() {
    return [this](tickrisk::Event e) {
      std::lock_guard lock(events_mutex);
      events.push_back(std::move(e));
    };
  }

  template <typename T>
  int count() {
    std::lock_guard lock(events_mutex);
    int n = 0;
    for (const auto& e : events) {
      if (std::holds_alternative<T>(e)) ++n;
    }
    return n;
  }

  static QueuedTrade openTrade(const std::string& position_id) {
    QueuedTrade t;
    t.user_id = "u1";
    t.position_id = position_id;
    t.action = TradeAction::Open;
    t.payload = {{"symbol", "EUR/USD"},  {"side", "long"},
                 {"entry_price", 1.1000}, {"quantity", 1.0},
                 {"leverage", 100.0},     {"stop_loss", 1.0950},
                 {"take_profit", 1.1100}, {"context_id", "ctx"}};
    return t;
  }

  tickrisk::ManualClock clock;
  tickrisk::InMemoryPositionStore store;
  RecordingSink notifications;
  tickrisk::PositionTriggerIndex index;
  tickrisk::TradeExecutionQueue queue{clock};
  std::mutex events_mutex;
  std::vector<tickrisk::Event> events;
  tickrisk::TriggerMonitor monitor{index, queue, sink()};
  tickrisk::SettlementWorkerPool pool{queue, store, notifications, index,
                                      sink(), 2, 10ms};
};

// -----------------------------------------------------------------------------
// 1. Full lifecycle: open, trigger, close.
// -----------------------------------------------------------------------------
TEST_F(SettlementWorkerPoolTest, OpenTriggerCloseLifecycle) {
  ASSERT_TRUE(queue.enqueue(openTrade("p1")).has_value());
  ASSERT_TRUE(pool.settleOne());
  EXPECT_TRUE(index.contains("p1"));
  EXPECT_EQ(store.openCount(), 1u);

  tickrisk::domain::PriceQuote tick;
  tick.symbol = "EUR/USD";
  tick.bid = 1.0949;
  tick.ask = 1.0951;
  EXPECT_EQ(monitor.onTick(tick), 1u);
  EXPECT_EQ(monitor.onTick(tick), 0u) << "Second tick must not re-trigger";

  ASSERT_TRUE(pool.settleOne());
  EXPECT_FALSE(index.contains("p1"));
  EXPECT_EQ(store.openCount(), 0u);
  EXPECT_NEAR(store.capital("u1", "ctx").value_or(0.0), 10'000.0 - 510.0, 1e-6);

  ASSERT_EQ(notifications.closures.size(), 1u);
  EXPECT_EQ(notifications.closures[0].position_id, "p1");
  EXPECT_EQ(notifications.closures[0].reason, CloseReason::StopLoss);
  EXPECT_NEAR(notifications.closures[0].pnl, -510.0, 1e-6);

  EXPECT_EQ(count<tickrisk::PositionTriggeredEvent>(), 1);
  EXPECT_EQ(count<tickrisk::TradeSettledEvent>(), 2);
  EXPECT_EQ(queue.stats().completed, 2u);
}

// -----------------------------------------------------------------------------
// 2. Two failures then success: the close lands once.
// -----------------------------------------------------------------------------
TEST_F(SettlementWorkerPoolTest, TransientFailuresAreRetried) {
  queue.enqueue(openTrade("p1"));
  pool.settleOne();

  store.failNextWrites(2);
  tickrisk::domain::TrackedPosition p = *store.position("p1");
  ASSERT_TRUE(monitor.enqueueClose(p, CloseReason::Manual, 1.1010));

  int attempts = 0;
  while (pool.settleOne()) {
    ++attempts;
  }

  EXPECT_EQ(attempts, 3);
  EXPECT_EQ(store.openCount(), 0u);
  EXPECT_EQ(notifications.closures.size(), 1u);
  EXPECT_EQ(queue.stats().retried, 2u);
  EXPECT_EQ(count<tickrisk::TradeDroppedEvent>(), 0);
}

// -----------------------------------------------------------------------------
// 3. Four failures: dropped with telemetry, position still open.
// Why: A permanently failing close must surface instead of looping.
// -----------------------------------------------------------------------------
TEST_F(SettlementWorkerPoolTest, FourthFailureDropsTrade) {
  queue.enqueue(openTrade("p1"));
  pool.settleOne();

  store.failNextWrites(4);
  tickrisk::domain::TrackedPosition p = *store.position("p1");
  monitor.enqueueClose(p, CloseReason::MarginCall, 1.0900);

  int attempts = 0;
  while (pool.settleOne()) {
    ++attempts;
  }

  EXPECT_EQ(attempts, 4);
  EXPECT_EQ(store.closeCalls(), 4u);
  EXPECT_EQ(store.openCount(), 1u);
  EXPECT_TRUE(notifications.closures.empty());
  EXPECT_EQ(count<tickrisk::TradeDroppedEvent>(), 1);

  auto stats = queue.stats();
  EXPECT_EQ(stats.dropped, 1u);
  EXPECT_EQ(stats.processing, 0u);
  EXPECT_EQ(stats.pending, 0u);
}

// -----------------------------------------------------------------------------
// 4. Closing a position twice records the closure once.
// Why: The ledger sink books P&L per recordClosure call.
// -----------------------------------------------------------------------------
TEST_F(SettlementWorkerPoolTest, RepeatedCloseIsNotRecordedTwice) {
  queue.enqueue(openTrade("p1"));
  pool.settleOne();

  tickrisk::domain::TrackedPosition p = *store.position("p1");
  ASSERT_TRUE(monitor.enqueueClose(p, CloseReason::StopLoss, 1.0949));
  ASSERT_TRUE(pool.settleOne());
  ASSERT_EQ(notifications.closures.size(), 1u);
  const int settled = count<tickrisk::TradeSettledEvent>();

  ASSERT_TRUE(monitor.enqueueClose(p, CloseReason::StopLoss, 1.0940))
      << "No close is in flight, so the queue accepts the second one";
  index.upsert(p);
  ASSERT_TRUE(pool.settleOne());

  EXPECT_EQ(store.closeCalls(), 2u);
  EXPECT_EQ(notifications.closures.size(), 1u);
  EXPECT_EQ(count<tickrisk::TradeSettledEvent>(), settled);
  EXPECT_FALSE(index.contains("p1"));
  EXPECT_NEAR(store.capital("u1", "ctx").value_or(0.0), 10'000.0 - 510.0, 1e-6);

  auto stats = queue.stats();
  EXPECT_EQ(stats.completed, 3u);
  EXPECT_EQ(stats.processing, 0u);
  EXPECT_EQ(stats.retried, 0u);
}

// -----------------------------------------------------------------------------
// 5. Modify clears the take-profit and moves the stop.
// -----------------------------------------------------------------------------
TEST_F(SettlementWorkerPoolTest, ModifyUpdatesStoreAndIndex) {
  queue.enqueue(openTrade("p1"));
  pool.settleOne();

  QueuedTrade modify;
  modify.user_id = "u1";
  modify.position_id = "p1";
  modify.action = TradeAction::Modify;
  modify.payload = {{"stop_loss", 1.0980}, {"take_profit", nullptr}};
  queue.enqueue(modify);
  ASSERT_TRUE(pool.settleOne());

  auto stored = store.position("p1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->stop_loss.value_or(0.0), 1.0980);
  EXPECT_FALSE(stored->take_profit.has_value());

  auto indexed = index.forSymbol("EUR/USD");
  ASSERT_EQ(indexed.size(), 1u);
  EXPECT_DOUBLE_EQ(indexed[0].stop_loss.value_or(0.0), 1.0980);
}

TEST_F(SettlementWorkerPoolTest, MalformedPayloadFailsCleanly) {
  QueuedTrade bad;
  bad.user_id = "u1";
  bad.position_id = "p1";
  bad.action = TradeAction::Close;
  bad.payload = {{"exit_price", "not-a-number"}};
  queue.enqueue(bad);

  EXPECT_NO_THROW(pool.settleOne());
  EXPECT_EQ(queue.stats().retried, 1u);
}

// -----------------------------------------------------------------------------
// 6. Background workers.
// -----------------------------------------------------------------------------
TEST_F(SettlementWorkerPoolTest, WorkersDrainQueue) {
  for (int i = 0; i < 5; ++i) {
    queue.enqueue(openTrade("p" + std::to_string(i)));
  }

  pool.start();
  EXPECT_TRUE(pool.running());
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (store.openCount() < 5 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  pool.stop();

  EXPECT_FALSE(pool.running());
  EXPECT_EQ(store.openCount(), 5u) << "Workers did not settle every open";
  EXPECT_EQ(index.size(), 5u);
}
