// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for tickrisk::EventBus and EventLoopThread.
//
// Validates:
//   - Generic subscription sees every event kind
//   - Typed subscription sees only its own kind
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - Re-entrant publish (subscriber publishes inside callback) does not
//     deadlock
//   - EventLoopThread delivers pushed events on its own thread and survives
//     a throwing subscriber
// =============================================================================

#include "tickrisk/concurrent/event_loop_thread.hpp"
#include "tickrisk/eventbus/event_bus.hpp"
#include "tickrisk/events/event.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

class EventBusTest : public ::testing::Test {
 protected:
  tickrisk::EventBus bus;

  static tickrisk::PriceTickEvent makeTick(const std::string& symbol,
                                           double bid, double ask) {
    tickrisk::PriceTickEvent e;
    e.quote.symbol = symbol;
    e.quote.bid = bid;
    e.quote.ask = ask;
    return e;
  }

  static tickrisk::FeedStatusEvent makeStatus(tickrisk::domain::FeedState s) {
    tickrisk::FeedStatusEvent e;
    e.state = s;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event kind.
// Why: The IPC bridge subscribes generically to the telemetry bus.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const tickrisk::Event&) { ++calls; });

  bus.publish(makeTick("EUR/USD", 1.1, 1.1002));
  bus.publish(makeStatus(tickrisk::domain::FeedState::Connecting));
  bus.publish(tickrisk::TradeDroppedEvent{});

  EXPECT_EQ(calls, 3);
}

// -----------------------------------------------------------------------------
// 2. Typed subscription filters on the variant alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByKind) {
  int ticks = 0;
  bus.subscribe<tickrisk::PriceTickEvent>(
      [&ticks](const tickrisk::PriceTickEvent&) { ++ticks; });

  bus.publish(makeTick("EUR/USD", 1.1, 1.1002));
  bus.publish(makeStatus(tickrisk::domain::FeedState::Subscribed));

  EXPECT_EQ(ticks, 1);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id) the callback no longer fires; unknown ids are a
//    no-op.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<tickrisk::PriceTickEvent>(
      [&calls](const tickrisk::PriceTickEvent&) { ++calls; });

  bus.publish(makeTick("GBP/USD", 1.27, 1.2702));
  bus.unsubscribe(id);
  bus.publish(makeTick("GBP/USD", 1.28, 1.2802));

  EXPECT_EQ(calls, 1);
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
}

// -----------------------------------------------------------------------------
// 4. Publishing from inside a callback must not deadlock.
// Why: The price-loop subscriber forwards FeedStatusEvent while dispatching.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int statuses = 0;
  bus.subscribe<tickrisk::FeedStatusEvent>(
      [&statuses](const tickrisk::FeedStatusEvent&) { ++statuses; });
  bus.subscribe<tickrisk::PriceTickEvent>(
      [this](const tickrisk::PriceTickEvent&) {
        bus.publish(makeStatus(tickrisk::domain::FeedState::Subscribed));
      });

  bus.publish(makeTick("USD/JPY", 149.5, 149.52));

  EXPECT_EQ(statuses, 1);
}

// -----------------------------------------------------------------------------
// 5. Payload fields survive variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string symbol;
  double ask = 0.0;
  bus.subscribe<tickrisk::PriceTickEvent>(
      [&](const tickrisk::PriceTickEvent& e) {
        symbol = e.quote.symbol;
        ask = e.quote.ask;
      });

  bus.publish(makeTick("AUD/USD", 0.65990, 0.66010));

  EXPECT_EQ(symbol, "AUD/USD");
  EXPECT_DOUBLE_EQ(ask, 0.66010);
}

// -----------------------------------------------------------------------------
// 6. EventLoopThread publishes on its own thread.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DeliversOnLoopThread) {
  tickrisk::EventLoopThread loop("TestLoop");

  std::promise<std::thread::id> delivered;
  auto future = delivered.get_future();
  loop.eventBus().subscribe<tickrisk::PriceTickEvent>(
      [&delivered](const tickrisk::PriceTickEvent&) {
        delivered.set_value(std::this_thread::get_id());
      });

  loop.start();
  loop.push(tickrisk::PriceTickEvent{});

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready)
      << "Event was not delivered by the loop thread";
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
  EXPECT_FALSE(loop.running());
}

// -----------------------------------------------------------------------------
// 7. A subscriber that throws does not stop the loop.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, SurvivesThrowingSubscriber) {
  tickrisk::EventLoopThread loop("TestLoop");

  std::promise<void> second;
  auto future = second.get_future();
  int calls = 0;
  loop.eventBus().subscribe<tickrisk::PriceTickEvent>(
      [&](const tickrisk::PriceTickEvent&) {
        if (++calls == 1) {
          throw std::runtime_error("boom");
        }
        second.set_value();
      });

  loop.start();
  loop.push(tickrisk::PriceTickEvent{});
  loop.push(tickrisk::PriceTickEvent{});

  EXPECT_EQ(future.wait_for(2s), std::future_status::ready)
      << "Loop stopped dispatching after a subscriber threw";
  loop.stop();
}
