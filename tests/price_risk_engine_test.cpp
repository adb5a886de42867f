// =============================================================================
// price_risk_engine_test.cpp
// =============================================================================
// End-to-end tests for tickrisk::PriceRiskEngine with in-memory adapters.
//
// Validates:
//   - ingestQuote() -> price loop -> cache -> trigger -> queue -> settlement
//     -> TradeSettledEvent on the telemetry bus, with the store updated
//   - getPrice() canonicalises feed spellings and falls back when unpriced
//   - Risk facade: margin status and order validation with context
//     thresholds
//   - executeCommand(): PING, QUEUE, PRICE, unknown verbs
// =============================================================================

#include "tickrisk/engine/price_risk_engine.hpp"
#include "tickrisk/store/in_memory_position_store.hpp"
#include "tickrisk/store/logging_notification_sink.hpp"
#include "tickrisk/store/static_risk_settings_store.hpp"
#include "tickrisk/time/manual_clock.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <future>

using namespace std::chrono_literals;

class PriceRiskEngineTest : public ::testing::Test {
 protected:
  static tickrisk::EngineConfig quietConfig() {
    tickrisk::EngineConfig c;
    c.ipc_cmd_endpoint.clear();
    c.ipc_pub_endpoint.clear();
    c.feed_endpoint.clear();
    c.rest_base_url.clear();
    c.journal_path.clear();
    c.sweep_interval_ms = 60'000;
    c.settlement_workers = 1;
    return c;
  }

  void SetUp() override {
    store.addAccount("u1", "ctx", 10'000.0);

    tickrisk::domain::TrackedPosition p;
    p.position_id = "p1";
    p.symbol = "EUR/USD";
    p.side = tickrisk::domain::PositionSide::Long;
    p.entry_price = 1.1000;
    p.quantity = 1.0;
    p.stop_loss = 1.0950;
    p.user_id = "u1";
    p.context_id = "ctx";
    ASSERT_TRUE(store.openPosition(p, 1'100.0, 100.0).ok);
    position = p;
  }

  static nlohmann::json run(tickrisk::PriceRiskEngine& engine,
                            const std::string& cmd) {
    return nlohmann::json::parse(engine.executeCommand(cmd));
  }

  tickrisk::ManualClock clock;
  tickrisk::InMemoryPositionStore store;
  tickrisk::StaticRiskSettingsStore settings;
  tickrisk::LoggingNotificationSink notifications;
  tickrisk::domain::TrackedPosition position;
  tickrisk::PriceRiskEngine engine{quietConfig(), clock, store, settings,
                                   notifications};
};

// -----------------------------------------------------------------------------
// 1. Tick below the stop closes the position through the whole pipeline.
// Why: This is the engine's core promise.
// -----------------------------------------------------------------------------
TEST_F(PriceRiskEngineTest, TickBelowStopSettlesClose) {
  std::promise<tickrisk::TradeSettledEvent> settled;
  auto future = settled.get_future();
  std::atomic<bool> fired{false};
  engine.telemetryEventBus().subscribe<tickrisk::TradeSettledEvent>(
      [&](const tickrisk::TradeSettledEvent& e) {
        if (!fired.exchange(true)) {
          settled.set_value(e);
        }
      });

  engine.trackPosition(position);
  engine.start();

  tickrisk::domain::PriceQuote q;
  q.symbol = "EURUSD";
  q.bid = 1.0940;
  q.ask = 1.0942;
  q.timestamp_ms = clock.now_ms();
  engine.ingestQuote(q);

  ASSERT_EQ(future.wait_for(3s), std::future_status::ready)
      << "Close was not settled through the pipeline";
  auto e = future.get();
  EXPECT_EQ(e.trade.position_id, "p1");
  EXPECT_EQ(e.trade.action, tickrisk::domain::TradeAction::Close);
  EXPECT_NEAR(e.realized_pnl, -600.0, 1e-6);

  EXPECT_FALSE(store.position("p1").has_value());
  EXPECT_NEAR(store.capital("u1", "ctx").value_or(0.0), 9'400.0, 1e-6);
  EXPECT_EQ(engine.trackedPositions(), 0u);
  EXPECT_EQ(notifications.recorded(), 1u);

  auto price = engine.getPrice("eur-usd");
  ASSERT_TRUE(price.has_value());
  EXPECT_EQ(price->source, tickrisk::domain::QuoteSource::Stream);

  engine.stop();
  EXPECT_EQ(store.closeCalls(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Without any tier populated the static reference price is served.
// -----------------------------------------------------------------------------
TEST_F(PriceRiskEngineTest, GetPriceFallsBackWhenUnpriced) {
  auto q = engine.getPrice("C:GBPUSD");
  ASSERT_TRUE(q.has_value());
  EXPECT_EQ(q->symbol, "GBP/USD");
  EXPECT_EQ(q->source, tickrisk::domain::QuoteSource::Fallback);
  EXPECT_TRUE(q->is_stale);

  auto all = engine.getPrices({"EUR/USD", "XXX/YYY"});
  EXPECT_EQ(all.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Risk facade.
// -----------------------------------------------------------------------------
TEST_F(PriceRiskEngineTest, RiskFacadeUsesContextThresholds) {
  auto snap = engine.getMarginStatus(1'000.0, -200.0, 1'000.0);
  EXPECT_EQ(snap.status, tickrisk::domain::MarginStatus::Danger);

  tickrisk::domain::RiskThresholds tight;
  tight.max_positions = 1;
  settings.setOverride("cup", tight);

  tickrisk::risk::OrderRequest order{0.1, 1.1, 100.0};
  tickrisk::risk::AccountState account{5'000.0, 1};
  EXPECT_TRUE(engine.validateNewOrder("ctx", order, account).valid);
  auto v = engine.validateNewOrder("cup", order, account);
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.error, "Maximum 1 open positions allowed");
}

// -----------------------------------------------------------------------------
// 4. Command surface.
// -----------------------------------------------------------------------------
TEST_F(PriceRiskEngineTest, ExecuteCommandResponses) {
  auto ping = run(engine, "PING");
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  tickrisk::domain::QueuedTrade close;
  close.user_id = "u1";
  close.position_id = "p1";
  close.action = tickrisk::domain::TradeAction::Close;
  close.payload = {{"exit_price", 1.1010}, {"reason", "manual"}};
  ASSERT_TRUE(engine.submitTrade(close).has_value());

  auto queue = run(engine, "QUEUE");
  EXPECT_EQ(queue["status"], "ok");
  EXPECT_EQ(queue["queue"]["pending"], 1);

  auto price = run(engine, "PRICE USD/JPY");
  EXPECT_EQ(price["status"], "ok");
  EXPECT_EQ(price["quote"]["symbol"], "USD/JPY");
  EXPECT_EQ(price["quote"]["source"], "fallback");

  auto missing = run(engine, "PRICE EUR/CHF");
  EXPECT_EQ(missing["status"], "error");
  EXPECT_EQ(missing["response"], "No price available for EUR/CHF");

  auto usage = run(engine, "PRICE");
  EXPECT_EQ(usage["response"], "Usage: PRICE <symbol>");

  auto unknown = run(engine, "LAUNCH");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: LAUNCH");

  auto status = run(engine, "STATUS");
  EXPECT_EQ(status["feed_state"], "disconnected");
}
