// =============================================================================
// position_trigger_index_test.cpp
// =============================================================================
// Unit tests for tickrisk::PositionTriggerIndex.
//
// Validates:
//   - Long stop-loss fires on the bid, once; the position leaves the index
//   - Short triggers use the ask
//   - Stop-loss wins when both levels are crossed
//   - Positions without SL/TP are never indexed
//   - replaceAll() swaps the whole index
// =============================================================================

#include "tickrisk/risk/position_trigger_index.hpp"

#include <gtest/gtest.h>

using tickrisk::domain::CloseReason;
using tickrisk::domain::PositionSide;
using tickrisk::domain::TrackedPosition;

namespace {

TrackedPosition position(const std::string& id, const std::string& symbol,
                         PositionSide side, std::optional<double> sl,
                         std::optional<double> tp) {
  TrackedPosition p;
  p.position_id = id;
  p.symbol = symbol;
  p.side = side;
  p.entry_price = 1.1000;
  p.quantity = 1.0;
  p.stop_loss = sl;
  p.take_profit = tp;
  p.user_id = "u1";
  p.context_id = "ctx";
  return p;
}

}  // namespace

class PositionTriggerIndexTest : public ::testing::Test {
 protected:
  tickrisk::PositionTriggerIndex index;
};

// -----------------------------------------------------------------------------
// 1. Long SL 1.0950, bid 1.0949: one hit at the bid, then nothing.
// Why: A second tick must never enqueue a second close.
// -----------------------------------------------------------------------------
TEST_F(PositionTriggerIndexTest, LongStopLossFiresOnce) {
  index.upsert(position("p1", "EUR/USD", PositionSide::Long, 1.0950, 1.1100));

  auto hits = index.evaluate("EUR/USD", 1.0949, 1.0951);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].position.position_id, "p1");
  EXPECT_EQ(hits[0].reason, CloseReason::StopLoss);
  EXPECT_DOUBLE_EQ(hits[0].price, 1.0949);
  EXPECT_FALSE(index.contains("p1"));

  EXPECT_TRUE(index.evaluate("EUR/USD", 1.0940, 1.0942).empty());
  EXPECT_EQ(index.size(), 0u);
}

TEST_F(PositionTriggerIndexTest, LongTakeProfitAndNoTrigger) {
  index.upsert(position("p1", "EUR/USD", PositionSide::Long, 1.0950, 1.1100));

  EXPECT_TRUE(index.evaluate("EUR/USD", 1.1050, 1.1052).empty());
  auto hits = index.evaluate("EUR/USD", 1.1100, 1.1102);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].reason, CloseReason::TakeProfit);
}

// -----------------------------------------------------------------------------
// 2. Shorts close at the ask.
// -----------------------------------------------------------------------------
TEST_F(PositionTriggerIndexTest, ShortSideUsesAsk) {
  index.upsert(position("s1", "GBP/USD", PositionSide::Short, 1.2800, 1.2600));

  // Ask still below the stop: no close.
  EXPECT_TRUE(index.evaluate("GBP/USD", 1.2790, 1.2795).empty());

  auto hits = index.evaluate("GBP/USD", 1.2798, 1.2800);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].reason, CloseReason::StopLoss);
  EXPECT_DOUBLE_EQ(hits[0].price, 1.2800);
}

// -----------------------------------------------------------------------------
// 3. Both crossed (inverted levels after a modify): stop-loss wins.
// -----------------------------------------------------------------------------
TEST_F(PositionTriggerIndexTest, StopLossWinsTieBreak) {
  index.upsert(position("p1", "EUR/USD", PositionSide::Long, 1.1050, 1.1040));

  auto hits = index.evaluate("EUR/USD", 1.1045, 1.1047);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].reason, CloseReason::StopLoss);
}

// -----------------------------------------------------------------------------
// 4. Index bookkeeping.
// -----------------------------------------------------------------------------
TEST_F(PositionTriggerIndexTest, PositionsWithoutLevelsAreNotIndexed) {
  index.upsert(position("p1", "EUR/USD", PositionSide::Long, std::nullopt,
                        std::nullopt));
  EXPECT_FALSE(index.contains("p1"));

  index.upsert(position("p2", "EUR/USD", PositionSide::Long, 1.09, std::nullopt));
  EXPECT_TRUE(index.contains("p2"));

  // Clearing both levels on modify drops it.
  index.upsert(position("p2", "EUR/USD", PositionSide::Long, std::nullopt,
                        std::nullopt));
  EXPECT_FALSE(index.contains("p2"));
}

TEST_F(PositionTriggerIndexTest, UpsertMovesBetweenSymbols) {
  index.upsert(position("p1", "EUR/USD", PositionSide::Long, 1.09, std::nullopt));
  index.upsert(position("p1", "GBP/USD", PositionSide::Long, 1.26, std::nullopt));

  EXPECT_TRUE(index.forSymbol("EUR/USD").empty());
  ASSERT_EQ(index.forSymbol("GBP/USD").size(), 1u);
  EXPECT_EQ(index.symbols(), std::vector<std::string>{"GBP/USD"});
}

TEST_F(PositionTriggerIndexTest, ReplaceAllAndTake) {
  index.upsert(position("old", "EUR/USD", PositionSide::Long, 1.09, std::nullopt));

  auto indexed = index.replaceAll(
      {position("a", "EUR/USD", PositionSide::Long, 1.09, std::nullopt),
       position("b", "USD/JPY", PositionSide::Short, 151.0, std::nullopt),
       position("c", "USD/JPY", PositionSide::Short, std::nullopt,
                std::nullopt)});

  EXPECT_EQ(indexed, 2u);
  EXPECT_FALSE(index.contains("old"));
  EXPECT_EQ(index.size(), 2u);

  auto taken = index.take("b");
  ASSERT_TRUE(taken.has_value());
  EXPECT_EQ(taken->symbol, "USD/JPY");
  EXPECT_FALSE(index.take("b").has_value());
  EXPECT_FALSE(index.remove("b"));
  EXPECT_TRUE(index.remove("a"));
  EXPECT_EQ(index.size(), 0u);
}
