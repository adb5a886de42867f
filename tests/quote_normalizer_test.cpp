// =============================================================================
// quote_normalizer_test.cpp
// =============================================================================
// Unit tests for tickrisk::QuoteNormalizer.
//
// Validates:
//   - Prices are rounded to five decimals, mid and spread recomputed
//   - Crossed, zero, negative and non-finite prices are rejected
//   - A quote whose bid and ask collapse after rounding is rejected
//   - bid <= mid <= ask and spread >= 0 hold for every accepted quote,
//     including sub-pip spreads and JPY-scale prices
// =============================================================================

#include "tickrisk/pricing/quote_normalizer.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <utility>
#include <vector>

namespace {

tickrisk::domain::PriceQuote quote(double bid, double ask) {
  tickrisk::domain::PriceQuote q;
  q.symbol = "EUR/USD";
  q.bid = bid;
  q.ask = ask;
  q.timestamp_ms = 42;
  return q;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Rounding to five places and derived fields.
// -----------------------------------------------------------------------------
TEST(QuoteNormalizerTest, RoundsAndDerivesMidAndSpread) {
  auto q = tickrisk::QuoteNormalizer::normalize(quote(1.099994, 1.100006));

  ASSERT_TRUE(q.has_value());
  EXPECT_NEAR(q->bid, 1.09999, 1e-12);
  EXPECT_NEAR(q->ask, 1.10001, 1e-12);
  EXPECT_NEAR(q->mid, 1.10000, 1e-12);
  EXPECT_NEAR(q->spread, 0.00002, 1e-12);
  EXPECT_LE(q->bid, q->mid);
  EXPECT_LE(q->mid, q->ask);
  EXPECT_EQ(q->symbol, "EUR/USD");
  EXPECT_EQ(q->timestamp_ms, 42);
}

TEST(QuoteNormalizerTest, RoundHalfAwayFromZero) {
  EXPECT_NEAR(tickrisk::QuoteNormalizer::round(1.123456), 1.12346, 1e-12);
  EXPECT_NEAR(tickrisk::QuoteNormalizer::round(149.5), 149.5, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Unusable inputs never reach the cache.
// Why: A crossed or zero quote would corrupt triggers and margin marks.
// -----------------------------------------------------------------------------
TEST(QuoteNormalizerTest, RejectsInvalidPrices) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(1.2, 1.1)));
  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(1.1, 1.1)));
  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(0.0, 1.1)));
  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(-1.0, 1.1)));
  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(nan, 1.1)));
  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(1.1, inf)));
}

TEST(QuoteNormalizerTest, RejectsQuoteCollapsedByRounding) {
  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(1.100001, 1.100004)));
}

TEST(QuoteNormalizerTest, RejectsBidRoundedToZero) {
  EXPECT_FALSE(tickrisk::QuoteNormalizer::normalize(quote(0.000004, 0.00002)));
}

// -----------------------------------------------------------------------------
// 3. Ordering survives rounding for awkward inputs.
// Why: Mid is rounded separately from bid and ask, so it can land outside
//      them unless clamped.
// -----------------------------------------------------------------------------
TEST(QuoteNormalizerTest, OrderingHoldsForEveryAcceptedQuote) {
  const std::vector<std::pair<double, double>> inputs = {
      {1.099994, 1.100006},  {1.000005, 1.000015},  {1.000004, 1.000016},
      {1.234565, 1.234575},  {0.999995, 1.000005},  {0.66001, 0.66002},
      {1.0000049, 1.0000151}, {0.00001, 0.00002},   {0.000015, 0.000026},
      {149.123455, 149.123465}, {149.99999, 150.00001}, {164.300004, 164.300016},
      {19.123454, 19.123476}, {1.27, 1.2700099},    {0.61000499, 0.61001501},
      {1.100001, 1.100004},   {0.000004, 0.00002},  {1.36, 1.36000000001},
  };

  int accepted = 0;
  for (const auto& [bid, ask] : inputs) {
    auto q = tickrisk::QuoteNormalizer::normalize(quote(bid, ask));
    if (!q) {
      continue;
    }
    ++accepted;
    SCOPED_TRACE(testing::Message() << "bid=" << bid << " ask=" << ask);
    EXPECT_GT(q->bid, 0.0);
    EXPECT_LE(q->bid, q->mid);
    EXPECT_LE(q->mid, q->ask);
    EXPECT_LT(q->bid, q->ask);
    EXPECT_GE(q->spread, 0.0);
    EXPECT_NEAR(q->spread, q->ask - q->bid, 1e-9);
    EXPECT_DOUBLE_EQ(q->bid, tickrisk::QuoteNormalizer::round(q->bid));
    EXPECT_DOUBLE_EQ(q->ask, tickrisk::QuoteNormalizer::round(q->ask));
  }
  EXPECT_GE(accepted, 12) << "Too few inputs survived to exercise ordering";
}
