// =============================================================================
// spread_estimator_test.cpp
// =============================================================================
// Unit tests for tickrisk::SpreadEstimator.
//
// Validates:
//   - Catalog default spread before any observation
//   - Exponential smoothing (0.7 / 0.3) for ordinary updates
//   - Jump damping (0.9 / 0.1) when the new spread differs by more than 5x
//   - syntheticQuote() splits the estimate symmetrically around the mid
// =============================================================================

#include "tickrisk/pricing/instrument_catalog.hpp"
#include "tickrisk/pricing/spread_estimator.hpp"

#include <gtest/gtest.h>

class SpreadEstimatorTest : public ::testing::Test {
 protected:
  tickrisk::InstrumentCatalog catalog;
  tickrisk::SpreadEstimator estimator{catalog};
};

// -----------------------------------------------------------------------------
// 1. Defaults come from the instrument class.
// -----------------------------------------------------------------------------
TEST_F(SpreadEstimatorTest, FallsBackToCatalogDefault) {
  EXPECT_FALSE(estimator.hasObservation("EUR/USD"));
  EXPECT_NEAR(estimator.spreadFor("EUR/USD"), 0.00015, 1e-12);
  EXPECT_NEAR(estimator.spreadFor("XAU/XAG"),
              tickrisk::InstrumentCatalog::kUnknownDefaultSpread, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Sequence 0.0002, 0.0003, 0.02: the last one is a jump and is damped.
// Why: One bad print must not blow out synthetic spreads.
// -----------------------------------------------------------------------------
TEST_F(SpreadEstimatorTest, SmoothsAndDampsJumps) {
  estimator.observe("EUR/USD", 0.0002);
  EXPECT_NEAR(estimator.spreadFor("EUR/USD"), 0.0002, 1e-12);

  estimator.observe("EUR/USD", 0.0003);
  const double smoothed = 0.7 * 0.0002 + 0.3 * 0.0003;
  EXPECT_NEAR(estimator.spreadFor("EUR/USD"), smoothed, 1e-12);

  estimator.observe("EUR/USD", 0.02);
  EXPECT_NEAR(estimator.spreadFor("EUR/USD"), 0.9 * smoothed + 0.1 * 0.02,
              1e-12);
}

TEST_F(SpreadEstimatorTest, IgnoresNonPositiveSpreads) {
  estimator.observe("GBP/USD", 0.0);
  estimator.observe("GBP/USD", -0.001);
  EXPECT_FALSE(estimator.hasObservation("GBP/USD"));
}

// -----------------------------------------------------------------------------
// 3. Synthetic quotes straddle the midpoint.
// -----------------------------------------------------------------------------
TEST_F(SpreadEstimatorTest, SyntheticQuoteStraddlesMid) {
  estimator.observe("EUR/USD", 0.0002);

  auto q = estimator.syntheticQuote("EUR/USD", 1.1, 1000,
                                    tickrisk::domain::QuoteSource::Fetched);

  ASSERT_TRUE(q.has_value());
  EXPECT_NEAR(q->bid, 1.0999, 1e-9);
  EXPECT_NEAR(q->ask, 1.1001, 1e-9);
  EXPECT_NEAR(q->mid, 1.1, 1e-9);
  EXPECT_EQ(q->timestamp_ms, 1000);
  EXPECT_EQ(q->source, tickrisk::domain::QuoteSource::Fetched);
}

TEST_F(SpreadEstimatorTest, SyntheticQuoteRejectsBadMid) {
  EXPECT_FALSE(estimator.syntheticQuote("EUR/USD", 0.0, 1,
                                        tickrisk::domain::QuoteSource::Fetched));
}
