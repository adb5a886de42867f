#pragma once

#include "tickrisk/domain/price_quote.hpp"
#include "tickrisk/pricing/instrument_catalog.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tickrisk {

// -----------------------------------------------------------------------------
// SpreadEstimator — smoothed per-symbol spread learned from live quotes
// -----------------------------------------------------------------------------
//
// @brief  Keeps one exponentially smoothed spread per symbol, used to turn a
//         bare midpoint (aggregate bar close) into a bid/ask pair.
//
// @details
// Smoothing rule, with cur the current estimate and s the observation:
//
//   ratio = max(s / cur, cur / s)
//   ratio >  kJumpRatio → new = 0.9 * cur + 0.1 * s
//   otherwise           → new = 0.7 * cur + 0.3 * s
//
// The heavier damping on large jumps keeps one bad quote from causing a
// spread discontinuity. The first observation for a symbol is taken as-is.
// Non-positive or non-finite observations are ignored.
//
// Until a symbol has been observed, spreadFor() returns the catalog's
// class default (see InstrumentCatalog::defaultSpread).
//
// Thread model:
//   observe() is called from the stream client thread; spreadFor() from
//   the stream client, the cache and the fallback path. A shared_mutex lets
//   readers proceed concurrently.
//
// Ownership:
//   Owned by PriceRiskEngine. Holds a const reference to the catalog.
// -----------------------------------------------------------------------------
class SpreadEstimator {
 public:
  static constexpr double kJumpRatio = 5.0;

  explicit SpreadEstimator(const InstrumentCatalog& catalog);

  SpreadEstimator(const SpreadEstimator&) = delete;
  SpreadEstimator& operator=(const SpreadEstimator&) = delete;

  // Folds one real bid/ask spread into the estimate.
  void observe(const std::string& symbol, double spread);

  double spreadFor(const std::string& symbol) const;

  bool hasObservation(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // syntheticQuote(symbol, mid, timestamp_ms, source)
  // -------------------------------------------------------------------------
  // @brief  Builds bid = mid - s/2, ask = mid + s/2 with s = spreadFor().
  //
  // @return The quote after QuoteNormalizer; std::nullopt if mid is not a
  //         usable price.
  // -------------------------------------------------------------------------
  std::optional<domain::PriceQuote> syntheticQuote(
      const std::string& symbol, double mid, std::int64_t timestamp_ms,
      domain::QuoteSource source) const;

 private:
  const InstrumentCatalog& catalog_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, double> spreads_;
};

}  // namespace tickrisk
