#include "tickrisk/pricing/spread_estimator.hpp"

#include "tickrisk/pricing/quote_normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <utility>

namespace tickrisk {

SpreadEstimator::SpreadEstimator(const InstrumentCatalog& catalog)
    : catalog_(catalog) {}

// -----------------------------------------------------------------------------
// observe(): exponential smoothing with jump damping
// -----------------------------------------------------------------------------
void SpreadEstimator::observe(const std::string& symbol, double spread) {
  if (!std::isfinite(spread) || spread <= 0.0) {
    return;
  }

  std::unique_lock lock(mutex_);
  auto it = spreads_.find(symbol);
  if (it == spreads_.end()) {
    spreads_.emplace(symbol, spread);
    return;
  }

  const double cur = it->second;
  const double ratio = std::max(spread / cur, cur / spread);
  if (ratio > kJumpRatio) {
    it->second = cur * 0.9 + spread * 0.1;
  } else {
    it->second = cur * 0.7 + spread * 0.3;
  }
}

double SpreadEstimator::spreadFor(const std::string& symbol) const {
  {
    std::shared_lock lock(mutex_);
    auto it = spreads_.find(symbol);
    if (it != spreads_.end()) {
      return it->second;
    }
  }
  return catalog_.defaultSpread(symbol);
}

bool SpreadEstimator::hasObservation(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  return spreads_.count(symbol) != 0;
}

// -----------------------------------------------------------------------------
// syntheticQuote(): split the estimated spread around a midpoint
// -----------------------------------------------------------------------------
std::optional<domain::PriceQuote> SpreadEstimator::syntheticQuote(
    const std::string& symbol, double mid, std::int64_t timestamp_ms,
    domain::QuoteSource source) const {
  if (!std::isfinite(mid) || mid <= 0.0) {
    return std::nullopt;
  }

  const double half = spreadFor(symbol) / 2.0;

  domain::PriceQuote q;
  q.symbol = symbol;
  q.bid = mid - half;
  q.ask = mid + half;
  q.timestamp_ms = timestamp_ms;
  q.source = source;
  return QuoteNormalizer::normalize(std::move(q));
}

}  // namespace tickrisk
