#include "tickrisk/pricing/quote_normalizer.hpp"

#include <algorithm>
#include <cmath>

namespace tickrisk {

namespace {

constexpr double kScale = 100000.0;  // 10^kDecimals

bool usablePrice(double p) { return std::isfinite(p) && p > 0.0; }

}  // namespace

double QuoteNormalizer::round(double value) {
  return std::round(value * kScale) / kScale;
}

// -----------------------------------------------------------------------------
// normalize(): validate, round, recompute mid/spread, clamp
// -----------------------------------------------------------------------------
std::optional<domain::PriceQuote> QuoteNormalizer::normalize(
    domain::PriceQuote quote) {
  if (!usablePrice(quote.bid) || !usablePrice(quote.ask) ||
      quote.bid >= quote.ask) {
    return std::nullopt;
  }

  const double bid = round(quote.bid);
  const double ask = round(quote.ask);
  if (!usablePrice(bid) || bid >= ask) {
    return std::nullopt;
  }

  quote.bid = bid;
  quote.ask = ask;
  quote.mid = std::clamp(round((bid + ask) / 2.0), bid, ask);
  quote.spread = std::max(0.0, round(ask - bid));
  return quote;
}

}  // namespace tickrisk
