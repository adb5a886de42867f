#pragma once

#include "tickrisk/domain/price_quote.hpp"

#include <optional>

namespace tickrisk {

// -----------------------------------------------------------------------------
// QuoteNormalizer — the single gate every quote passes through
// -----------------------------------------------------------------------------
//
// @brief  Validates bid/ask and recomputes the derived fields.
//
// @details
// normalize() rounds bid and ask to kDecimals places, then derives
//   mid    = (bid + ask) / 2, rounded, then clamped into [bid, ask]
//   spread = ask - bid, rounded, never negative
// so the post-condition bid <= mid <= ask holds exactly in floating point
// even when rounding pushes the computed mid past a bound.
//
// Rejected outright (std::nullopt):
//   - bid or ask non-finite or <= 0
//   - bid >= ask, before or after rounding
//
// The incoming mid/spread are ignored; they are always recomputed.
//
// Thread model:
//   Stateless; call from any thread.
// -----------------------------------------------------------------------------
class QuoteNormalizer {
 public:
  static constexpr int kDecimals = 5;

  static std::optional<domain::PriceQuote> normalize(domain::PriceQuote quote);

  // Rounds half away from zero to kDecimals places.
  static double round(double value);
};

}  // namespace tickrisk
