#pragma once

#include <cstdint>
#include <string>

namespace tickrisk {
namespace domain {

// -----------------------------------------------------------------------------
// QuoteSource — which tier produced a quote
// -----------------------------------------------------------------------------
//
//   Stream   → the live market-data subscription (streaming tier).
//   Fetched  → a synchronous upstream REST lookup.
//   Cached   → the process-local or shared distributed tier.
//   Fallback → last-known quote or static reference price.
// -----------------------------------------------------------------------------
enum class QuoteSource { Stream, Fetched, Cached, Fallback };

inline const char* toString(QuoteSource s) {
  switch (s) {
    case QuoteSource::Stream:   return "stream";
    case QuoteSource::Fetched:  return "fetched";
    case QuoteSource::Cached:   return "cached";
    case QuoteSource::Fallback: return "fallback";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// PriceQuote — a normalized two-sided price for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Immutable snapshot of bid/ask for a symbol at a point in time.
//
// @details
// mid and spread are derived fields. QuoteNormalizer recomputes them from
// bid/ask every time a quote enters or leaves the cache, so a quote that
// has passed normalization always satisfies bid <= mid <= ask and
// spread = ask - bid >= 0.
//
// A quote is superseded, never mutated: the next quote for the same symbol
// replaces it in each tier. timestamp_ms is the upstream observation time
// (epoch milliseconds), received_ms is when this process stored it; tier
// ages are measured from received_ms.
//
// Thread model:
//   Value type. Copied freely between the ingestion, cache and worker
//   threads.
// -----------------------------------------------------------------------------
struct PriceQuote {
  std::string symbol;                     // Canonical pair, e.g. "EUR/USD"
  double bid{0.0};
  double ask{0.0};
  double mid{0.0};
  double spread{0.0};
  std::int64_t timestamp_ms{0};           // Upstream observation time
  std::int64_t received_ms{0};            // Local arrival time
  QuoteSource source{QuoteSource::Stream};
  bool is_stale{false};                   // Last-known older than threshold
};

}  // namespace domain
}  // namespace tickrisk
