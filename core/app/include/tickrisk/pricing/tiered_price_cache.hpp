#pragma once

#include "tickrisk/domain/price_quote.hpp"
#include "tickrisk/pricing/i_quote_fetcher.hpp"
#include "tickrisk/pricing/i_shared_price_tier.hpp"
#include "tickrisk/pricing/instrument_catalog.hpp"
#include "tickrisk/pricing/spread_estimator.hpp"
#include "tickrisk/time/i_clock.hpp"

#include <atomic>
#include <cstdint>
#include <limits>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// CacheTimings — tier freshness windows and fetch pacing
// -----------------------------------------------------------------------------
struct CacheTimings {
  std::int64_t stream_ttl_ms{10'000};     // Streaming tier freshness
  std::int64_t local_ttl_ms{15'000};      // Process-local tier freshness
  std::int64_t shared_ttl_ms{10'000};     // TTL written to the shared tier
  std::int64_t fetch_cooldown_ms{2'000};  // System-wide inter-fetch gap
  std::int64_t stale_after_ms{300'000};   // Last-known considered stale
};

// -----------------------------------------------------------------------------
// CacheStats — per-tier hit counters
// -----------------------------------------------------------------------------
struct CacheStats {
  std::uint64_t stream_hits{0};
  std::uint64_t local_hits{0};
  std::uint64_t shared_hits{0};
  std::uint64_t fetched{0};
  std::uint64_t fallback_hits{0};
  std::uint64_t misses{0};
  std::uint64_t fetch_calls{0};
  std::uint64_t rejected_writes{0};
};

// -----------------------------------------------------------------------------
// TieredPriceCache — streaming-first price lookup with graceful degradation
// -----------------------------------------------------------------------------
//
// @brief  Resolves the best available quote per symbol from five tiers,
//         fastest and freshest first.
//
// @details
// Resolution order for each requested symbol:
//
//   1. Streaming tier, if received less than stream_ttl_ms ago.
//   2. Process-local tier, if received less than local_ttl_ms ago.
//   3. Shared distributed tier, only for symbols this process has never
//      held a quote for (cold start).
//   4. Upstream fetch, at most once per fetch_cooldown_ms across the whole
//      process. A caller that finds a fetch already in flight, or the
//      cooldown still running, does not wait; it falls through to tier 5.
//   5. Last-known quote regardless of age, returned with source Fallback
//      and is_stale set when older than stale_after_ms. A symbol with no
//      last-known quote gets the catalog's static reference price (when
//      enabled), also marked Fallback and stale.
//
// getAll() walks the tiers once for the whole batch and only carries the
// still-missing symbols down to the next tier. A symbol no tier can price is
// simply absent from the result; "no price" is never an error.
//
// Write-through upward: a shared-tier hit is copied into the local tier; a
// fetched quote is copied into the local tier, the shared tier and the
// last-known slot. A streaming put() refreshes the streaming tier, the local
// tier and the last-known slot. Every quote is normalized on the way in and
// again on the way out.
//
// Thread model:
//   put() runs on the price loop thread; get()/getAll() from any thread
//   (order placement, margin monitor, IPC). One shared_mutex guards the
//   three in-process maps; it is never held across the shared tier or the
//   fetcher. Fetch exclusivity is an atomic in-flight flag.
//
// Ownership:
//   Owned by PriceRiskEngine. Holds references to the clock, catalog and
//   spread estimator, and non-owning pointers to the fetcher and shared
//   tier (either may be null, disabling that tier).
// -----------------------------------------------------------------------------
class TieredPriceCache {
 public:
  TieredPriceCache(const IClock& clock,
                   const InstrumentCatalog& catalog,
                   const SpreadEstimator& spreads,
                   IQuoteFetcher* fetcher,
                   ISharedPriceTier* shared_tier,
                   CacheTimings timings = {},
                   bool static_fallback = true);

  TieredPriceCache(const TieredPriceCache&) = delete;
  TieredPriceCache& operator=(const TieredPriceCache&) = delete;
  TieredPriceCache(TieredPriceCache&&) = delete;
  TieredPriceCache& operator=(TieredPriceCache&&) = delete;

  std::optional<domain::PriceQuote> get(const std::string& symbol);

  std::unordered_map<std::string, domain::PriceQuote> getAll(
      const std::vector<std::string>& symbols);

  // -------------------------------------------------------------------------
  // put(quote)
  // -------------------------------------------------------------------------
  // @brief  Stores a quote, routed by quote.source.
  //
  // @details
  // Stream quotes land in the streaming tier; any other source lands in
  // the local tier. Both refresh the last-known slot. received_ms is
  // stamped with the clock.
  //
  // @return The normalized quote as stored, or std::nullopt if the
  //         normalizer rejected it. On rejection every tier keeps its
  //         previous value.
  // -------------------------------------------------------------------------
  std::optional<domain::PriceQuote> put(const domain::PriceQuote& quote);

  // -------------------------------------------------------------------------
  // peek(symbol)
  // -------------------------------------------------------------------------
  // @brief  Best quote already held in process (tiers 1, 2 and 5), with no
  //         shared-tier read and no fetch.
  // -------------------------------------------------------------------------
  std::optional<domain::PriceQuote> peek(const std::string& symbol) const;

  CacheStats stats() const;

  bool fetchInFlight() const { return fetch_in_flight_.load(); }

 private:
  static constexpr std::int64_t kNeverFetched =
      std::numeric_limits<std::int64_t>::min();

  // Tier 1/2 lookup under the read lock. Appends misses to `missing`.
  void resolveInProcess(const std::vector<std::string>& symbols,
                        std::int64_t now,
                        std::unordered_map<std::string, domain::PriceQuote>& out,
                        std::vector<std::string>& missing);

  void resolveShared(std::int64_t now,
                     std::unordered_map<std::string, domain::PriceQuote>& out,
                     std::vector<std::string>& missing);

  void resolveFetch(std::int64_t now,
                    std::unordered_map<std::string, domain::PriceQuote>& out,
                    std::vector<std::string>& missing);

  void resolveFallback(std::int64_t now,
                       std::unordered_map<std::string, domain::PriceQuote>& out,
                       std::vector<std::string>& missing);

  // Claims the fetch slot if the cooldown allows and nobody holds it.
  bool tryBeginFetch(std::int64_t now);

  // Local tier + last-known write of an already-normalized quote. Does not
  // replace an entry carrying a newer upstream timestamp.
  void storeLocal(const domain::PriceQuote& quote);

  const IClock& clock_;
  const InstrumentCatalog& catalog_;
  const SpreadEstimator& spreads_;
  IQuoteFetcher* fetcher_;
  ISharedPriceTier* shared_tier_;
  CacheTimings timings_;
  bool static_fallback_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::PriceQuote> stream_tier_;
  std::unordered_map<std::string, domain::PriceQuote> local_tier_;
  std::unordered_map<std::string, domain::PriceQuote> last_known_;

  std::atomic<bool> fetch_in_flight_{false};
  std::atomic<std::int64_t> last_fetch_ms_{kNeverFetched};

  std::atomic<std::uint64_t> stream_hits_{0};
  std::atomic<std::uint64_t> local_hits_{0};
  std::atomic<std::uint64_t> shared_hits_{0};
  std::atomic<std::uint64_t> fetched_{0};
  std::atomic<std::uint64_t> fallback_hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> fetch_calls_{0};
  std::atomic<std::uint64_t> rejected_writes_{0};
};

}  // namespace tickrisk
