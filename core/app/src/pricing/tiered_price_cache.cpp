#include "tickrisk/pricing/tiered_price_cache.hpp"

#include "tickrisk/pricing/quote_normalizer.hpp"

#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace tickrisk {

namespace {

// Resets the fetch-in-flight flag when the fetch scope ends, including when
// the fetcher throws.
class FetchSlot {
 public:
  explicit FetchSlot(std::atomic<bool>& flag) : flag_(flag) {}
  ~FetchSlot() { flag_.store(false); }

  FetchSlot(const FetchSlot&) = delete;
  FetchSlot& operator=(const FetchSlot&) = delete;

 private:
  std::atomic<bool>& flag_;
};

// Final normalization pass applied to every quote leaving the cache.
void emit(std::unordered_map<std::string, domain::PriceQuote>& out,
          const domain::PriceQuote& quote) {
  if (auto normalized = QuoteNormalizer::normalize(quote)) {
    out[normalized->symbol] = std::move(*normalized);
  }
}

}  // namespace

TieredPriceCache::TieredPriceCache(const IClock& clock,
                                   const InstrumentCatalog& catalog,
                                   const SpreadEstimator& spreads,
                                   IQuoteFetcher* fetcher,
                                   ISharedPriceTier* shared_tier,
                                   CacheTimings timings,
                                   bool static_fallback)
    : clock_(clock),
      catalog_(catalog),
      spreads_(spreads),
      fetcher_(fetcher),
      shared_tier_(shared_tier),
      timings_(timings),
      static_fallback_(static_fallback) {}

// -----------------------------------------------------------------------------
// get(): single-symbol convenience over getAll()
// -----------------------------------------------------------------------------
std::optional<domain::PriceQuote> TieredPriceCache::get(
    const std::string& symbol) {
  auto all = getAll({symbol});
  auto it = all.find(symbol);
  if (it == all.end()) {
    return std::nullopt;
  }
  return std::move(it->second);
}

// -----------------------------------------------------------------------------
// getAll(): walk the tiers, carrying only missing symbols downward
// -----------------------------------------------------------------------------
std::unordered_map<std::string, domain::PriceQuote> TieredPriceCache::getAll(
    const std::vector<std::string>& symbols) {
  std::unordered_map<std::string, domain::PriceQuote> out;
  std::vector<std::string> missing;
  const std::int64_t now = clock_.now_ms();

  resolveInProcess(symbols, now, out, missing);
  if (!missing.empty() && shared_tier_ != nullptr) {
    resolveShared(now, out, missing);
  }
  if (!missing.empty() && fetcher_ != nullptr) {
    resolveFetch(now, out, missing);
  }
  if (!missing.empty()) {
    resolveFallback(now, out, missing);
  }

  misses_.fetch_add(missing.size());
  return out;
}

// -----------------------------------------------------------------------------
// resolveInProcess(): tiers 1 and 2
// -----------------------------------------------------------------------------
void TieredPriceCache::resolveInProcess(
    const std::vector<std::string>& symbols, std::int64_t now,
    std::unordered_map<std::string, domain::PriceQuote>& out,
    std::vector<std::string>& missing) {
  std::shared_lock lock(mutex_);
  for (const auto& symbol : symbols) {
    if (out.count(symbol) != 0) {
      continue;
    }

    auto s = stream_tier_.find(symbol);
    if (s != stream_tier_.end() &&
        now - s->second.received_ms < timings_.stream_ttl_ms) {
      emit(out, s->second);
      stream_hits_.fetch_add(1);
      continue;
    }

    auto l = local_tier_.find(symbol);
    if (l != local_tier_.end() &&
        now - l->second.received_ms < timings_.local_ttl_ms) {
      domain::PriceQuote q = l->second;
      if (q.source == domain::QuoteSource::Stream) {
        q.source = domain::QuoteSource::Cached;
      }
      emit(out, q);
      local_hits_.fetch_add(1);
      continue;
    }

    missing.push_back(symbol);
  }
}

// -----------------------------------------------------------------------------
// resolveShared(): tier 3, cold-start symbols only
// -----------------------------------------------------------------------------
void TieredPriceCache::resolveShared(
    std::int64_t now, std::unordered_map<std::string, domain::PriceQuote>& out,
    std::vector<std::string>& missing) {
  std::vector<std::string> cold;
  std::vector<std::string> still_missing;
  {
    std::shared_lock lock(mutex_);
    for (const auto& symbol : missing) {
      if (last_known_.count(symbol) == 0) {
        cold.push_back(symbol);
      } else {
        still_missing.push_back(symbol);
      }
    }
  }

  for (const auto& symbol : cold) {
    std::optional<domain::PriceQuote> hit = shared_tier_->get(symbol);
    std::optional<domain::PriceQuote> normalized;
    if (hit) {
      hit->symbol = symbol;
      hit->source = domain::QuoteSource::Cached;
      hit->received_ms = now;
      normalized = QuoteNormalizer::normalize(std::move(*hit));
    }
    if (!normalized) {
      still_missing.push_back(symbol);
      continue;
    }
    storeLocal(*normalized);
    emit(out, *normalized);
    shared_hits_.fetch_add(1);
  }

  missing = std::move(still_missing);
}

// -----------------------------------------------------------------------------
// resolveFetch(): tier 4, paced system-wide
// -----------------------------------------------------------------------------
void TieredPriceCache::resolveFetch(
    std::int64_t now, std::unordered_map<std::string, domain::PriceQuote>& out,
    std::vector<std::string>& missing) {
  if (!tryBeginFetch(now)) {
    return;
  }

  std::unordered_map<std::string, domain::PriceQuote> fetched;
  {
    FetchSlot slot(fetch_in_flight_);
    fetch_calls_.fetch_add(1);
    try {
      fetched = fetcher_->fetch(missing);
    } catch (const std::exception& e) {
      std::cerr << "[PriceCache] ERROR: upstream fetch failed: " << e.what()
                << "\n";
      return;
    }
  }

  std::vector<std::string> still_missing;
  for (const auto& symbol : missing) {
    auto it = fetched.find(symbol);
    std::optional<domain::PriceQuote> normalized;
    if (it != fetched.end()) {
      domain::PriceQuote q = it->second;
      q.symbol = symbol;
      q.source = domain::QuoteSource::Fetched;
      q.received_ms = clock_.now_ms();
      q.is_stale = false;
      normalized = QuoteNormalizer::normalize(std::move(q));
      if (!normalized) {
        rejected_writes_.fetch_add(1);
      }
    }
    if (!normalized) {
      still_missing.push_back(symbol);
      continue;
    }

    storeLocal(*normalized);
    if (shared_tier_ != nullptr) {
      shared_tier_->put(*normalized, timings_.shared_ttl_ms);
    }
    emit(out, *normalized);
    fetched_.fetch_add(1);
  }

  missing = std::move(still_missing);
}

// -----------------------------------------------------------------------------
// resolveFallback(): tier 5, last-known then static reference price
// -----------------------------------------------------------------------------
void TieredPriceCache::resolveFallback(
    std::int64_t now, std::unordered_map<std::string, domain::PriceQuote>& out,
    std::vector<std::string>& missing) {
  std::vector<std::string> still_missing;
  {
    std::shared_lock lock(mutex_);
    for (const auto& symbol : missing) {
      auto it = last_known_.find(symbol);
      if (it == last_known_.end()) {
        still_missing.push_back(symbol);
        continue;
      }
      domain::PriceQuote q = it->second;
      q.source = domain::QuoteSource::Fallback;
      q.is_stale = now - q.received_ms > timings_.stale_after_ms;
      emit(out, q);
      fallback_hits_.fetch_add(1);
    }
  }

  missing.clear();
  for (const auto& symbol : still_missing) {
    std::optional<Instrument> instrument;
    if (static_fallback_) {
      instrument = catalog_.find(symbol);
    }
    if (!instrument || !instrument->reference_mid) {
      missing.push_back(symbol);
      continue;
    }
    auto q = spreads_.syntheticQuote(symbol, *instrument->reference_mid, now,
                                     domain::QuoteSource::Fallback);
    if (!q) {
      missing.push_back(symbol);
      continue;
    }
    q->received_ms = now;
    q->is_stale = true;
    emit(out, *q);
    fallback_hits_.fetch_add(1);
  }
}

// -----------------------------------------------------------------------------
// tryBeginFetch(): cooldown check plus compare-exchange on the in-flight flag
// -----------------------------------------------------------------------------
bool TieredPriceCache::tryBeginFetch(std::int64_t now) {
  auto cooled = [this, now] {
    const std::int64_t last = last_fetch_ms_.load();
    return last == kNeverFetched || now - last >= timings_.fetch_cooldown_ms;
  };

  if (!cooled()) {
    return false;
  }

  bool expected = false;
  if (!fetch_in_flight_.compare_exchange_strong(expected, true)) {
    return false;
  }

  // Another caller may have finished a fetch between the first check and
  // the claim.
  if (!cooled()) {
    fetch_in_flight_.store(false);
    return false;
  }

  last_fetch_ms_.store(now);
  return true;
}

// -----------------------------------------------------------------------------
// put(): normalize, then route by source
// -----------------------------------------------------------------------------
std::optional<domain::PriceQuote> TieredPriceCache::put(
    const domain::PriceQuote& quote) {
  domain::PriceQuote q = quote;
  q.received_ms = clock_.now_ms();
  q.is_stale = false;

  auto normalized = QuoteNormalizer::normalize(std::move(q));
  if (!normalized) {
    rejected_writes_.fetch_add(1);
    return std::nullopt;
  }

  if (normalized->source == domain::QuoteSource::Stream) {
    std::unique_lock lock(mutex_);
    stream_tier_[normalized->symbol] = *normalized;
    local_tier_[normalized->symbol] = *normalized;
    last_known_[normalized->symbol] = *normalized;
  } else {
    storeLocal(*normalized);
  }
  return normalized;
}

// -----------------------------------------------------------------------------
// storeLocal(): local tier + last-known, newest upstream timestamp wins
// -----------------------------------------------------------------------------
void TieredPriceCache::storeLocal(const domain::PriceQuote& quote) {
  std::unique_lock lock(mutex_);

  auto it = local_tier_.find(quote.symbol);
  if (it == local_tier_.end() || it->second.timestamp_ms <= quote.timestamp_ms) {
    local_tier_[quote.symbol] = quote;
  }

  auto lk = last_known_.find(quote.symbol);
  if (lk == last_known_.end() || lk->second.timestamp_ms <= quote.timestamp_ms) {
    last_known_[quote.symbol] = quote;
  }
}

// -----------------------------------------------------------------------------
// peek(): in-process tiers only
// -----------------------------------------------------------------------------
std::optional<domain::PriceQuote> TieredPriceCache::peek(
    const std::string& symbol) const {
  const std::int64_t now = clock_.now_ms();
  std::shared_lock lock(mutex_);

  auto s = stream_tier_.find(symbol);
  if (s != stream_tier_.end() &&
      now - s->second.received_ms < timings_.stream_ttl_ms) {
    return QuoteNormalizer::normalize(s->second);
  }

  auto l = local_tier_.find(symbol);
  if (l != local_tier_.end() &&
      now - l->second.received_ms < timings_.local_ttl_ms) {
    domain::PriceQuote q = l->second;
    if (q.source == domain::QuoteSource::Stream) {
      q.source = domain::QuoteSource::Cached;
    }
    return QuoteNormalizer::normalize(std::move(q));
  }

  auto lk = last_known_.find(symbol);
  if (lk != last_known_.end()) {
    domain::PriceQuote q = lk->second;
    q.source = domain::QuoteSource::Fallback;
    q.is_stale = now - q.received_ms > timings_.stale_after_ms;
    return QuoteNormalizer::normalize(std::move(q));
  }
  return std::nullopt;
}

CacheStats TieredPriceCache::stats() const {
  CacheStats s;
  s.stream_hits = stream_hits_.load();
  s.local_hits = local_hits_.load();
  s.shared_hits = shared_hits_.load();
  s.fetched = fetched_.load();
  s.fallback_hits = fallback_hits_.load();
  s.misses = misses_.load();
  s.fetch_calls = fetch_calls_.load();
  s.rejected_writes = rejected_writes_.load();
  return s;
}

}  // namespace tickrisk
