#pragma once

#include "tickrisk/pricing/i_shared_price_tier.hpp"
#include "tickrisk/time/i_clock.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace tickrisk {

// -----------------------------------------------------------------------------
// InMemorySharedPriceTier — single-host stand-in for the shared tier
// -----------------------------------------------------------------------------
//
// @details
// Honors TTLs against the injected clock, so several engine instances in
// one process (or one test) observe the same expiry semantics a networked
// store would give them. Entries are expired lazily on read.
// -----------------------------------------------------------------------------
class InMemorySharedPriceTier final : public ISharedPriceTier {
 public:
  explicit InMemorySharedPriceTier(const IClock& clock);

  std::optional<domain::PriceQuote> get(const std::string& symbol) override;
  void put(const domain::PriceQuote& quote, std::int64_t ttl_ms) override;

  std::size_t size() const;

 private:
  struct Entry {
    domain::PriceQuote quote;
    std::int64_t expires_at_ms{0};
  };

  const IClock& clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace tickrisk
