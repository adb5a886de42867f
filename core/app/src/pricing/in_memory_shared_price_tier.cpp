#include "tickrisk/pricing/in_memory_shared_price_tier.hpp"

namespace tickrisk {

InMemorySharedPriceTier::InMemorySharedPriceTier(const IClock& clock)
    : clock_(clock) {}

std::optional<domain::PriceQuote> InMemorySharedPriceTier::get(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(symbol);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (clock_.now_ms() >= it->second.expires_at_ms) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.quote;
}

void InMemorySharedPriceTier::put(const domain::PriceQuote& quote,
                                  std::int64_t ttl_ms) {
  std::lock_guard lock(mutex_);
  entries_[quote.symbol] = Entry{quote, clock_.now_ms() + ttl_ms};
}

std::size_t InMemorySharedPriceTier::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace tickrisk
