#pragma once

#include "tickrisk/domain/price_quote.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tickrisk {

// -----------------------------------------------------------------------------
// ISharedPriceTier — cross-instance price cache
// -----------------------------------------------------------------------------
//
// @brief  A key/value tier shared by every process of the deployment, keyed
//         "price:<symbol>" with a per-entry TTL.
//
// @details
// Read only on cold start (symbol never seen by this process) and written
// opportunistically after a successful fetch, to reduce the number of
// upstream fetches a fleet of freshly started processes makes. Never
// required for correctness: implementations report backend failures as a
// miss (get) or a no-op (put), with a log line.
// -----------------------------------------------------------------------------
class ISharedPriceTier {
 public:
  virtual ~ISharedPriceTier() = default;

  virtual std::optional<domain::PriceQuote> get(const std::string& symbol) = 0;

  virtual void put(const domain::PriceQuote& quote, std::int64_t ttl_ms) = 0;
};

}  // namespace tickrisk
