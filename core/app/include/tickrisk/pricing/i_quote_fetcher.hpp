#pragma once

#include "tickrisk/domain/price_quote.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// IQuoteFetcher — synchronous upstream price lookup
// -----------------------------------------------------------------------------
//
// @brief  The slow tier of the price cache: asks the upstream market-data
//         API for the latest quote of each requested symbol.
//
// @details
// Implementations enforce their own request timeout and never throw for
// transport or decoding failures. A symbol that could not be fetched is
// simply absent from the returned map; the cache then falls through to the
// last-known tier for it.
//
// Returned quotes are raw. The cache normalizes them before storing.
//
// Thread model:
//   The cache guarantees at most one fetch() in flight at a time.
// -----------------------------------------------------------------------------
class IQuoteFetcher {
 public:
  virtual ~IQuoteFetcher() = default;

  virtual std::unordered_map<std::string, domain::PriceQuote> fetch(
      const std::vector<std::string>& symbols) = 0;
};

}  // namespace tickrisk
