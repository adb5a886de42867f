#pragma once

#include "tickrisk/pricing/i_quote_fetcher.hpp"

#include <curl/curl.h>

#include <mutex>
#include <optional>
#include <string>

namespace tickrisk {

// -----------------------------------------------------------------------------
// RestQuoteFetcher — libcurl client for the upstream last-quote endpoint
// -----------------------------------------------------------------------------
//
// @brief  Fetches the latest bid/ask per symbol with one HTTP GET each, all
//         requests of a batch in flight together:
//
//           {base_url}/v1/last_quote/currencies/{FROM}/{TO}?apiKey={key}
//
// @details
// Response body (JSON):
//   { "status": "success" | "OK",
//     "last": { "ask": 1.0921, "bid": 1.0919, "timestamp": 1700000000000 } }
//
// Any of the following makes that symbol a miss, logged once to std::cerr:
//   - curl transport error, including CURLOPT_TIMEOUT expiry
//   - HTTP status other than 200
//   - unparseable JSON, unexpected status, missing bid/ask
//
// Symbols that are not "BASE/QUOTE" are skipped. The fetcher never throws.
//
// Batching:
//   fetch() adds one easy handle per symbol to a curl multi handle and
//   drives them together, so a cold batch takes about as long as its
//   slowest symbol (at most timeout_ms) rather than the sum.
//
// Thread model:
//   fetch() calls are serialized by a mutex.
//   curl_global_init() must have run before construction (main does it).
//
// Ownership:
//   Owns the CURL multi handle; releases it in the destructor. Easy handles
//   live for one fetch() only.
// -----------------------------------------------------------------------------
class RestQuoteFetcher final : public IQuoteFetcher {
 public:
  RestQuoteFetcher(std::string base_url, std::string api_key,
                   long timeout_ms = 5000);
  ~RestQuoteFetcher() override;

  RestQuoteFetcher(const RestQuoteFetcher&) = delete;
  RestQuoteFetcher& operator=(const RestQuoteFetcher&) = delete;

  std::unordered_map<std::string, domain::PriceQuote> fetch(
      const std::vector<std::string>& symbols) override;

  // Decodes one response body. Exposed for tests.
  static std::optional<domain::PriceQuote> parseLastQuote(
      const std::string& symbol, const std::string& body);

  std::string urlFor(const std::string& symbol) const;

 private:
  static size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata);

  // Drives every added transfer to completion or timeout.
  void performAll();

  std::string base_url_;
  std::string api_key_;
  long timeout_ms_;

  std::mutex mutex_;
  CURLM* multi_{nullptr};
};

}  // namespace tickrisk
