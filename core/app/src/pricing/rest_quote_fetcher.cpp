#include "tickrisk/pricing/rest_quote_fetcher.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <utility>

namespace tickrisk {

namespace {

// One GET of a batch. Detaches from the multi handle and frees the easy
// handle when destroyed.
struct Transfer {
  Transfer(CURLM* owner, std::string sym)
      : multi(owner), symbol(std::move(sym)) {}
  ~Transfer() {
    if (easy == nullptr) {
      return;
    }
    if (added) {
      curl_multi_remove_handle(multi, easy);
    }
    curl_easy_cleanup(easy);
  }

  Transfer(const Transfer&) = delete;
  Transfer& operator=(const Transfer&) = delete;

  CURLM* multi;
  std::string symbol;
  std::string url;
  std::string body;
  CURL* easy{nullptr};
  bool added{false};
  bool finished{false};
  CURLcode result{CURLE_OK};
};

}  // namespace

RestQuoteFetcher::RestQuoteFetcher(std::string base_url, std::string api_key,
                                   long timeout_ms)
    : base_url_(std::move(base_url)),
      api_key_(std::move(api_key)),
      timeout_ms_(timeout_ms),
      multi_(curl_multi_init()) {
  if (multi_ == nullptr) {
    std::cerr << "[RestQuoteFetcher] ERROR: curl_multi_init failed; "
                 "fetch tier disabled.\n";
  }
}

RestQuoteFetcher::~RestQuoteFetcher() {
  if (multi_ != nullptr) {
    curl_multi_cleanup(multi_);
  }
}

size_t RestQuoteFetcher::write_cb(void* ptr, size_t size, size_t nmemb,
                                  void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(static_cast<const char*>(ptr), size * nmemb);
  return size * nmemb;
}

std::string RestQuoteFetcher::urlFor(const std::string& symbol) const {
  const auto slash = symbol.find('/');
  return base_url_ + "/v1/last_quote/currencies/" + symbol.substr(0, slash) +
         "/" + symbol.substr(slash + 1) + "?apiKey=" + api_key_;
}

// -----------------------------------------------------------------------------
// performAll(): run the multi handle until no transfer is still running
// -----------------------------------------------------------------------------
void RestQuoteFetcher::performAll() {
  int running = 0;
  do {
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
      std::cerr << "[RestQuoteFetcher] ERROR: curl_multi_perform: "
                << curl_multi_strerror(mc) << "\n";
      return;
    }
    if (running > 0) {
      mc = curl_multi_poll(multi_, nullptr, 0, 100, nullptr);
      if (mc != CURLM_OK) {
        std::cerr << "[RestQuoteFetcher] ERROR: curl_multi_poll: "
                  << curl_multi_strerror(mc) << "\n";
        return;
      }
    }
  } while (running > 0);
}

// -----------------------------------------------------------------------------
// fetch(): one concurrent request per well-formed symbol
// -----------------------------------------------------------------------------
std::unordered_map<std::string, domain::PriceQuote> RestQuoteFetcher::fetch(
    const std::vector<std::string>& symbols) {
  std::unordered_map<std::string, domain::PriceQuote> out;
  std::lock_guard lock(mutex_);
  if (multi_ == nullptr) {
    return out;
  }

  std::vector<std::unique_ptr<Transfer>> transfers;
  for (const auto& symbol : symbols) {
    if (symbol.find('/') == std::string::npos) {
      continue;
    }
    auto t = std::make_unique<Transfer>(multi_, symbol);
    t->easy = curl_easy_init();
    if (t->easy == nullptr) {
      std::cerr << "[RestQuoteFetcher] ERROR: curl_easy_init failed for "
                << symbol << "\n";
      continue;
    }
    t->url = urlFor(symbol);
    curl_easy_setopt(t->easy, CURLOPT_URL,            t->url.c_str());
    curl_easy_setopt(t->easy, CURLOPT_HTTPGET,        1L);
    curl_easy_setopt(t->easy, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(t->easy, CURLOPT_WRITEDATA,      &t->body);
    curl_easy_setopt(t->easy, CURLOPT_TIMEOUT_MS,     timeout_ms_);
    curl_easy_setopt(t->easy, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(t->easy, CURLOPT_NOSIGNAL,       1L);

    const CURLMcode mc = curl_multi_add_handle(multi_, t->easy);
    if (mc != CURLM_OK) {
      std::cerr << "[RestQuoteFetcher] ERROR: curl_multi_add_handle: "
                << curl_multi_strerror(mc) << "\n";
      continue;
    }
    t->added = true;
    transfers.push_back(std::move(t));
  }
  if (transfers.empty()) {
    return out;
  }

  performAll();

  int remaining = 0;
  while (CURLMsg* msg = curl_multi_info_read(multi_, &remaining)) {
    if (msg->msg != CURLMSG_DONE) {
      continue;
    }
    for (auto& t : transfers) {
      if (t->easy == msg->easy_handle) {
        t->finished = true;
        t->result = msg->data.result;
        break;
      }
    }
  }

  for (const auto& t : transfers) {
    if (!t->finished) {
      std::cerr << "[RestQuoteFetcher] ERROR: request for " << t->symbol
                << " did not complete\n";
      continue;
    }
    if (t->result != CURLE_OK) {
      std::cerr << "[RestQuoteFetcher] ERROR: request for " << t->symbol
                << " failed: " << curl_easy_strerror(t->result) << "\n";
      continue;
    }
    long http_code = 0;
    curl_easy_getinfo(t->easy, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
      std::cerr << "[RestQuoteFetcher] ERROR: HTTP " << http_code << " for "
                << t->symbol << "\n";
      continue;
    }
    if (auto quote = parseLastQuote(t->symbol, t->body)) {
      out.emplace(t->symbol, std::move(*quote));
    } else {
      std::cerr << "[RestQuoteFetcher] ERROR: unusable response for "
                << t->symbol << "\n";
    }
  }

  std::cout << "[RestQuoteFetcher] fetched " << out.size() << "/"
            << symbols.size() << " symbols.\n";
  return out;
}

// -----------------------------------------------------------------------------
// parseLastQuote(): decode {status, last:{ask,bid,timestamp}}
// -----------------------------------------------------------------------------
std::optional<domain::PriceQuote> RestQuoteFetcher::parseLastQuote(
    const std::string& symbol, const std::string& body) {
  try {
    auto j = nlohmann::json::parse(body);
    const std::string status = j.value("status", "");
    if (status != "success" && status != "OK") {
      return std::nullopt;
    }

    const auto& last = j.at("last");
    domain::PriceQuote q;
    q.symbol = symbol;
    q.bid = last.at("bid").get<double>();
    q.ask = last.at("ask").get<double>();
    q.timestamp_ms = last.value("timestamp", std::int64_t{0});
    q.source = domain::QuoteSource::Fetched;
    return q;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[RestQuoteFetcher] ERROR: JSON parse error: " << e.what()
              << "\n";
    return std::nullopt;
  }
}

}  // namespace tickrisk
