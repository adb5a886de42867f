#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tickrisk {
namespace feed {

// -----------------------------------------------------------------------------
// QuoteMessage — "C" / "CQ" frames: an explicit two-sided quote
// -----------------------------------------------------------------------------
// bid/ask stay optional here; a quote missing either side is rejected by the
// stream client, not by the parser.
// -----------------------------------------------------------------------------
struct QuoteMessage {
  std::string pair;
  std::optional<double> bid;
  std::optional<double> ask;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// AggregateMessage — "CA" / "CAS" frames: an OHLC bar with no bid/ask
// -----------------------------------------------------------------------------
struct AggregateMessage {
  std::string pair;
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
};

// -----------------------------------------------------------------------------
// StatusMessage — connection lifecycle notices from the feed
// -----------------------------------------------------------------------------
// status is one of "connected", "auth_success", "auth_failed", "success",
// or anything else the feed invents; message is free text.
// -----------------------------------------------------------------------------
struct StatusMessage {
  std::string status;
  std::string message;

  bool isAuthSuccess() const { return status == "auth_success"; }
  bool isAuthFailure() const { return status == "auth_failed"; }
  bool isSubscribed() const {
    return status == "success" &&
           message.find("subscribed") != std::string::npos;
  }
};

using FeedMessage = std::variant<QuoteMessage, AggregateMessage, StatusMessage>;

// -----------------------------------------------------------------------------
// FeedMessageParser — JSON frame decoding at the feed boundary
// -----------------------------------------------------------------------------
//
// @brief  Turns one wire frame into zero or more typed messages.
//
// @details
// A frame is either a single JSON object or an array of them. The "ev"
// field selects the kind:
//
//   "status"      → StatusMessage  {status, message}
//   "C", "CQ"     → QuoteMessage   {p | pair, b, a, t}
//   "CA", "CAS"   → AggregateMessage {pair, o, h, l, c, v, s, e}
//
// Elements with an unknown "ev", no "ev", or missing required fields
// (pair, close) are skipped. A frame that is not valid JSON yields an
// empty vector and one log line. Never throws.
// -----------------------------------------------------------------------------
class FeedMessageParser {
 public:
  static std::vector<FeedMessage> parse(const std::string& frame);

  // {"action":"auth","params":"<key>"}
  static std::string authFrame(const std::string& api_key);

  // {"action":"subscribe","params":"C.EUR/USD,CAS.EUR/USD,..."}
  static std::string subscribeFrame(const std::vector<std::string>& symbols);
};

}  // namespace feed
}  // namespace tickrisk
