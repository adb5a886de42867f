#include "tickrisk/feed/feed_message.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace tickrisk {
namespace feed {

namespace {

std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}

std::int64_t integerOr(const nlohmann::json& j, const char* key,
                       std::int64_t fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return fallback;
  }
  return it->get<std::int64_t>();
}

std::string pairOf(const nlohmann::json& j) {
  if (auto it = j.find("pair"); it != j.end() && it->is_string()) {
    return it->get<std::string>();
  }
  if (auto it = j.find("p"); it != j.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

// Returns std::nullopt for elements that are skipped.
std::optional<FeedMessage> decodeOne(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  auto ev_it = j.find("ev");
  if (ev_it == j.end() || !ev_it->is_string()) {
    return std::nullopt;
  }
  const std::string ev = ev_it->get<std::string>();

  if (ev == "status") {
    StatusMessage m;
    m.status = j.value("status", "");
    m.message = j.value("message", "");
    return FeedMessage{std::move(m)};
  }

  if (ev == "C" || ev == "CQ") {
    QuoteMessage m;
    m.pair = pairOf(j);
    if (m.pair.empty()) {
      return std::nullopt;
    }
    m.bid = optionalNumber(j, "b");
    m.ask = optionalNumber(j, "a");
    m.timestamp_ms = integerOr(j, "t", 0);
    return FeedMessage{std::move(m)};
  }

  if (ev == "CA" || ev == "CAS") {
    AggregateMessage m;
    m.pair = pairOf(j);
    auto close = optionalNumber(j, "c");
    if (m.pair.empty() || !close) {
      return std::nullopt;
    }
    m.close = *close;
    m.open = optionalNumber(j, "o").value_or(m.close);
    m.high = optionalNumber(j, "h").value_or(m.close);
    m.low = optionalNumber(j, "l").value_or(m.close);
    m.volume = optionalNumber(j, "v").value_or(0.0);
    m.start_ms = integerOr(j, "s", 0);
    m.end_ms = integerOr(j, "e", integerOr(j, "t", m.start_ms));
    return FeedMessage{std::move(m)};
  }

  return std::nullopt;
}

}  // namespace

// -----------------------------------------------------------------------------
// parse(): object or array of objects → typed messages
// -----------------------------------------------------------------------------
std::vector<FeedMessage> FeedMessageParser::parse(const std::string& frame) {
  std::vector<FeedMessage> out;
  try {
    auto json = nlohmann::json::parse(frame);
    if (json.is_array()) {
      out.reserve(json.size());
      for (const auto& element : json) {
        if (auto m = decodeOne(element)) {
          out.push_back(std::move(*m));
        }
      }
    } else if (auto m = decodeOne(json)) {
      out.push_back(std::move(*m));
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[FeedParser] JSON parse error: " << e.what() << "\n";
    out.clear();
  }
  return out;
}

std::string FeedMessageParser::authFrame(const std::string& api_key) {
  return nlohmann::json{{"action", "auth"}, {"params", api_key}}.dump();
}

std::string FeedMessageParser::subscribeFrame(
    const std::vector<std::string>& symbols) {
  std::string params;
  for (const auto& symbol : symbols) {
    if (!params.empty()) {
      params += ",";
    }
    params += "C." + symbol + ",CAS." + symbol;
  }
  return nlohmann::json{{"action", "subscribe"}, {"params", params}}.dump();
}

}  // namespace feed
}  // namespace tickrisk
