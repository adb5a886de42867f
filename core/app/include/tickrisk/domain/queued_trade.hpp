#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace tickrisk {
namespace domain {

enum class TradeAction { Open, Close, Modify };

inline const char* toString(TradeAction a) {
  switch (a) {
    case TradeAction::Open:   return "open";
    case TradeAction::Close:  return "close";
    case TradeAction::Modify: return "modify";
  }
  return "unknown";
}

inline std::optional<TradeAction> tradeActionFromString(const std::string& s) {
  if (s == "open") return TradeAction::Open;
  if (s == "close") return TradeAction::Close;
  if (s == "modify") return TradeAction::Modify;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// QueuedTrade — a unit of settlement work
// -----------------------------------------------------------------------------
//
// @brief  A trade waiting in (or being processed from) TradeExecutionQueue.
//
// @details
// Created when a trigger fires, when the margin monitor liquidates, or when
// an external caller requests execution. The only mutation after creation
// is incrementing retries on a failed settlement attempt; the trade is
// destroyed on success or dropped (with an error log) once it has failed
// more than kMaxRetries times.
//
// payload is action-specific:
//   close  → {"exit_price": double, "reason": "stop_loss" | ...}
//   open   → the position fields plus "margin_used"
//   modify → {"stop_loss": double|null, "take_profit": double|null}
// -----------------------------------------------------------------------------
struct QueuedTrade {
  std::string id;
  std::string user_id;
  std::string position_id;
  TradeAction action{TradeAction::Close};
  nlohmann::json payload = nlohmann::json::object();
  std::int64_t timestamp_ms{0};
  int retries{0};
};

inline nlohmann::json toJson(const QueuedTrade& t) {
  return nlohmann::json{{"id", t.id},
                        {"user_id", t.user_id},
                        {"position_id", t.position_id},
                        {"action", toString(t.action)},
                        {"payload", t.payload},
                        {"timestamp", t.timestamp_ms},
                        {"retries", t.retries}};
}

// Returns std::nullopt for an unknown action. Throws nlohmann::json::exception
// on missing or mistyped fields.
inline std::optional<QueuedTrade> queuedTradeFromJson(const nlohmann::json& j) {
  QueuedTrade t;
  t.id = j.at("id").get<std::string>();
  t.user_id = j.at("user_id").get<std::string>();
  t.position_id = j.at("position_id").get<std::string>();
  auto action = tradeActionFromString(j.at("action").get<std::string>());
  if (!action) {
    return std::nullopt;
  }
  t.action = *action;
  t.payload = j.value("payload", nlohmann::json::object());
  t.timestamp_ms = j.value("timestamp", std::int64_t{0});
  t.retries = j.value("retries", 0);
  return t;
}

}  // namespace domain
}  // namespace tickrisk
