#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tickrisk {
namespace domain {

enum class PositionSide { Long, Short };

inline const char* toString(PositionSide s) {
  return s == PositionSide::Long ? "long" : "short";
}

inline std::optional<PositionSide> positionSideFromString(const std::string& s) {
  if (s == "long" || s == "buy") return PositionSide::Long;
  if (s == "short" || s == "sell") return PositionSide::Short;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// CloseReason — why a position left the book
// -----------------------------------------------------------------------------
enum class CloseReason { StopLoss, TakeProfit, MarginCall, Manual };

inline const char* toString(CloseReason r) {
  switch (r) {
    case CloseReason::StopLoss:   return "stop_loss";
    case CloseReason::TakeProfit: return "take_profit";
    case CloseReason::MarginCall: return "margin_call";
    case CloseReason::Manual:     return "manual";
  }
  return "unknown";
}

inline std::optional<CloseReason> closeReasonFromString(const std::string& s) {
  if (s == "stop_loss") return CloseReason::StopLoss;
  if (s == "take_profit") return CloseReason::TakeProfit;
  if (s == "margin_call") return CloseReason::MarginCall;
  if (s == "manual") return CloseReason::Manual;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// TrackedPosition — trigger index entry
// -----------------------------------------------------------------------------
//
// @brief  The subset of an open position that the trigger path needs to
//         decide whether a tick crosses its stop-loss or take-profit.
//
// @details
// Sourced from the external position store (the system of record) and held
// by PositionTriggerIndex. The index removes an entry the instant it queues
// the position for closure, so at most one close is ever queued per
// position from the real-time path.
//
// quantity is in lots; entry_price in quote currency.
// -----------------------------------------------------------------------------
struct TrackedPosition {
  std::string position_id;
  std::string symbol;
  PositionSide side{PositionSide::Long};
  double entry_price{0.0};
  double quantity{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  std::string user_id;
  std::string context_id;  // Competition/account scope the position belongs to
};

// -----------------------------------------------------------------------------
// BookPosition — an open position as seen by the margin monitor
// -----------------------------------------------------------------------------
struct BookPosition {
  TrackedPosition position;
  double margin_used{0.0};
  double leverage{1.0};
};

// -----------------------------------------------------------------------------
// AccountBook — one participant's open book within one context
// -----------------------------------------------------------------------------
//
// @details
// capital is the cash balance excluding open P&L. used_margin is the sum of
// margin locked by the open positions as recorded by the store.
// -----------------------------------------------------------------------------
struct AccountBook {
  std::string user_id;
  std::string context_id;
  double capital{0.0};
  double used_margin{0.0};
  std::vector<BookPosition> positions;
};

}  // namespace domain
}  // namespace tickrisk
