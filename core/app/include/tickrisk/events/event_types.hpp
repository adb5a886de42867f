#pragma once

#include "tickrisk/domain/feed_state.hpp"
#include "tickrisk/domain/margin_snapshot.hpp"
#include "tickrisk/domain/price_quote.hpp"
#include "tickrisk/domain/queued_trade.hpp"
#include "tickrisk/domain/tracked_position.hpp"

#include <string>

namespace tickrisk {

// -----------------------------------------------------------------------------
// PriceTickEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries one normalized quote from the stream client into
// the price loop.
// Why in architecture: The stream client never touches the cache or the
// trigger index directly. It pushes ticks into the price loop's queue; the
// loop thread applies them in arrival order, so a later quote for a symbol
// always supersedes an earlier one.
// -----------------------------------------------------------------------------
struct PriceTickEvent {
  domain::PriceQuote quote;
};

// -----------------------------------------------------------------------------
// PositionTriggeredEvent
// -----------------------------------------------------------------------------
// Responsibility: Reports that a tick crossed a position's stop-loss or
// take-profit and a close was queued.
// -----------------------------------------------------------------------------
struct PositionTriggeredEvent {
  domain::TrackedPosition position;
  domain::CloseReason reason{domain::CloseReason::StopLoss};
  double trigger_price{0.0};
  std::string trade_id;
};

// -----------------------------------------------------------------------------
// MarginStatusEvent
// -----------------------------------------------------------------------------
// Responsibility: Published by the margin monitor for every book that is not
// safe. liquidated_positions counts closes queued for this book.
// -----------------------------------------------------------------------------
struct MarginStatusEvent {
  std::string user_id;
  std::string context_id;
  domain::MarginSnapshot snapshot;
  int liquidated_positions{0};
};

// Settlement succeeded and the closure was recorded.
struct TradeSettledEvent {
  domain::QueuedTrade trade;
  double realized_pnl{0.0};
};

// Settlement failed more than the retry cap; the trade was dropped.
struct TradeDroppedEvent {
  domain::QueuedTrade trade;
  std::string error;
};

// -----------------------------------------------------------------------------
// FeedStatusEvent
// -----------------------------------------------------------------------------
// Responsibility: Published on every stream state transition. attempt is the
// reconnect attempt number that led to this state (0 on first connect).
// -----------------------------------------------------------------------------
struct FeedStatusEvent {
  domain::FeedState state{domain::FeedState::Disconnected};
  int attempt{0};
  std::string detail;
};

}  // namespace tickrisk
