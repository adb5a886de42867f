#pragma once

#include "tickrisk/domain/price_quote.hpp"
#include "tickrisk/domain/tracked_position.hpp"
#include "tickrisk/events/event.hpp"
#include "tickrisk/execution/trade_execution_queue.hpp"
#include "tickrisk/risk/position_trigger_index.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tickrisk {

// -----------------------------------------------------------------------------
// TriggerMonitor — turns trigger hits into queued closes
// -----------------------------------------------------------------------------
//
// @brief  The per-tick SL/TP check. Runs on the price loop right after the
//         cache accepts a quote.
//
// @details
// onTick(quote) calls PositionTriggerIndex::evaluate(symbol, bid, ask),
// which has already removed each hit from the index, then enqueues one
// QueuedTrade{action=close} per hit with payload
//
//   {"exit_price": <bid or ask>, "reason": "stop_loss"|..., "symbol": ...}
//
// and publishes a PositionTriggeredEvent on the telemetry sink.
//
// Nothing here performs I/O: evaluate() is in-memory and enqueue() only
// appends (plus the optional journal line).
//
// enqueueClose() is shared with the reconciliation sweep so both paths
// produce identical close trades.
//
// Thread model:
//   onTick() on the price loop; enqueueClose() also from the sweep thread.
// -----------------------------------------------------------------------------
class TriggerMonitor {
 public:
  using EventSink = std::function<void(Event)>;

  TriggerMonitor(PositionTriggerIndex& index, TradeExecutionQueue& queue,
                 EventSink telemetry);

  TriggerMonitor(const TriggerMonitor&) = delete;
  TriggerMonitor& operator=(const TriggerMonitor&) = delete;

  // Returns the number of closes queued for this tick.
  std::size_t onTick(const domain::PriceQuote& quote);

  std::optional<std::string> enqueueClose(const domain::TrackedPosition& position,
                                          domain::CloseReason reason,
                                          double exit_price);

  std::uint64_t triggered() const { return triggered_.load(); }

 private:
  PositionTriggerIndex& index_;
  TradeExecutionQueue& queue_;
  EventSink telemetry_;
  std::atomic<std::uint64_t> triggered_{0};
};

}  // namespace tickrisk
