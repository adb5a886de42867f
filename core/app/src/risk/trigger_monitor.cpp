#include "tickrisk/risk/trigger_monitor.hpp"

#include <iostream>
#include <utility>

namespace tickrisk {

TriggerMonitor::TriggerMonitor(PositionTriggerIndex& index,
                               TradeExecutionQueue& queue, EventSink telemetry)
    : index_(index), queue_(queue), telemetry_(std::move(telemetry)) {}

// -----------------------------------------------------------------------------
// onTick(): evaluate the symbol's positions against this bid/ask
// -----------------------------------------------------------------------------
std::size_t TriggerMonitor::onTick(const domain::PriceQuote& quote) {
  auto hits = index_.evaluate(quote.symbol, quote.bid, quote.ask);
  std::size_t queued = 0;
  for (const auto& hit : hits) {
    if (enqueueClose(hit.position, hit.reason, hit.price)) {
      ++queued;
    }
  }
  return queued;
}

std::optional<std::string> TriggerMonitor::enqueueClose(
    const domain::TrackedPosition& position, domain::CloseReason reason,
    double exit_price) {
  domain::QueuedTrade trade;
  trade.user_id = position.user_id;
  trade.position_id = position.position_id;
  trade.action = domain::TradeAction::Close;
  trade.payload = {{"exit_price", exit_price},
                   {"reason", domain::toString(reason)},
                   {"symbol", position.symbol}};

  auto id = queue_.enqueue(std::move(trade));
  if (!id) {
    return std::nullopt;
  }
  triggered_.fetch_add(1);

  std::cout << "[TriggerMonitor] " << domain::toString(reason) << " hit for "
            << position.position_id << " (" << position.symbol << " "
            << domain::toString(position.side) << ") at " << exit_price
            << " -> " << *id << "\n";

  if (telemetry_) {
    PositionTriggeredEvent e;
    e.position = position;
    e.reason = reason;
    e.trigger_price = exit_price;
    e.trade_id = *id;
    telemetry_(std::move(e));
  }
  return id;
}

}  // namespace tickrisk
