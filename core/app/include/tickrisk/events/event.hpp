#pragma once

#include "tickrisk/events/event_types.hpp"

#include <variant>

namespace tickrisk {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The closed set of messages that travel over an EventBus. std::variant keeps
// dispatch type-safe without inheritance; subscribers pick their type with
// std::get_if (see EventBus::subscribe<T>).
// -----------------------------------------------------------------------------
using Event = std::variant<PriceTickEvent,
                           PositionTriggeredEvent,
                           MarginStatusEvent,
                           TradeSettledEvent,
                           TradeDroppedEvent,
                           FeedStatusEvent>;

}  // namespace tickrisk
