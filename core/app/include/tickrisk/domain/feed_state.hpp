#pragma once

namespace tickrisk {
namespace domain {

// -----------------------------------------------------------------------------
// FeedState — lifecycle of the shared streaming connection
// -----------------------------------------------------------------------------
//
//   Disconnected → Connecting → Authenticating → Subscribed
//
// Any unexpected close returns to Disconnected and schedules a reconnect.
// Disabled is terminal: the reconnect cap was exhausted and the process
// serves prices from the fetch and fallback tiers only.
// -----------------------------------------------------------------------------
enum class FeedState { Disconnected, Connecting, Authenticating, Subscribed, Disabled };

inline const char* toString(FeedState s) {
  switch (s) {
    case FeedState::Disconnected:   return "disconnected";
    case FeedState::Connecting:     return "connecting";
    case FeedState::Authenticating: return "authenticating";
    case FeedState::Subscribed:     return "subscribed";
    case FeedState::Disabled:       return "disabled";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace tickrisk
