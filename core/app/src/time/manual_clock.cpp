#include "tickrisk/time/manual_clock.hpp"

namespace tickrisk {

ManualClock::ManualClock(std::int64_t start_ms) : now_ms_(start_ms) {}

std::int64_t ManualClock::now_ms() const { return now_ms_.load(); }

void ManualClock::set(std::int64_t now_ms) { now_ms_.store(now_ms); }

void ManualClock::advance(std::int64_t delta_ms) {
  now_ms_.fetch_add(delta_ms);
}

}  // namespace tickrisk
