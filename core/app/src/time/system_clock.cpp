#include "tickrisk/time/system_clock.hpp"

#include <chrono>

namespace tickrisk {

// -----------------------------------------------------------------------------
// now_ms(): wall clock truncated to milliseconds
// -----------------------------------------------------------------------------
std::int64_t SystemClock::now_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace tickrisk
