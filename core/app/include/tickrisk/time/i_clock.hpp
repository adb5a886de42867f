#pragma once

#include <cstdint>

namespace tickrisk {

// -----------------------------------------------------------------------------
// IClock — injectable source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Abstracts wall-clock time so every age, cooldown and timestamp in
//         the engine can be driven deterministically from tests.
//
// @details
// The price cache measures tier ages and the fetch cooldown against
// now_ms(); the trade queue stamps trades with it; the stream client stamps
// quotes that arrive without an upstream timestamp.
//
//   - SystemClock → std::chrono::system_clock.
//   - ManualClock → a value the test sets and advances explicitly.
//
// Thread-safety contract:
//   Implementations must tolerate concurrent now_ms() calls from any
//   thread.
//
// Ownership:
//   Components hold a const reference. The clock must outlive them.
// -----------------------------------------------------------------------------
class IClock {
 public:
  virtual ~IClock() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tickrisk
