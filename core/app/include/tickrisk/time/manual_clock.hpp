#pragma once

#include "tickrisk/time/i_clock.hpp"

#include <atomic>
#include <cstdint>

namespace tickrisk {

// -----------------------------------------------------------------------------
// ManualClock — test clock that only moves when told to
// -----------------------------------------------------------------------------
//
// @brief  IClock whose value is set and advanced explicitly.
//
// @details
// Lets tests age a cached quote past a tier TTL, or step past the fetch
// cooldown, without sleeping. Stored in a std::atomic so a test thread can
// advance it while engine threads read it.
// -----------------------------------------------------------------------------
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t start_ms = 1'700'000'000'000);

  std::int64_t now_ms() const override;

  void set(std::int64_t now_ms);
  void advance(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> now_ms_;
};

}  // namespace tickrisk
