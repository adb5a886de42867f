#pragma once

#include "tickrisk/time/i_clock.hpp"

namespace tickrisk {

// -----------------------------------------------------------------------------
// SystemClock — production clock backed by std::chrono::system_clock
// -----------------------------------------------------------------------------
class SystemClock final : public IClock {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tickrisk
