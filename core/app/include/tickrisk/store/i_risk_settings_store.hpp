#pragma once

#include "tickrisk/domain/risk_thresholds.hpp"

#include <string>

namespace tickrisk {

// -----------------------------------------------------------------------------
// IRiskSettingsStore — per-context margin thresholds and order limits
// -----------------------------------------------------------------------------
// Each competition/account context may override the defaults. Called from
// the sweep and the order-validation API; implementations are thread-safe.
// -----------------------------------------------------------------------------
class IRiskSettingsStore {
 public:
  virtual ~IRiskSettingsStore() = default;

  virtual domain::RiskThresholds getRiskThresholds(
      const std::string& context_id) = 0;
};

}  // namespace tickrisk
