#pragma once

#include "tickrisk/store/i_risk_settings_store.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace tickrisk {

// Defaults from config plus optional per-context overrides.
class StaticRiskSettingsStore final : public IRiskSettingsStore {
 public:
  explicit StaticRiskSettingsStore(
      domain::RiskThresholds defaults = domain::RiskThresholds{})
      : defaults_(defaults) {}

  void setOverride(const std::string& context_id,
                   const domain::RiskThresholds& thresholds) {
    std::lock_guard lock(mutex_);
    overrides_[context_id] = thresholds;
  }

  domain::RiskThresholds getRiskThresholds(
      const std::string& context_id) override {
    std::lock_guard lock(mutex_);
    auto it = overrides_.find(context_id);
    return it != overrides_.end() ? it->second : defaults_;
  }

 private:
  const domain::RiskThresholds defaults_;
  std::mutex mutex_;
  std::unordered_map<std::string, domain::RiskThresholds> overrides_;
};

}  // namespace tickrisk
