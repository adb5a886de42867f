#pragma once

namespace tickrisk {
namespace domain {

enum class MarginStatus { Safe, Warning, Danger, Liquidation };

inline const char* toString(MarginStatus s) {
  switch (s) {
    case MarginStatus::Safe:        return "safe";
    case MarginStatus::Warning:     return "warning";
    case MarginStatus::Danger:      return "danger";
    case MarginStatus::Liquidation: return "liquidation";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// MarginSnapshot — derived account health at one instant
// -----------------------------------------------------------------------------
//
// @details
// Computed on demand by risk::getMarginStatus() and never persisted.
// margin_level is +infinity when used_margin is zero.
// -----------------------------------------------------------------------------
struct MarginSnapshot {
  double equity{0.0};
  double used_margin{0.0};
  double free_margin{0.0};
  double margin_level{0.0};
  MarginStatus status{MarginStatus::Safe};
};

}  // namespace domain
}  // namespace tickrisk
