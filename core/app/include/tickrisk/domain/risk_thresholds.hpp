#pragma once

namespace tickrisk {
namespace domain {

// -----------------------------------------------------------------------------
// RiskThresholds — per-context margin and order limits
// -----------------------------------------------------------------------------
//
// @brief  Margin-level thresholds (percent) that classify an account, plus
//         the pre-trade limits validateNewOrder() enforces.
//
// @details
// The defaults are the house values. A context (competition) may override
// any of them through the risk settings store; the engine config can also
// replace the defaults process-wide.
//
// Classification of a margin level L (see risk::classifyMargin):
//   L <  liquidation  → Liquidation
//   L <  margin_call  → Danger
//   L <  warning      → Warning
//   otherwise         → Safe
//
// safe is informational only: the level at which dashboards show the
// account as comfortably capitalised. It does not change classification.
//
// Thread model:
//   Plain value type, copied into callers. No shared mutable state.
// -----------------------------------------------------------------------------
struct RiskThresholds {
  double liquidation{50.0};
  double margin_call{100.0};
  double warning{150.0};
  double safe{200.0};

  /// Maximum number of simultaneously open positions per account.
  int max_positions{10};

  /// Maximum leverage ratio (1:N).
  double max_leverage{500.0};

  /// Maximum size of a single position, in lots.
  double max_lot_size{100.0};
};

}  // namespace domain
}  // namespace tickrisk
