#pragma once

#include "tickrisk/domain/margin_snapshot.hpp"
#include "tickrisk/domain/risk_thresholds.hpp"
#include "tickrisk/domain/tracked_position.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tickrisk {
namespace risk {

// -----------------------------------------------------------------------------
// Risk calculator — pure margin, P&L and order-validation arithmetic
// -----------------------------------------------------------------------------
//
// Every function here is side-effect free and depends on nothing but its
// arguments: no cache, no queue, no clock. Prices are in quote currency,
// quantities in lots, contract_size converts lots to units (100 000 for FX).
//
// Margin level is equity as a percentage of used margin. It is +infinity
// when no margin is in use, which always classifies as Safe.
// -----------------------------------------------------------------------------

constexpr double kContractSize = 100000.0;
constexpr double kMinLotSize = 0.01;
constexpr double kLotStep = 0.01;

// (current - entry) for longs, (entry - current) for shorts, times units.
double unrealizedPnl(domain::PositionSide side, double entry, double current,
                     double quantity, double contract_size = kContractSize);

double equity(double capital, double total_unrealized_pnl);
double equity(double capital, const std::vector<double>& unrealized_pnls);

double marginLevel(double equity, double used_margin);

domain::MarginStatus classifyMargin(double margin_level,
                                    const domain::RiskThresholds& thresholds);

// -----------------------------------------------------------------------------
// getMarginStatus
// -----------------------------------------------------------------------------
// @brief  Full snapshot for an account: equity = capital + unrealized,
//         free margin = equity - used, level and status per thresholds.
// -----------------------------------------------------------------------------
domain::MarginSnapshot getMarginStatus(
    double capital, double total_unrealized_pnl, double used_margin,
    const domain::RiskThresholds& thresholds = domain::RiskThresholds{});

// Human-readable line for dashboards and notifications.
std::string marginStatusMessage(domain::MarginStatus status);

// quantity * contract_size * price / leverage
double marginRequired(double quantity, double price, double leverage,
                      double contract_size = kContractSize);

// -----------------------------------------------------------------------------
// Order validation
// -----------------------------------------------------------------------------
struct OrderRequest {
  double quantity{0.0};       // lots
  double price{0.0};          // expected fill price
  double leverage{1.0};       // 1:N
  double contract_size{kContractSize};
};

struct AccountState {
  double available_capital{0.0};
  int open_positions{0};
};

struct OrderValidation {
  bool valid{true};
  std::string error;          // empty when valid
  double required_margin{0.0};
};

// -----------------------------------------------------------------------------
// validateNewOrder
// -----------------------------------------------------------------------------
// @brief  Pre-trade checks, first failure wins, in this order:
//
//   1. required margin > available capital
//        "Insufficient capital. Need $X, available $Y"
//   2. open positions >= max_positions
//        "Maximum N open positions allowed"
//   3. quantity > max_lot_size
//        "Maximum position size is N lots"
//   4. leverage > max_leverage
//        "Maximum leverage is 1:N"
//
// required_margin is filled in whether or not the order is valid.
// -----------------------------------------------------------------------------
OrderValidation validateNewOrder(const OrderRequest& order,
                                 const AccountState& account,
                                 const domain::RiskThresholds& thresholds);

// -----------------------------------------------------------------------------
// liquidationPrice
// -----------------------------------------------------------------------------
// @brief  Price at which the position's loss equals margin_used:
//           long  → entry - margin_used / (quantity * contract_size)
//           short → entry + margin_used / (quantity * contract_size)
//
// leverage is accepted for signature symmetry with marginRequired(); the
// margin actually locked already reflects it. A long's result is floored at
// zero. Returns entry unchanged when quantity is not positive.
// -----------------------------------------------------------------------------
double liquidationPrice(domain::PositionSide side, double entry,
                        double quantity, double margin_used, double leverage,
                        double contract_size = kContractSize);

// Quote-currency value of a one-pip move for the given size.
double pipValue(double pip_size, double quantity,
                double contract_size = kContractSize);

// Signed pips in the position's favour.
double pipsMoved(domain::PositionSide side, double entry, double current,
                 double pip_size);

// Returns an error message, or std::nullopt when the size is acceptable:
// at least kMinLotSize, a whole number of kLotStep, at most max_lot_size.
std::optional<std::string> validateQuantity(double quantity,
                                            double max_lot_size);

// Longs need stop_loss < entry < take_profit; shorts the reverse.
std::optional<std::string> validateStopLossTakeProfit(
    domain::PositionSide side, double entry, std::optional<double> stop_loss,
    std::optional<double> take_profit);

// |take_profit - entry| / |entry - stop_loss|; 0 when the stop equals entry.
double riskRewardRatio(double entry, double stop_loss, double take_profit);

// Largest lot size (in kLotStep increments, capped at max_lot_size) whose
// margin fits in free_capital.
double maxPositionSize(double free_capital, double price, double leverage,
                       double max_lot_size,
                       double contract_size = kContractSize);

// -----------------------------------------------------------------------------
// Cascading liquidation
// -----------------------------------------------------------------------------
struct PositionMark {
  std::string position_id;
  double unrealized_pnl{0.0};
  double margin_used{0.0};
};

// Largest unrealized loss first; ties broken by position_id ascending.
std::vector<PositionMark> liquidationOrder(std::vector<PositionMark> marks);

// -----------------------------------------------------------------------------
// planLiquidation
// -----------------------------------------------------------------------------
// @brief  Positions to close, in liquidationOrder, until the margin level is
//         back at or above thresholds.liquidation.
//
// @details
// Closing a position realizes its P&L into capital, so equity is unchanged
// while used margin drops by that position's margin. The plan therefore
// closes positions one at a time and re-evaluates
//   equity / (used_margin - closed margin) * 100
// after each. Returns an empty plan when the account is not in
// liquidation; may return every position if nothing less restores it.
// -----------------------------------------------------------------------------
std::vector<std::string> planLiquidation(
    double equity, double used_margin, const std::vector<PositionMark>& marks,
    const domain::RiskThresholds& thresholds);

}  // namespace risk
}  // namespace tickrisk
