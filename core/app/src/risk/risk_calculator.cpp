#include "tickrisk/risk/risk_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>

namespace tickrisk {
namespace risk {

namespace {

std::string money(double v) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << v;
  return os.str();
}

// Integers print without a trailing ".0"; fractional limits keep two places.
std::string number(double v) {
  std::ostringstream os;
  if (std::floor(v) == v) {
    os << static_cast<long long>(v);
  } else {
    os << std::fixed << std::setprecision(2) << v;
  }
  return os.str();
}

}  // namespace

double unrealizedPnl(domain::PositionSide side, double entry, double current,
                     double quantity, double contract_size) {
  const double move =
      side == domain::PositionSide::Long ? current - entry : entry - current;
  return move * quantity * contract_size;
}

double equity(double capital, double total_unrealized_pnl) {
  return capital + total_unrealized_pnl;
}

double equity(double capital, const std::vector<double>& unrealized_pnls) {
  return capital +
         std::accumulate(unrealized_pnls.begin(), unrealized_pnls.end(), 0.0);
}

double marginLevel(double equity, double used_margin) {
  if (used_margin == 0.0) {
    return std::numeric_limits<double>::infinity();
  }
  return equity / used_margin * 100.0;
}

domain::MarginStatus classifyMargin(double margin_level,
                                    const domain::RiskThresholds& thresholds) {
  if (margin_level < thresholds.liquidation) {
    return domain::MarginStatus::Liquidation;
  }
  if (margin_level < thresholds.margin_call) {
    return domain::MarginStatus::Danger;
  }
  if (margin_level < thresholds.warning) {
    return domain::MarginStatus::Warning;
  }
  return domain::MarginStatus::Safe;
}

domain::MarginSnapshot getMarginStatus(double capital,
                                       double total_unrealized_pnl,
                                       double used_margin,
                                       const domain::RiskThresholds& thresholds) {
  domain::MarginSnapshot s;
  s.equity = equity(capital, total_unrealized_pnl);
  s.used_margin = used_margin;
  s.free_margin = s.equity - used_margin;
  s.margin_level = marginLevel(s.equity, used_margin);
  s.status = classifyMargin(s.margin_level, thresholds);
  return s;
}

std::string marginStatusMessage(domain::MarginStatus status) {
  switch (status) {
    case domain::MarginStatus::Safe:
      return "Your account is healthy.";
    case domain::MarginStatus::Warning:
      return "Warning: margin level is getting low. Consider closing some "
             "positions.";
    case domain::MarginStatus::Danger:
      return "Margin call: add funds or close positions to avoid "
             "liquidation.";
    case domain::MarginStatus::Liquidation:
      return "Liquidation: positions are being closed automatically.";
  }
  return {};
}

double marginRequired(double quantity, double price, double leverage,
                      double contract_size) {
  if (leverage <= 0.0) {
    return quantity * contract_size * price;
  }
  return quantity * contract_size * price / leverage;
}

// -----------------------------------------------------------------------------
// validateNewOrder(): capital, position count, lot size, leverage
// -----------------------------------------------------------------------------
OrderValidation validateNewOrder(const OrderRequest& order,
                                 const AccountState& account,
                                 const domain::RiskThresholds& thresholds) {
  OrderValidation v;
  v.required_margin = marginRequired(order.quantity, order.price,
                                     order.leverage, order.contract_size);

  if (v.required_margin > account.available_capital) {
    v.valid = false;
    v.error = "Insufficient capital. Need $" + money(v.required_margin) +
              ", available $" + money(account.available_capital);
    return v;
  }
  if (account.open_positions >= thresholds.max_positions) {
    v.valid = false;
    v.error = "Maximum " + std::to_string(thresholds.max_positions) +
              " open positions allowed";
    return v;
  }
  if (order.quantity > thresholds.max_lot_size) {
    v.valid = false;
    v.error = "Maximum position size is " + number(thresholds.max_lot_size) +
              " lots";
    return v;
  }
  if (order.leverage > thresholds.max_leverage) {
    v.valid = false;
    v.error = "Maximum leverage is 1:" + number(thresholds.max_leverage);
    return v;
  }
  return v;
}

double liquidationPrice(domain::PositionSide side, double entry,
                        double quantity, double margin_used,
                        double /*leverage*/, double contract_size) {
  if (quantity <= 0.0 || contract_size <= 0.0) {
    return entry;
  }
  const double distance = margin_used / (quantity * contract_size);
  if (side == domain::PositionSide::Long) {
    return std::max(0.0, entry - distance);
  }
  return entry + distance;
}

double pipValue(double pip_size, double quantity, double contract_size) {
  return pip_size * quantity * contract_size;
}

double pipsMoved(domain::PositionSide side, double entry, double current,
                 double pip_size) {
  const double move =
      side == domain::PositionSide::Long ? current - entry : entry - current;
  return move / pip_size;
}

std::optional<std::string> validateQuantity(double quantity,
                                            double max_lot_size) {
  if (!std::isfinite(quantity) || quantity < kMinLotSize) {
    return "Minimum position size is " + number(kMinLotSize) + " lots";
  }
  if (quantity > max_lot_size) {
    return "Maximum position size is " + number(max_lot_size) + " lots";
  }
  const double steps = quantity / kLotStep;
  if (std::fabs(steps - std::round(steps)) > 1e-6) {
    return std::string("Position size must be in 0.01 lot increments");
  }
  return std::nullopt;
}

std::optional<std::string> validateStopLossTakeProfit(
    domain::PositionSide side, double entry, std::optional<double> stop_loss,
    std::optional<double> take_profit) {
  const bool is_long = side == domain::PositionSide::Long;
  if (stop_loss) {
    if (*stop_loss <= 0.0) {
      return std::string("Stop loss must be a positive price");
    }
    if (is_long && *stop_loss >= entry) {
      return std::string("Stop loss must be below entry price for a long position");
    }
    if (!is_long && *stop_loss <= entry) {
      return std::string("Stop loss must be above entry price for a short position");
    }
  }
  if (take_profit) {
    if (*take_profit <= 0.0) {
      return std::string("Take profit must be a positive price");
    }
    if (is_long && *take_profit <= entry) {
      return std::string("Take profit must be above entry price for a long position");
    }
    if (!is_long && *take_profit >= entry) {
      return std::string("Take profit must be below entry price for a short position");
    }
  }
  return std::nullopt;
}

double riskRewardRatio(double entry, double stop_loss, double take_profit) {
  const double risk = std::fabs(entry - stop_loss);
  if (risk == 0.0) {
    return 0.0;
  }
  return std::fabs(take_profit - entry) / risk;
}

double maxPositionSize(double free_capital, double price, double leverage,
                       double max_lot_size, double contract_size) {
  if (free_capital <= 0.0 || price <= 0.0 || contract_size <= 0.0) {
    return 0.0;
  }
  const double per_lot = marginRequired(1.0, price, leverage, contract_size);
  const double lots = std::floor(free_capital / per_lot / kLotStep) * kLotStep;
  return std::min(lots, max_lot_size);
}

std::vector<PositionMark> liquidationOrder(std::vector<PositionMark> marks) {
  std::sort(marks.begin(), marks.end(),
            [](const PositionMark& a, const PositionMark& b) {
              if (a.unrealized_pnl != b.unrealized_pnl) {
                return a.unrealized_pnl < b.unrealized_pnl;
              }
              return a.position_id < b.position_id;
            });
  return marks;
}

// -----------------------------------------------------------------------------
// planLiquidation(): close worst-first until the level clears the threshold
// -----------------------------------------------------------------------------
std::vector<std::string> planLiquidation(
    double equity, double used_margin, const std::vector<PositionMark>& marks,
    const domain::RiskThresholds& thresholds) {
  std::vector<std::string> plan;
  double remaining = used_margin;

  for (const auto& mark : liquidationOrder(marks)) {
    if (marginLevel(equity, remaining) >= thresholds.liquidation) {
      break;
    }
    plan.push_back(mark.position_id);
    remaining = std::max(0.0, remaining - mark.margin_used);
  }
  return plan;
}

}  // namespace risk
}  // namespace tickrisk
