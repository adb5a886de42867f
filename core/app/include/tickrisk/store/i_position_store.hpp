#pragma once

#include "tickrisk/domain/tracked_position.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// SettlementResult — outcome of one write against the system of record
// -----------------------------------------------------------------------------
struct SettlementResult {
  bool ok{false};
  double realized_pnl{0.0};  // Close only
  std::string error;         // Set when !ok

  // Close of a position that an earlier write already closed. ok is true and
  // realized_pnl repeats the original figure; the closure must not be
  // recorded again.
  bool already_closed{false};

  // Position as stored after the write (open/modify). Used to refresh the
  // trigger index.
  std::optional<domain::TrackedPosition> position;

  static SettlementResult success(double pnl = 0.0) {
    SettlementResult r;
    r.ok = true;
    r.realized_pnl = pnl;
    return r;
  }

  static SettlementResult failure(std::string message) {
    SettlementResult r;
    r.error = std::move(message);
    return r;
  }
};

// -----------------------------------------------------------------------------
// IPositionStore — system of record for open positions and account books
// -----------------------------------------------------------------------------
//
// @brief  The authoritative store the engine reconciles against and settles
//         into. The engine never treats its own indexes as truth.
//
// @details
// Read side (reconciliation sweep):
//   listOpenPositionsWithSltp() feeds PositionTriggerIndex::replaceAll().
//   listOpenBooks() feeds the margin monitor.
//
// Write side (settlement workers):
//   closePosition / openPosition / modifyPosition. Each call may block on
//   I/O and may fail; failures are reported in SettlementResult, never
//   thrown. closePosition must be idempotent per position id: a trade
//   restored from the journal after a crash may be settled a second time,
//   and a sweep may race the live trigger path. A repeat close returns ok
//   with already_closed set.
//
// Thread model:
//   Called concurrently from the sweep thread and every settlement worker.
//   Implementations synchronize internally.
// -----------------------------------------------------------------------------
class IPositionStore {
 public:
  virtual ~IPositionStore() = default;

  virtual std::vector<domain::TrackedPosition> listOpenPositionsWithSltp() = 0;

  virtual std::vector<domain::AccountBook> listOpenBooks() = 0;

  virtual SettlementResult closePosition(const std::string& position_id,
                                         double exit_price,
                                         domain::CloseReason reason) = 0;

  virtual SettlementResult openPosition(const domain::TrackedPosition& position,
                                        double margin_used, double leverage) = 0;

  // std::nullopt clears that level.
  virtual SettlementResult modifyPosition(const std::string& position_id,
                                          std::optional<double> stop_loss,
                                          std::optional<double> take_profit) = 0;
};

}  // namespace tickrisk
