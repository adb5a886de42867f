#pragma once

#include "tickrisk/domain/tracked_position.hpp"

#include <string>

namespace tickrisk {

// -----------------------------------------------------------------------------
// INotificationSink — ledger/notification hook for settled closures
// -----------------------------------------------------------------------------
// Fire-and-forget from the settlement worker after a successful close. A
// failure inside the sink must not undo or retry the settlement, so
// implementations report their own errors and return normally.
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;

  virtual void recordClosure(const std::string& position_id, double pnl,
                             domain::CloseReason reason) = 0;
};

}  // namespace tickrisk
