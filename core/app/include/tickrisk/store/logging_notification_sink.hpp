#pragma once

#include "tickrisk/store/i_notification_sink.hpp"

#include <atomic>
#include <cstdint>

namespace tickrisk {

// Writes one "[Ledger]" line per closure to stdout.
class LoggingNotificationSink final : public INotificationSink {
 public:
  void recordClosure(const std::string& position_id, double pnl,
                     domain::CloseReason reason) override;

  std::uint64_t recorded() const { return recorded_.load(); }

 private:
  std::atomic<std::uint64_t> recorded_{0};
};

}  // namespace tickrisk
