#include "tickrisk/store/logging_notification_sink.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace tickrisk {

void LoggingNotificationSink::recordClosure(const std::string& position_id,
                                            double pnl,
                                            domain::CloseReason reason) {
  std::ostringstream line;
  line << "[Ledger] position " << position_id << " closed ("
       << domain::toString(reason) << "), realized pnl " << std::fixed
       << std::setprecision(2) << pnl << "\n";
  std::cout << line.str();
  recorded_.fetch_add(1);
}

}  // namespace tickrisk
