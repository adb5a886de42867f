#pragma once

#include "tickrisk/domain/queued_trade.hpp"

#include <string>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// ITradeJournal — durability hook for TradeExecutionQueue
// -----------------------------------------------------------------------------
//
// @brief  Append-only record of trades entering and leaving the queue, used
//         to restore pending work after a restart.
//
// @details
// recordEnqueued() is called on first enqueue and on every requeue (with the
// incremented retry count); the newest record for an id wins on replay.
// recordFinished() is called when a trade completes or is dropped.
//
// replay() returns every trade with an enqueue record and no finish record,
// in first-enqueue order. Trades that were in processing when the process
// died come back as pending: settlement must be idempotent per trade id.
// -----------------------------------------------------------------------------
class ITradeJournal {
 public:
  virtual ~ITradeJournal() = default;

  virtual void recordEnqueued(const domain::QueuedTrade& trade) = 0;
  virtual void recordFinished(const std::string& trade_id) = 0;
  virtual std::vector<domain::QueuedTrade> replay() = 0;
};

}  // namespace tickrisk
