#pragma once

#include "tickrisk/events/event.hpp"
#include "tickrisk/execution/trade_execution_queue.hpp"
#include "tickrisk/risk/position_trigger_index.hpp"
#include "tickrisk/store/i_notification_sink.hpp"
#include "tickrisk/store/i_position_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// SettlementWorkerPool — drains TradeExecutionQueue into the position store
// -----------------------------------------------------------------------------
//
// @brief  N threads, each looping dequeueFor() → settle() → complete() or
//         requeue(). The queue's processing set guarantees each trade is
//         claimed by exactly one worker.
//
// @details
// Settlement per action:
//
//   close  : payload {exit_price, reason}. store.closePosition(). On
//            success: notifications.recordClosure(), the id is dropped from
//            the trigger index (an API close may race a live entry) and a
//            TradeSettledEvent is published.
//   open   : payload {symbol, side, entry_price, quantity, leverage,
//            margin_used?, stop_loss?, take_profit?, context_id}.
//            store.openPosition(), then the trigger index is upserted.
//   modify : payload {stop_loss?, take_profit?} (null or absent clears).
//            store.modifyPosition(), then the trigger index is upserted.
//
// A store failure or a malformed payload is a failed attempt: the trade is
// requeued, and a TradeDroppedEvent is published once the queue gives up.
//
// Thread model:
//   settleOne() is public so tests can drive settlement synchronously
//   without starting threads.
//
// Ownership:
//   References only; all collaborators outlive the pool (PriceRiskEngine
//   stops the pool before destroying them).
// -----------------------------------------------------------------------------
class SettlementWorkerPool {
 public:
  using EventSink = std::function<void(Event)>;

  SettlementWorkerPool(TradeExecutionQueue& queue, IPositionStore& store,
                       INotificationSink& notifications,
                       PositionTriggerIndex& index, EventSink telemetry,
                       int worker_count = 2,
                       std::chrono::milliseconds poll_interval =
                           std::chrono::milliseconds(100));

  ~SettlementWorkerPool();

  SettlementWorkerPool(const SettlementWorkerPool&) = delete;
  SettlementWorkerPool& operator=(const SettlementWorkerPool&) = delete;
  SettlementWorkerPool(SettlementWorkerPool&&) = delete;
  SettlementWorkerPool& operator=(SettlementWorkerPool&&) = delete;

  void start();
  void stop();

  // Claims one pending trade (non-blocking) and settles it. Returns false if
  // the queue was empty.
  bool settleOne();

  bool running() const { return running_.load(); }

 private:
  void workerLoop(int worker_id);

  // Settles a claimed trade and reports the outcome to the queue.
  void process(const domain::QueuedTrade& trade);

  SettlementResult settle(const domain::QueuedTrade& trade);
  SettlementResult settleClose(const domain::QueuedTrade& trade);
  SettlementResult settleOpen(const domain::QueuedTrade& trade);
  SettlementResult settleModify(const domain::QueuedTrade& trade);

  TradeExecutionQueue& queue_;
  IPositionStore& store_;
  INotificationSink& notifications_;
  PositionTriggerIndex& index_;
  EventSink telemetry_;
  const int worker_count_;
  const std::chrono::milliseconds poll_interval_;

  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace tickrisk
