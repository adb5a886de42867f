#pragma once

#include "tickrisk/concurrent/trade_id_generator.hpp"
#include "tickrisk/domain/queued_trade.hpp"
#include "tickrisk/execution/i_trade_journal.hpp"
#include "tickrisk/time/i_clock.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tickrisk {

struct QueueStats {
  std::size_t pending{0};
  std::size_t processing{0};
  std::uint64_t completed{0};
  std::uint64_t retried{0};
  std::uint64_t dropped{0};
};

enum class RequeueOutcome { Requeued, Dropped, NotProcessing };

// -----------------------------------------------------------------------------
// TradeExecutionQueue — FIFO of settlement work plus a processing set
// -----------------------------------------------------------------------------
//
// @brief  Decouples trigger detection (instant, on the price loop) from
//         settlement (slow, may fail) with bounded retries.
//
// @details
// Lifecycle of a trade:
//
//   enqueue()  → pending (retries = 0)
//   dequeue()  → moved from pending to processing, claimed by one worker
//   complete() → removed from processing; done
//   requeue()  → removed from processing, then
//                  retries < max_retries → pending again with retries + 1
//                  otherwise             → dropped, logged at CRITICAL
//
// A trade is in exactly one of {pending, processing, gone} at any instant:
// both containers sit behind one mutex and every transition happens inside
// one critical section. With max_retries = 3 a trade is attempted at most
// four times.
//
// enqueue() never blocks on anything but the mutex (and the journal append,
// when a journal is configured), so it is safe on the price loop.
//
// Thread model:
//   Any number of producers and worker threads. dequeueFor() blocks up to
//   its timeout and is woken by enqueue()/requeue() and by shutdown().
//
// Ownership:
//   Owned by PriceRiskEngine. The journal is optional and not owned.
// -----------------------------------------------------------------------------
class TradeExecutionQueue {
 public:
  static constexpr int kMaxRetries = 3;

  explicit TradeExecutionQueue(const IClock& clock,
                               ITradeJournal* journal = nullptr,
                               int max_retries = kMaxRetries);

  TradeExecutionQueue(const TradeExecutionQueue&) = delete;
  TradeExecutionQueue& operator=(const TradeExecutionQueue&) = delete;

  // -------------------------------------------------------------------------
  // enqueue(trade)
  // -------------------------------------------------------------------------
  // @brief  Appends to the back of pending with retries reset to 0.
  //
  // @details
  // Assigns an id when trade.id is empty and stamps timestamp_ms when it is
  // 0. Rejected (std::nullopt) when the id is already pending or
  // processing, or when it is a close for a position that already has a
  // close pending or processing: a position is never queued for closure
  // twice at once, whichever path (tick, sweep, API) detected it.
  //
  // @return The trade id, or std::nullopt if rejected.
  // -------------------------------------------------------------------------
  std::optional<std::string> enqueue(domain::QueuedTrade trade);

  // Non-blocking claim of the oldest pending trade.
  std::optional<domain::QueuedTrade> dequeue();

  // Blocking claim, up to `timeout`. Returns std::nullopt on timeout or
  // after shutdown().
  std::optional<domain::QueuedTrade> dequeueFor(std::chrono::milliseconds timeout);

  // Returns false if the id was not in processing.
  bool complete(const domain::QueuedTrade& trade);

  RequeueOutcome requeue(const domain::QueuedTrade& trade,
                         const std::string& error);

  // True while a close for this position is pending or processing.
  bool closeInFlight(const std::string& position_id) const;

  QueueStats stats() const;

  // Loads pending trades from the journal. Call once, before workers start.
  std::size_t restore();

  // Wakes all blocked dequeueFor() callers; later calls return immediately.
  void shutdown();

  int maxRetries() const { return max_retries_; }

 private:
  bool closeInFlightLocked(const std::string& position_id) const;

  const IClock& clock_;
  ITradeJournal* journal_;
  const int max_retries_;
  TradeIdGenerator ids_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::deque<domain::QueuedTrade> pending_;
  std::unordered_map<std::string, domain::QueuedTrade> processing_;
  bool shutdown_{false};

  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> retried_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace tickrisk
