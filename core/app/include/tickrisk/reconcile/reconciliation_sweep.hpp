#pragma once

#include "tickrisk/events/event.hpp"
#include "tickrisk/execution/trade_execution_queue.hpp"
#include "tickrisk/pricing/tiered_price_cache.hpp"
#include "tickrisk/risk/position_trigger_index.hpp"
#include "tickrisk/risk/trigger_monitor.hpp"
#include "tickrisk/store/i_position_store.hpp"
#include "tickrisk/store/i_risk_settings_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace tickrisk {

struct SweepReport {
  std::size_t indexed{0};          // Positions loaded into the trigger index
  std::size_t triggered{0};        // Closes queued by SL/TP re-evaluation
  std::size_t unpriced_symbols{0}; // No fresh quote; skipped this sweep
  std::size_t books_checked{0};
  std::size_t margin_alerts{0};    // Non-safe books published
  std::size_t liquidated{0};       // margin_call closes queued
};

// -----------------------------------------------------------------------------
// ReconciliationSweep — periodic resync of the trigger index and margin
// -----------------------------------------------------------------------------
//
// @brief  The backstop that makes the real-time path eventually correct.
//
// @details
// Every interval, independent of price ticks, sweepOnce():
//
//   1. Reloads every open position with SL or TP from the store and
//      replaces the trigger index wholesale. Positions with a close already
//      pending or processing are left out, so a queued close is never
//      re-armed. A second listing after the replace drops any position a
//      worker settled while the first listing was in hand.
//   2. For each indexed symbol, re-evaluates triggers against the best
//      cached quote (TieredPriceCache::getAll). Stale quotes (older than the
//      cache's stale threshold, or static fallbacks) are not acted on.
//   3. Margin monitor: for every open account book, marks each position
//      (long at bid, short at ask), computes the MarginSnapshot with the
//      context's thresholds and publishes a MarginStatusEvent for every
//      non-safe book. A book in liquidation has positions closed with
//      reason margin_call in risk::planLiquidation() order. A book with any
//      position lacking a fresh quote is skipped for that sweep.
//
// Thread model:
//   start() spawns one thread that runs sweepOnce() immediately and then
//   every interval. sweepOnce() may also be called directly (the SWEEP
//   command, tests); calls are serialized by an internal mutex.
// -----------------------------------------------------------------------------
class ReconciliationSweep {
 public:
  using EventSink = std::function<void(Event)>;

  ReconciliationSweep(IPositionStore& store, IRiskSettingsStore& settings,
                      TieredPriceCache& cache, PositionTriggerIndex& index,
                      TriggerMonitor& monitor, TradeExecutionQueue& queue,
                      EventSink telemetry,
                      std::chrono::milliseconds interval =
                          std::chrono::seconds(30));

  ~ReconciliationSweep();

  ReconciliationSweep(const ReconciliationSweep&) = delete;
  ReconciliationSweep& operator=(const ReconciliationSweep&) = delete;
  ReconciliationSweep(ReconciliationSweep&&) = delete;
  ReconciliationSweep& operator=(ReconciliationSweep&&) = delete;

  void start();
  void stop();

  SweepReport sweepOnce();

  std::uint64_t sweepsCompleted() const { return sweeps_.load(); }

 private:
  void run();

  std::size_t pruneSettled(const std::vector<domain::TrackedPosition>& indexed);
  void reevaluateTriggers(SweepReport& report);
  void monitorMargins(SweepReport& report);

  IPositionStore& store_;
  IRiskSettingsStore& settings_;
  TieredPriceCache& cache_;
  PositionTriggerIndex& index_;
  TriggerMonitor& monitor_;
  TradeExecutionQueue& queue_;
  EventSink telemetry_;
  const std::chrono::milliseconds interval_;

  std::mutex sweep_mutex_;

  std::mutex wait_mutex_;
  std::condition_variable wake_;
  bool stop_requested_{false};

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sweeps_{0};
};

}  // namespace tickrisk
