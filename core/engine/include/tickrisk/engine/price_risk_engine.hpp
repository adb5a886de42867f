#pragma once

#include "tickrisk/concurrent/event_loop_thread.hpp"
#include "tickrisk/config/engine_config.hpp"
#include "tickrisk/domain/feed_state.hpp"
#include "tickrisk/domain/margin_snapshot.hpp"
#include "tickrisk/domain/price_quote.hpp"
#include "tickrisk/domain/queued_trade.hpp"
#include "tickrisk/domain/tracked_position.hpp"
#include "tickrisk/execution/file_trade_journal.hpp"
#include "tickrisk/execution/settlement_worker_pool.hpp"
#include "tickrisk/execution/trade_execution_queue.hpp"
#include "tickrisk/feed/i_feed_connection.hpp"
#include "tickrisk/network/ipc_server.hpp"
#include "tickrisk/network/stream_ingestion_thread.hpp"
#include "tickrisk/pricing/i_quote_fetcher.hpp"
#include "tickrisk/pricing/i_shared_price_tier.hpp"
#include "tickrisk/pricing/instrument_catalog.hpp"
#include "tickrisk/pricing/spread_estimator.hpp"
#include "tickrisk/pricing/tiered_price_cache.hpp"
#include "tickrisk/reconcile/reconciliation_sweep.hpp"
#include "tickrisk/risk/position_trigger_index.hpp"
#include "tickrisk/risk/risk_calculator.hpp"
#include "tickrisk/risk/trigger_monitor.hpp"
#include "tickrisk/store/i_notification_sink.hpp"
#include "tickrisk/store/i_position_store.hpp"
#include "tickrisk/store/i_risk_settings_store.hpp"
#include "tickrisk/time/i_clock.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// EngineAdapters — optional replacements for the network-facing pieces
// -----------------------------------------------------------------------------
// Any member left empty is built from EngineConfig instead:
//   fetcher       → RestQuoteFetcher when config.rest_base_url is set
//   shared_tier   → InMemorySharedPriceTier
//   feed_factory  → ZmqFeedConnection when config.feed_endpoint is set
// Pointers are non-owning and must outlive the engine.
// -----------------------------------------------------------------------------
struct EngineAdapters {
  IQuoteFetcher* fetcher{nullptr};
  ISharedPriceTier* shared_tier{nullptr};
  feed::FeedConnectionFactory feed_factory;
};

// -----------------------------------------------------------------------------
// PriceRiskEngine — top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the price cache, trigger index, trade queue, workers, sweep,
//         stream ingestion and IPC server, wires them together, and exposes
//         the collaborator-facing API.
//
// @details
// Thread layout once started:
//
//   stream thread     PriceStreamClient::run(): feed I/O, parse, normalize
//        │ push(PriceTickEvent / FeedStatusEvent)
//        ▼
//   price loop        cache.put(quote) → triggers.onTick(stored quote)
//        │ enqueue (in-memory, non-blocking)
//        ▼
//   trade queue ──►   settlement workers (N): store writes, may block
//
//   sweep thread      every sweep_interval_ms: index resync, trigger
//                     re-evaluation, margin monitor
//
//   telemetry loop    PositionTriggered / MarginStatus / TradeSettled /
//                     TradeDropped / FeedStatus → IpcServer PUB
//
// The price loop is the single writer of streaming quotes, so quotes for a
// symbol are applied in arrival order. Nothing on it performs external I/O.
//
// Stateful components are built in the constructor, so the query API
// (getPrice, validateNewOrder, ...) works before start(). start() spawns
// threads; stop() joins them in reverse dependency order.
//
// Thread model:
//   Construct, start() and stop() on one thread. The public API is safe
//   from any thread.
//
// Ownership:
//   Store, settings, notification sink and clock are borrowed and must
//   outlive the engine.
// -----------------------------------------------------------------------------
class PriceRiskEngine {
 public:
  PriceRiskEngine(EngineConfig config, const IClock& clock,
                  IPositionStore& store, IRiskSettingsStore& settings,
                  INotificationSink& notifications,
                  EngineAdapters adapters = EngineAdapters{});

  ~PriceRiskEngine();

  PriceRiskEngine(const PriceRiskEngine&) = delete;
  PriceRiskEngine& operator=(const PriceRiskEngine&) = delete;
  PriceRiskEngine(PriceRiskEngine&&) = delete;
  PriceRiskEngine& operator=(PriceRiskEngine&&) = delete;

  void start();
  void stop();

  // --- Prices ---------------------------------------------------------------

  // Accepts feed-style symbols ("EURUSD", "C:EURUSD") as well as "EUR/USD".
  std::optional<domain::PriceQuote> getPrice(const std::string& symbol);

  // Keyed by canonical symbol; symbols with no price are absent.
  std::unordered_map<std::string, domain::PriceQuote> getPrices(
      const std::vector<std::string>& symbols);

  // Hands a quote to the price loop as if it came from the stream.
  void ingestQuote(domain::PriceQuote quote);

  // --- Risk -----------------------------------------------------------------

  // Without explicit thresholds the configured defaults apply.
  domain::MarginSnapshot getMarginStatus(
      double capital, double unrealized_pnl, double used_margin,
      std::optional<domain::RiskThresholds> thresholds = std::nullopt) const;

  risk::OrderValidation validateNewOrder(const std::string& context_id,
                                         const risk::OrderRequest& order,
                                         const risk::AccountState& account);

  // --- Positions and trades -------------------------------------------------

  std::optional<std::string> submitTrade(domain::QueuedTrade trade);

  void trackPosition(const domain::TrackedPosition& position);
  bool untrackPosition(const std::string& position_id);

  QueueStats getQueueStats() const;
  SweepReport runSweepNow();

  // --- Status ---------------------------------------------------------------

  domain::FeedState feedState() const;
  CacheStats cacheStats() const;
  std::size_t trackedPositions() const { return index_.size(); }

  // Handles one IPC command: PING, STATUS, QUEUE, PRICE <symbol>, SWEEP.
  // Always returns a JSON object with a "status" field.
  std::string executeCommand(const std::string& cmd);

  EventBus& priceEventBus() { return price_loop_.eventBus(); }
  EventBus& telemetryEventBus() { return telemetry_loop_.eventBus(); }

 private:
  std::string canonical(const std::string& symbol) const;
  void publishTelemetry(Event event);
  std::vector<std::string> streamSymbols() const;

  EngineConfig config_;
  const IClock& clock_;
  IPositionStore& store_;
  IRiskSettingsStore& settings_;
  INotificationSink& notifications_;
  EngineAdapters adapters_;

  InstrumentCatalog catalog_;
  SpreadEstimator spreads_;

  std::unique_ptr<IQuoteFetcher> owned_fetcher_;
  std::unique_ptr<ISharedPriceTier> owned_shared_tier_;
  std::unique_ptr<TieredPriceCache> cache_;

  std::unique_ptr<FileTradeJournal> journal_;
  std::unique_ptr<TradeExecutionQueue> queue_;
  PositionTriggerIndex index_;

  EventLoopThread price_loop_{"PriceLoop"};
  EventLoopThread telemetry_loop_{"TelemetryLoop"};

  std::unique_ptr<TriggerMonitor> trigger_monitor_;
  std::unique_ptr<SettlementWorkerPool> workers_;
  std::unique_ptr<ReconciliationSweep> sweep_;
  std::unique_ptr<StreamIngestionThread> stream_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> ipc_subscription_;

  bool running_{false};
};

}  // namespace tickrisk
