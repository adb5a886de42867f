#include "tickrisk/engine/price_risk_engine.hpp"

#include "tickrisk/feed/zmq_feed_connection.hpp"
#include "tickrisk/pricing/in_memory_shared_price_tier.hpp"
#include "tickrisk/pricing/rest_quote_fetcher.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

namespace tickrisk {

namespace {

nlohmann::json quoteJson(const domain::PriceQuote& q) {
  nlohmann::json j;
  j["symbol"] = q.symbol;
  j["bid"] = q.bid;
  j["ask"] = q.ask;
  j["mid"] = q.mid;
  j["spread"] = q.spread;
  j["timestamp"] = q.timestamp_ms;
  j["source"] = domain::toString(q.source);
  j["is_stale"] = q.is_stale;
  return j;
}

nlohmann::json queueJson(const QueueStats& s) {
  nlohmann::json j;
  j["pending"] = s.pending;
  j["processing"] = s.processing;
  j["completed"] = s.completed;
  j["retried"] = s.retried;
  j["dropped"] = s.dropped;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build every stateful component and wire the price loop
// -----------------------------------------------------------------------------
PriceRiskEngine::PriceRiskEngine(EngineConfig config, const IClock& clock,
                                 IPositionStore& store,
                                 IRiskSettingsStore& settings,
                                 INotificationSink& notifications,
                                 EngineAdapters adapters)
    : config_(std::move(config)),
      clock_(clock),
      store_(store),
      settings_(settings),
      notifications_(notifications),
      adapters_(std::move(adapters)),
      spreads_(catalog_) {
  // ---  1) Price tiers -------------------------------------------------------
  IQuoteFetcher* fetcher = adapters_.fetcher;
  if (fetcher == nullptr && !config_.rest_base_url.empty()) {
    owned_fetcher_ = std::make_unique<RestQuoteFetcher>(
        config_.rest_base_url, config_.feed_api_key, config_.rest_timeout_ms);
    fetcher = owned_fetcher_.get();
  }
  ISharedPriceTier* shared = adapters_.shared_tier;
  if (shared == nullptr) {
    owned_shared_tier_ = std::make_unique<InMemorySharedPriceTier>(clock_);
    shared = owned_shared_tier_.get();
  }
  cache_ = std::make_unique<TieredPriceCache>(clock_, catalog_, spreads_,
                                              fetcher, shared, config_.cache,
                                              config_.static_fallback);

  // ---  2) Trade queue (journal optional) ------------------------------------
  if (!config_.journal_path.empty()) {
    journal_ = std::make_unique<FileTradeJournal>(config_.journal_path);
  }
  queue_ = std::make_unique<TradeExecutionQueue>(clock_, journal_.get(),
                                                 config_.trade_max_retries);

  // ---  3) Trigger path, settlement, sweep -----------------------------------
  auto telemetry = [this](Event e) { publishTelemetry(std::move(e)); };

  trigger_monitor_ =
      std::make_unique<TriggerMonitor>(index_, *queue_, telemetry);
  workers_ = std::make_unique<SettlementWorkerPool>(
      *queue_, store_, notifications_, index_, telemetry,
      config_.settlement_workers);
  sweep_ = std::make_unique<ReconciliationSweep>(
      store_, settings_, *cache_, index_, *trigger_monitor_, *queue_, telemetry,
      std::chrono::milliseconds(config_.sweep_interval_ms));

  // ---  4) Price loop: cache first, then the trigger check --------------------
  price_loop_.eventBus().subscribe<PriceTickEvent>(
      [this](const PriceTickEvent& e) {
        if (auto stored = cache_->put(e.quote)) {
          trigger_monitor_->onTick(*stored);
        }
      });
  price_loop_.eventBus().subscribe<FeedStatusEvent>(
      [this](const FeedStatusEvent& e) { publishTelemetry(e); });
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
PriceRiskEngine::~PriceRiskEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PriceRiskEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Restore queued work before any worker can run --------------------
  const std::size_t restored = queue_->restore();
  if (restored > 0) {
    std::cout << "[PriceRiskEngine] restored " << restored
              << " pending trade(s) from journal.\n";
  }

  // ---  2) Event loops -------------------------------------------------------
  telemetry_loop_.start();
  price_loop_.start();

  // ---  3) Settlement and reconciliation -------------------------------------
  workers_->start();
  sweep_->start();

  // ---  4) IPC server ---------------------------------------------------------
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();
    ipc_subscription_ = telemetry_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  5) Stream ingestion LAST (ticks begin flowing) -----------------------
  feed::FeedConnectionFactory factory = adapters_.feed_factory;
  if (!factory && !config_.feed_endpoint.empty()) {
    const std::string endpoint = config_.feed_endpoint;
    const auto idle = std::chrono::milliseconds(config_.feed_idle_timeout_ms);
    factory = [endpoint, idle]() -> std::unique_ptr<feed::IFeedConnection> {
      return std::make_unique<feed::ZmqFeedConnection>(endpoint, idle);
    };
  }
  if (factory) {
    StreamSettings settings;
    settings.api_key = config_.feed_api_key;
    settings.symbols = streamSymbols();
    settings.reconnect_base_delay_ms = config_.reconnect_base_delay_ms;
    settings.max_reconnect_attempts = config_.max_reconnect_attempts;
    stream_ = std::make_unique<StreamIngestionThread>(
        std::move(factory), std::move(settings), spreads_, clock_,
        [this](Event event) { price_loop_.push(std::move(event)); });
    stream_->start();
  } else {
    std::cout << "[PriceRiskEngine] no feed configured; serving prices from "
                 "fetch and fallback tiers only.\n";
  }

  running_ = true;

  std::cout << "[PriceRiskEngine] started. Threads: price, telemetry, "
            << config_.settlement_workers << " settlement, sweep"
            << (ipc_server_ ? ", ipc" : "") << (stream_ ? ", stream" : "")
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PriceRiskEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop price inflow FIRST -------------------------------------------
  stream_.reset();

  // ---  2) IPC (executeCommand reads every component) ------------------------
  if (ipc_subscription_) {
    telemetry_loop_.eventBus().unsubscribe(*ipc_subscription_);
    ipc_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  3) Background producers and consumers of the queue --------------------
  sweep_->stop();
  workers_->stop();

  // ---  4) Event loops --------------------------------------------------------
  price_loop_.stop();
  telemetry_loop_.stop();

  running_ = false;

  const auto stats = queue_->stats();
  std::cout << "[PriceRiskEngine] stopped. Queue: " << stats.pending
            << " pending, " << stats.processing << " processing.\n";
}

// -----------------------------------------------------------------------------
// Prices
// -----------------------------------------------------------------------------
std::optional<domain::PriceQuote> PriceRiskEngine::getPrice(
    const std::string& symbol) {
  return cache_->get(canonical(symbol));
}

std::unordered_map<std::string, domain::PriceQuote> PriceRiskEngine::getPrices(
    const std::vector<std::string>& symbols) {
  std::vector<std::string> canon;
  canon.reserve(symbols.size());
  for (const auto& s : symbols) {
    canon.push_back(canonical(s));
  }
  return cache_->getAll(canon);
}

void PriceRiskEngine::ingestQuote(domain::PriceQuote quote) {
  quote.symbol = canonical(quote.symbol);
  price_loop_.push(PriceTickEvent{std::move(quote)});
}

// -----------------------------------------------------------------------------
// Risk
// -----------------------------------------------------------------------------
domain::MarginSnapshot PriceRiskEngine::getMarginStatus(
    double capital, double unrealized_pnl, double used_margin,
    std::optional<domain::RiskThresholds> thresholds) const {
  return risk::getMarginStatus(capital, unrealized_pnl, used_margin,
                               thresholds.value_or(config_.risk));
}

risk::OrderValidation PriceRiskEngine::validateNewOrder(
    const std::string& context_id, const risk::OrderRequest& order,
    const risk::AccountState& account) {
  return risk::validateNewOrder(order, account,
                                settings_.getRiskThresholds(context_id));
}

// -----------------------------------------------------------------------------
// Positions and trades
// -----------------------------------------------------------------------------
std::optional<std::string> PriceRiskEngine::submitTrade(
    domain::QueuedTrade trade) {
  return queue_->enqueue(std::move(trade));
}

void PriceRiskEngine::trackPosition(const domain::TrackedPosition& position) {
  domain::TrackedPosition p = position;
  p.symbol = canonical(p.symbol);
  index_.upsert(std::move(p));
}

bool PriceRiskEngine::untrackPosition(const std::string& position_id) {
  return index_.remove(position_id);
}

QueueStats PriceRiskEngine::getQueueStats() const { return queue_->stats(); }

SweepReport PriceRiskEngine::runSweepNow() { return sweep_->sweepOnce(); }

domain::FeedState PriceRiskEngine::feedState() const {
  return stream_ ? stream_->state() : domain::FeedState::Disconnected;
}

CacheStats PriceRiskEngine::cacheStats() const { return cache_->stats(); }

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string PriceRiskEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  std::istringstream in(cmd);
  std::string verb;
  std::string arg;
  in >> verb >> arg;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    const auto cache = cache_->stats();
    response["status"] = "ok";
    response["feed_state"] = domain::toString(feedState());
    response["reconnect_attempts"] = stream_ ? stream_->reconnectAttempts() : 0;
    response["tracked_positions"] = index_.size();
    response["queue"] = queueJson(queue_->stats());
    response["sweeps"] = sweep_->sweepsCompleted();
    response["cache"] = {{"stream_hits", cache.stream_hits},
                         {"local_hits", cache.local_hits},
                         {"shared_hits", cache.shared_hits},
                         {"fetched", cache.fetched},
                         {"fallback_hits", cache.fallback_hits},
                         {"misses", cache.misses},
                         {"fetch_calls", cache.fetch_calls},
                         {"rejected_writes", cache.rejected_writes}};
  } else if (verb == "QUEUE") {
    response["status"] = "ok";
    response["queue"] = queueJson(queue_->stats());
  } else if (verb == "PRICE") {
    if (arg.empty()) {
      response["status"] = "error";
      response["response"] = "Usage: PRICE <symbol>";
    } else if (auto quote = getPrice(arg)) {
      response["status"] = "ok";
      response["quote"] = quoteJson(*quote);
    } else {
      response["status"] = "error";
      response["response"] = "No price available for " + arg;
    }
  } else if (verb == "SWEEP") {
    const auto report = sweep_->sweepOnce();
    response["status"] = "ok";
    response["report"] = {{"indexed", report.indexed},
                          {"triggered", report.triggered},
                          {"unpriced_symbols", report.unpriced_symbols},
                          {"books_checked", report.books_checked},
                          {"margin_alerts", report.margin_alerts},
                          {"liquidated", report.liquidated}};
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
std::string PriceRiskEngine::canonical(const std::string& symbol) const {
  return InstrumentCatalog::canonicalSymbol(symbol).value_or(symbol);
}

void PriceRiskEngine::publishTelemetry(Event event) {
  telemetry_loop_.push(std::move(event));
}

std::vector<std::string> PriceRiskEngine::streamSymbols() const {
  if (config_.symbols.empty()) {
    return catalog_.symbols();
  }
  std::vector<std::string> out;
  for (const auto& s : config_.symbols) {
    const std::string c = canonical(s);
    if (!catalog_.contains(c)) {
      std::cerr << "[PriceRiskEngine] ERROR: unknown symbol " << s
                << " in config; not subscribed.\n";
      continue;
    }
    out.push_back(c);
  }
  return out;
}

}  // namespace tickrisk
