#include "tickrisk/reconcile/reconciliation_sweep.hpp"

#include "tickrisk/risk/risk_calculator.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tickrisk {

ReconciliationSweep::ReconciliationSweep(
    IPositionStore& store, IRiskSettingsStore& settings,
    TieredPriceCache& cache, PositionTriggerIndex& index,
    TriggerMonitor& monitor, TradeExecutionQueue& queue, EventSink telemetry,
    std::chrono::milliseconds interval)
    : store_(store),
      settings_(settings),
      cache_(cache),
      index_(index),
      monitor_(monitor),
      queue_(queue),
      telemetry_(std::move(telemetry)),
      interval_(interval) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ReconciliationSweep::~ReconciliationSweep() { stop(); }

void ReconciliationSweep::start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(wait_mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[Sweep] started, interval " << interval_.count() << " ms.\n";
}

void ReconciliationSweep::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard lock(wait_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::cout << "[Sweep] stopped.\n";
}

void ReconciliationSweep::run() {
  while (true) {
    sweepOnce();

    std::unique_lock lock(wait_mutex_);
    if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      return;
    }
  }
}

// -----------------------------------------------------------------------------
// sweepOnce(): resync index, re-evaluate triggers, check margins
// -----------------------------------------------------------------------------
SweepReport ReconciliationSweep::sweepOnce() {
  std::lock_guard lock(sweep_mutex_);
  SweepReport report;

  auto positions = store_.listOpenPositionsWithSltp();
  positions.erase(
      std::remove_if(positions.begin(), positions.end(),
                     [this](const domain::TrackedPosition& p) {
                       return queue_.closeInFlight(p.position_id);
                     }),
      positions.end());
  report.indexed = index_.replaceAll(positions);
  report.indexed -= pruneSettled(positions);

  reevaluateTriggers(report);
  monitorMargins(report);

  sweeps_.fetch_add(1);
  std::cout << "[Sweep] indexed=" << report.indexed
            << " triggered=" << report.triggered
            << " unpriced=" << report.unpriced_symbols
            << " books=" << report.books_checked
            << " alerts=" << report.margin_alerts
            << " liquidated=" << report.liquidated << "\n";
  return report;
}

// -----------------------------------------------------------------------------
// pruneSettled(): drop positions closed between the listing and replaceAll()
// -----------------------------------------------------------------------------
// A worker that settles a close inside that window has already removed the
// position from the index, so replaceAll() would bring it back.
std::size_t ReconciliationSweep::pruneSettled(
    const std::vector<domain::TrackedPosition>& indexed) {
  std::unordered_set<std::string> still_open;
  for (const auto& p : store_.listOpenPositionsWithSltp()) {
    still_open.insert(p.position_id);
  }

  std::size_t pruned = 0;
  for (const auto& p : indexed) {
    if (still_open.count(p.position_id) == 0 && index_.remove(p.position_id)) {
      ++pruned;
    }
  }
  if (pruned > 0) {
    std::cout << "[Sweep] " << pruned
              << " position(s) settled during resync; not re-indexed.\n";
  }
  return pruned;
}

void ReconciliationSweep::reevaluateTriggers(SweepReport& report) {
  const auto symbols = index_.symbols();
  if (symbols.empty()) {
    return;
  }
  const auto quotes = cache_.getAll(symbols);
  for (const auto& symbol : symbols) {
    auto it = quotes.find(symbol);
    if (it == quotes.end() || it->second.is_stale) {
      ++report.unpriced_symbols;
      continue;
    }
    report.triggered += monitor_.onTick(it->second);
  }
}

// -----------------------------------------------------------------------------
// monitorMargins(): mark every open book and liquidate where required
// -----------------------------------------------------------------------------
void ReconciliationSweep::monitorMargins(SweepReport& report) {
  const auto books = store_.listOpenBooks();
  if (books.empty()) {
    return;
  }

  std::set<std::string> symbol_set;
  for (const auto& book : books) {
    for (const auto& bp : book.positions) {
      symbol_set.insert(bp.position.symbol);
    }
  }
  const auto quotes =
      cache_.getAll(std::vector<std::string>(symbol_set.begin(), symbol_set.end()));

  for (const auto& book : books) {
    std::vector<risk::PositionMark> marks;
    std::unordered_map<std::string, double> exit_prices;
    double total_unrealized = 0.0;
    bool priced = true;

    for (const auto& bp : book.positions) {
      const auto& p = bp.position;
      auto q = quotes.find(p.symbol);
      if (q == quotes.end() || q->second.is_stale) {
        std::cerr << "[Sweep] cannot mark book " << book.user_id << "/"
                  << book.context_id << ": no fresh price for " << p.symbol
                  << "\n";
        priced = false;
        break;
      }
      const double mark = p.side == domain::PositionSide::Long
                              ? q->second.bid
                              : q->second.ask;
      const double pnl =
          risk::unrealizedPnl(p.side, p.entry_price, mark, p.quantity);
      total_unrealized += pnl;
      marks.push_back({p.position_id, pnl, bp.margin_used});
      exit_prices[p.position_id] = mark;
    }
    if (!priced) {
      continue;
    }
    ++report.books_checked;

    const auto thresholds = settings_.getRiskThresholds(book.context_id);
    const auto snapshot = risk::getMarginStatus(
        book.capital, total_unrealized, book.used_margin, thresholds);
    if (snapshot.status == domain::MarginStatus::Safe) {
      continue;
    }

    int liquidated = 0;
    if (snapshot.status == domain::MarginStatus::Liquidation) {
      const auto plan = risk::planLiquidation(snapshot.equity, book.used_margin,
                                              marks, thresholds);
      for (const auto& id : plan) {
        auto bp = std::find_if(
            book.positions.begin(), book.positions.end(),
            [&](const domain::BookPosition& b) { return b.position.position_id == id; });
        if (bp == book.positions.end()) {
          continue;
        }
        index_.remove(id);
        if (monitor_.enqueueClose(bp->position, domain::CloseReason::MarginCall,
                                  exit_prices[id])) {
          ++liquidated;
        }
      }
      std::cerr << "[Sweep] CRITICAL: " << book.user_id << "/"
                << book.context_id << " margin level "
                << snapshot.margin_level << "% below liquidation threshold; "
                << liquidated << " position(s) queued for margin_call close.\n";
    } else {
      std::cout << "[Sweep] " << book.user_id << "/" << book.context_id << ": "
                << risk::marginStatusMessage(snapshot.status) << " (level "
                << snapshot.margin_level << "%)\n";
    }

    ++report.margin_alerts;
    report.liquidated += static_cast<std::size_t>(liquidated);

    if (telemetry_) {
      MarginStatusEvent e;
      e.user_id = book.user_id;
      e.context_id = book.context_id;
      e.snapshot = snapshot;
      e.liquidated_positions = liquidated;
      telemetry_(std::move(e));
    }
  }
}

}  // namespace tickrisk
