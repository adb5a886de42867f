#include "tickrisk/execution/settlement_worker_pool.hpp"

#include "tickrisk/risk/risk_calculator.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tickrisk {

namespace {

// Reads an optional price level: absent or null means "not set".
std::optional<double> optionalLevel(const nlohmann::json& payload,
                                    const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

std::optional<domain::CloseReason> closeReasonOf(const domain::QueuedTrade& trade) {
  return domain::closeReasonFromString(
      trade.payload.value("reason", std::string("manual")));
}

}  // namespace

SettlementWorkerPool::SettlementWorkerPool(TradeExecutionQueue& queue,
                                           IPositionStore& store,
                                           INotificationSink& notifications,
                                           PositionTriggerIndex& index,
                                           EventSink telemetry,
                                           int worker_count,
                                           std::chrono::milliseconds poll_interval)
    : queue_(queue),
      store_(store),
      notifications_(notifications),
      index_(index),
      telemetry_(std::move(telemetry)),
      worker_count_(worker_count > 0 ? worker_count : 1),
      poll_interval_(poll_interval) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
SettlementWorkerPool::~SettlementWorkerPool() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn worker threads
// -----------------------------------------------------------------------------
void SettlementWorkerPool::start() {
  if (running_.exchange(true)) {
    return;
  }
  for (int i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this, i] { workerLoop(i); });
  }
  std::cout << "[Settlement] started " << worker_count_ << " worker(s).\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, then join every worker
// -----------------------------------------------------------------------------
void SettlementWorkerPool::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  for (auto& t : workers_) {
    if (t.joinable()) {
      t.join();
    }
  }
  workers_.clear();
  std::cout << "[Settlement] stopped.\n";
}

bool SettlementWorkerPool::settleOne() {
  auto trade = queue_.dequeue();
  if (!trade) {
    return false;
  }
  process(*trade);
  return true;
}

void SettlementWorkerPool::workerLoop(int worker_id) {
  while (running_.load()) {
    auto trade = queue_.dequeueFor(poll_interval_);
    if (!trade) {
      continue;
    }
    process(*trade);
  }
  std::cout << "[Settlement] worker " << worker_id << " exiting.\n";
}

// -----------------------------------------------------------------------------
// process(): settle, then complete or requeue
// -----------------------------------------------------------------------------
void SettlementWorkerPool::process(const domain::QueuedTrade& trade) {
  SettlementResult result = settle(trade);

  if (!result.ok) {
    if (queue_.requeue(trade, result.error) == RequeueOutcome::Dropped &&
        telemetry_) {
      TradeDroppedEvent e;
      e.trade = trade;
      e.error = result.error;
      telemetry_(std::move(e));
    }
    return;
  }

  if (result.already_closed) {
    index_.remove(trade.position_id);
    queue_.complete(trade);
    std::cout << "[Settlement] " << trade.id << ": " << trade.position_id
              << " was already closed; closure not recorded again.\n";
    return;
  }

  if (trade.action == domain::TradeAction::Close) {
    index_.remove(trade.position_id);
    const auto reason =
        closeReasonOf(trade).value_or(domain::CloseReason::Manual);
    notifications_.recordClosure(trade.position_id, result.realized_pnl, reason);
  } else if (result.position) {
    index_.upsert(*result.position);
  }

  queue_.complete(trade);

  if (telemetry_) {
    TradeSettledEvent e;
    e.trade = trade;
    e.realized_pnl = result.realized_pnl;
    telemetry_(std::move(e));
  }
}

SettlementResult SettlementWorkerPool::settle(const domain::QueuedTrade& trade) {
  try {
    switch (trade.action) {
      case domain::TradeAction::Close:  return settleClose(trade);
      case domain::TradeAction::Open:   return settleOpen(trade);
      case domain::TradeAction::Modify: return settleModify(trade);
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[Settlement] ERROR: malformed payload for " << trade.id
              << ": " << e.what() << "\n";
    return SettlementResult::failure(std::string("malformed payload: ") +
                                     e.what());
  }
  return SettlementResult::failure("unknown trade action");
}

SettlementResult SettlementWorkerPool::settleClose(
    const domain::QueuedTrade& trade) {
  const double exit_price = trade.payload.at("exit_price").get<double>();
  const auto reason = closeReasonOf(trade);
  if (!reason) {
    return SettlementResult::failure("unknown close reason");
  }
  return store_.closePosition(trade.position_id, exit_price, *reason);
}

SettlementResult SettlementWorkerPool::settleOpen(
    const domain::QueuedTrade& trade) {
  const auto& p = trade.payload;
  const auto side = domain::positionSideFromString(p.at("side").get<std::string>());
  if (!side) {
    return SettlementResult::failure("unknown side");
  }

  domain::TrackedPosition position;
  position.position_id = trade.position_id;
  position.user_id = trade.user_id;
  position.symbol = p.at("symbol").get<std::string>();
  position.side = *side;
  position.entry_price = p.at("entry_price").get<double>();
  position.quantity = p.at("quantity").get<double>();
  position.stop_loss = optionalLevel(p, "stop_loss");
  position.take_profit = optionalLevel(p, "take_profit");
  position.context_id = p.value("context_id", std::string{});

  const double leverage = p.value("leverage", 1.0);
  const double margin_used =
      p.contains("margin_used")
          ? p.at("margin_used").get<double>()
          : risk::marginRequired(position.quantity, position.entry_price,
                                 leverage);
  return store_.openPosition(position, margin_used, leverage);
}

SettlementResult SettlementWorkerPool::settleModify(
    const domain::QueuedTrade& trade) {
  return store_.modifyPosition(trade.position_id,
                               optionalLevel(trade.payload, "stop_loss"),
                               optionalLevel(trade.payload, "take_profit"));
}

}  // namespace tickrisk
