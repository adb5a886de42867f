#include "tickrisk/execution/trade_execution_queue.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace tickrisk {

namespace {

// Numeric suffix of "<prefix>-<n>", or std::nullopt.
std::optional<std::uint64_t> idSequence(const std::string& id,
                                        const std::string& prefix) {
  if (id.size() <= prefix.size() + 1 || id.compare(0, prefix.size(), prefix) != 0 ||
      id[prefix.size()] != '-') {
    return std::nullopt;
  }
  const std::string digits = id.substr(prefix.size() + 1);
  if (digits.size() > 18 || !std::all_of(digits.begin(), digits.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  return std::stoull(digits);
}

}  // namespace

TradeExecutionQueue::TradeExecutionQueue(const IClock& clock,
                                         ITradeJournal* journal,
                                         int max_retries)
    : clock_(clock), journal_(journal), max_retries_(max_retries) {}

// -----------------------------------------------------------------------------
// enqueue(): append with retries = 0
// -----------------------------------------------------------------------------
std::optional<std::string> TradeExecutionQueue::enqueue(
    domain::QueuedTrade trade) {
  if (trade.id.empty()) {
    trade.id = ids_.next_id();
  }
  if (trade.timestamp_ms == 0) {
    trade.timestamp_ms = clock_.now_ms();
  }
  trade.retries = 0;

  {
    std::lock_guard lock(mutex_);
    const bool duplicate =
        processing_.count(trade.id) != 0 ||
        std::any_of(pending_.begin(), pending_.end(),
                    [&](const domain::QueuedTrade& t) { return t.id == trade.id; });
    if (duplicate) {
      std::cerr << "[TradeQueue] ERROR: trade " << trade.id
                << " is already queued; ignoring duplicate.\n";
      return std::nullopt;
    }
    if (trade.action == domain::TradeAction::Close &&
        closeInFlightLocked(trade.position_id)) {
      std::cout << "[TradeQueue] close for " << trade.position_id
                << " already in flight; not queued again.\n";
      return std::nullopt;
    }
    if (journal_ != nullptr) {
      journal_->recordEnqueued(trade);
    }
    pending_.push_back(trade);
  }
  available_.notify_one();
  return trade.id;
}

std::optional<domain::QueuedTrade> TradeExecutionQueue::dequeue() {
  std::lock_guard lock(mutex_);
  if (pending_.empty()) {
    return std::nullopt;
  }
  domain::QueuedTrade trade = std::move(pending_.front());
  pending_.pop_front();
  processing_[trade.id] = trade;
  return trade;
}

std::optional<domain::QueuedTrade> TradeExecutionQueue::dequeueFor(
    std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  if (!available_.wait_for(lock, timeout,
                           [this] { return shutdown_ || !pending_.empty(); })) {
    return std::nullopt;
  }
  if (shutdown_ || pending_.empty()) {
    return std::nullopt;
  }
  domain::QueuedTrade trade = std::move(pending_.front());
  pending_.pop_front();
  processing_[trade.id] = trade;
  return trade;
}

bool TradeExecutionQueue::complete(const domain::QueuedTrade& trade) {
  {
    std::lock_guard lock(mutex_);
    if (processing_.erase(trade.id) == 0) {
      return false;
    }
    if (journal_ != nullptr) {
      journal_->recordFinished(trade.id);
    }
  }
  completed_.fetch_add(1);
  return true;
}

// -----------------------------------------------------------------------------
// requeue(): bounded retry, drop with a CRITICAL log past the cap
// -----------------------------------------------------------------------------
RequeueOutcome TradeExecutionQueue::requeue(const domain::QueuedTrade& trade,
                                            const std::string& error) {
  domain::QueuedTrade current;
  bool requeued = false;
  {
    std::lock_guard lock(mutex_);
    auto it = processing_.find(trade.id);
    if (it == processing_.end()) {
      return RequeueOutcome::NotProcessing;
    }
    current = std::move(it->second);
    processing_.erase(it);

    if (current.retries < max_retries_) {
      current.retries += 1;
      if (journal_ != nullptr) {
        journal_->recordEnqueued(current);
      }
      pending_.push_back(current);
      requeued = true;
    } else if (journal_ != nullptr) {
      journal_->recordFinished(current.id);
    }
  }

  if (requeued) {
    available_.notify_one();
    retried_.fetch_add(1);
    std::cerr << "[TradeQueue] trade " << current.id << " ("
              << domain::toString(current.action) << " " << current.position_id
              << ") failed: " << error << "; retry " << current.retries << "/"
              << max_retries_ << "\n";
    return RequeueOutcome::Requeued;
  }

  dropped_.fetch_add(1);
  std::cerr << "[TradeQueue] CRITICAL: dropping trade " << current.id << " ("
            << domain::toString(current.action) << " " << current.position_id
            << " for user " << current.user_id << ") after "
            << current.retries + 1 << " failed attempts: " << error << "\n";
  return RequeueOutcome::Dropped;
}

bool TradeExecutionQueue::closeInFlight(const std::string& position_id) const {
  std::lock_guard lock(mutex_);
  return closeInFlightLocked(position_id);
}

bool TradeExecutionQueue::closeInFlightLocked(
    const std::string& position_id) const {
  auto is_close = [&](const domain::QueuedTrade& t) {
    return t.action == domain::TradeAction::Close &&
           t.position_id == position_id;
  };
  if (std::any_of(pending_.begin(), pending_.end(), is_close)) {
    return true;
  }
  return std::any_of(processing_.begin(), processing_.end(),
                     [&](const auto& entry) { return is_close(entry.second); });
}

QueueStats TradeExecutionQueue::stats() const {
  QueueStats s;
  {
    std::lock_guard lock(mutex_);
    s.pending = pending_.size();
    s.processing = processing_.size();
  }
  s.completed = completed_.load();
  s.retried = retried_.load();
  s.dropped = dropped_.load();
  return s;
}

std::size_t TradeExecutionQueue::restore() {
  if (journal_ == nullptr) {
    return 0;
  }
  std::vector<domain::QueuedTrade> trades = journal_->replay();
  {
    std::lock_guard lock(mutex_);
    for (auto& trade : trades) {
      if (auto seq = idSequence(trade.id, ids_.prefix())) {
        ids_.observe(*seq);
      }
      pending_.push_back(std::move(trade));
    }
  }
  available_.notify_all();
  return trades.size();
}

void TradeExecutionQueue::shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  available_.notify_all();
}

}  // namespace tickrisk
