#include "tickrisk/risk/position_trigger_index.hpp"

#include <utility>

namespace tickrisk {

namespace {

bool hasTrigger(const domain::TrackedPosition& p) {
  return p.stop_loss.has_value() || p.take_profit.has_value();
}

}  // namespace

// -----------------------------------------------------------------------------
// checkTrigger(): side-aware SL/TP test, stop-loss first
// -----------------------------------------------------------------------------
std::optional<domain::CloseReason> PositionTriggerIndex::checkTrigger(
    const domain::TrackedPosition& position, double bid, double ask) {
  if (position.side == domain::PositionSide::Long) {
    if (position.stop_loss && bid <= *position.stop_loss) {
      return domain::CloseReason::StopLoss;
    }
    if (position.take_profit && bid >= *position.take_profit) {
      return domain::CloseReason::TakeProfit;
    }
    return std::nullopt;
  }

  if (position.stop_loss && ask >= *position.stop_loss) {
    return domain::CloseReason::StopLoss;
  }
  if (position.take_profit && ask <= *position.take_profit) {
    return domain::CloseReason::TakeProfit;
  }
  return std::nullopt;
}

void PositionTriggerIndex::upsert(domain::TrackedPosition position) {
  std::lock_guard lock(mutex_);
  eraseLocked(position.position_id);
  if (!hasTrigger(position)) {
    return;
  }
  symbol_of_[position.position_id] = position.symbol;
  auto& bucket = by_symbol_[position.symbol];
  const std::string id = position.position_id;
  bucket[id] = std::move(position);
}

bool PositionTriggerIndex::remove(const std::string& position_id) {
  std::lock_guard lock(mutex_);
  if (symbol_of_.count(position_id) == 0) {
    return false;
  }
  eraseLocked(position_id);
  return true;
}

std::optional<domain::TrackedPosition> PositionTriggerIndex::take(
    const std::string& position_id) {
  std::lock_guard lock(mutex_);
  auto sym = symbol_of_.find(position_id);
  if (sym == symbol_of_.end()) {
    return std::nullopt;
  }
  auto& bucket = by_symbol_[sym->second];
  auto it = bucket.find(position_id);
  std::optional<domain::TrackedPosition> out;
  if (it != bucket.end()) {
    out = std::move(it->second);
  }
  eraseLocked(position_id);
  return out;
}

std::vector<domain::TrackedPosition> PositionTriggerIndex::forSymbol(
    const std::string& symbol) const {
  std::vector<domain::TrackedPosition> out;
  std::lock_guard lock(mutex_);
  auto it = by_symbol_.find(symbol);
  if (it == by_symbol_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const auto& entry : it->second) {
    out.push_back(entry.second);
  }
  return out;
}

std::size_t PositionTriggerIndex::replaceAll(
    const std::vector<domain::TrackedPosition>& positions) {
  std::lock_guard lock(mutex_);
  by_symbol_.clear();
  symbol_of_.clear();

  std::size_t indexed = 0;
  for (const auto& p : positions) {
    if (!hasTrigger(p)) {
      continue;
    }
    if (symbol_of_.count(p.position_id) != 0) {
      by_symbol_[symbol_of_[p.position_id]].erase(p.position_id);
    } else {
      ++indexed;
    }
    symbol_of_[p.position_id] = p.symbol;
    by_symbol_[p.symbol][p.position_id] = p;
  }
  return indexed;
}

// -----------------------------------------------------------------------------
// evaluate(): O(k) scan of one symbol; hits are removed before returning
// -----------------------------------------------------------------------------
std::vector<TriggerHit> PositionTriggerIndex::evaluate(
    const std::string& symbol, double bid, double ask) {
  std::vector<TriggerHit> hits;
  std::lock_guard lock(mutex_);

  auto bucket_it = by_symbol_.find(symbol);
  if (bucket_it == by_symbol_.end()) {
    return hits;
  }

  auto& bucket = bucket_it->second;
  for (auto it = bucket.begin(); it != bucket.end();) {
    auto reason = checkTrigger(it->second, bid, ask);
    if (!reason) {
      ++it;
      continue;
    }
    const double price =
        it->second.side == domain::PositionSide::Long ? bid : ask;
    symbol_of_.erase(it->first);
    hits.push_back(TriggerHit{std::move(it->second), *reason, price});
    it = bucket.erase(it);
  }

  if (bucket.empty()) {
    by_symbol_.erase(bucket_it);
  }
  return hits;
}

bool PositionTriggerIndex::contains(const std::string& position_id) const {
  std::lock_guard lock(mutex_);
  return symbol_of_.count(position_id) != 0;
}

std::size_t PositionTriggerIndex::size() const {
  std::lock_guard lock(mutex_);
  return symbol_of_.size();
}

std::vector<std::string> PositionTriggerIndex::symbols() const {
  std::vector<std::string> out;
  std::lock_guard lock(mutex_);
  out.reserve(by_symbol_.size());
  for (const auto& [symbol, bucket] : by_symbol_) {
    if (!bucket.empty()) {
      out.push_back(symbol);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// eraseLocked(): caller holds mutex_
// -----------------------------------------------------------------------------
void PositionTriggerIndex::eraseLocked(const std::string& position_id) {
  auto sym = symbol_of_.find(position_id);
  if (sym == symbol_of_.end()) {
    return;
  }
  auto bucket = by_symbol_.find(sym->second);
  if (bucket != by_symbol_.end()) {
    bucket->second.erase(position_id);
    if (bucket->second.empty()) {
      by_symbol_.erase(bucket);
    }
  }
  symbol_of_.erase(sym);
}

}  // namespace tickrisk
