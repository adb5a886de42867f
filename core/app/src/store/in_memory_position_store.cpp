#include "tickrisk/store/in_memory_position_store.hpp"

#include "tickrisk/risk/risk_calculator.hpp"

#include <iostream>

namespace tickrisk {

void InMemoryPositionStore::addAccount(const std::string& user_id,
                                       const std::string& context_id,
                                       double capital) {
  std::lock_guard lock(mutex_);
  accounts_[{user_id, context_id}].capital = capital;
}

std::vector<domain::TrackedPosition>
InMemoryPositionStore::listOpenPositionsWithSltp() {
  std::lock_guard lock(mutex_);
  std::vector<domain::TrackedPosition> out;
  for (const auto& [id, book_pos] : open_) {
    const auto& p = book_pos.position;
    if (p.stop_loss || p.take_profit) {
      out.push_back(p);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// listOpenBooks(): one book per account with at least one open position
// -----------------------------------------------------------------------------
std::vector<domain::AccountBook> InMemoryPositionStore::listOpenBooks() {
  std::lock_guard lock(mutex_);
  std::map<AccountKey, domain::AccountBook> books;
  for (const auto& [id, book_pos] : open_) {
    const AccountKey key{book_pos.position.user_id, book_pos.position.context_id};
    auto& book = books[key];
    if (book.positions.empty()) {
      book.user_id = key.first;
      book.context_id = key.second;
      auto acc = accounts_.find(key);
      if (acc != accounts_.end()) {
        book.capital = acc->second.capital;
        book.used_margin = acc->second.used_margin;
      }
    }
    book.positions.push_back(book_pos);
  }

  std::vector<domain::AccountBook> out;
  out.reserve(books.size());
  for (auto& [key, book] : books) {
    out.push_back(std::move(book));
  }
  return out;
}

SettlementResult InMemoryPositionStore::closePosition(
    const std::string& position_id, double exit_price,
    domain::CloseReason reason) {
  std::lock_guard lock(mutex_);
  ++close_calls_;
  if (auto err = takeInjectedFailureLocked()) {
    return SettlementResult::failure(*err);
  }

  auto done = closed_.find(position_id);
  if (done != closed_.end()) {
    SettlementResult repeat = done->second;
    repeat.already_closed = true;
    return repeat;
  }

  auto it = open_.find(position_id);
  if (it == open_.end()) {
    return SettlementResult::failure("position " + position_id + " is not open");
  }

  const domain::TrackedPosition& p = it->second.position;
  const double pnl =
      risk::unrealizedPnl(p.side, p.entry_price, exit_price, p.quantity);

  auto acc = accounts_.find({p.user_id, p.context_id});
  if (acc != accounts_.end()) {
    acc->second.capital += pnl;
    acc->second.used_margin -= it->second.margin_used;
    if (acc->second.used_margin < 0.0) {
      acc->second.used_margin = 0.0;
    }
  }

  std::cout << "[PositionStore] closed " << position_id << " ("
            << domain::toString(reason) << ") at " << exit_price
            << ", pnl " << pnl << "\n";

  SettlementResult result = SettlementResult::success(pnl);
  result.position = p;
  closed_[position_id] = result;
  open_.erase(it);
  return result;
}

SettlementResult InMemoryPositionStore::openPosition(
    const domain::TrackedPosition& position, double margin_used,
    double leverage) {
  std::lock_guard lock(mutex_);
  if (auto err = takeInjectedFailureLocked()) {
    return SettlementResult::failure(*err);
  }
  if (open_.count(position.position_id) != 0 ||
      closed_.count(position.position_id) != 0) {
    return SettlementResult::failure("position " + position.position_id +
                                     " already exists");
  }
  auto acc = accounts_.find({position.user_id, position.context_id});
  if (acc == accounts_.end()) {
    return SettlementResult::failure("no account for user " + position.user_id +
                                     " in context " + position.context_id);
  }
  acc->second.used_margin += margin_used;

  domain::BookPosition book_pos;
  book_pos.position = position;
  book_pos.margin_used = margin_used;
  book_pos.leverage = leverage;
  open_[position.position_id] = book_pos;

  SettlementResult result = SettlementResult::success();
  result.position = position;
  return result;
}

SettlementResult InMemoryPositionStore::modifyPosition(
    const std::string& position_id, std::optional<double> stop_loss,
    std::optional<double> take_profit) {
  std::lock_guard lock(mutex_);
  if (auto err = takeInjectedFailureLocked()) {
    return SettlementResult::failure(*err);
  }
  auto it = open_.find(position_id);
  if (it == open_.end()) {
    return SettlementResult::failure("position " + position_id + " is not open");
  }
  it->second.position.stop_loss = stop_loss;
  it->second.position.take_profit = take_profit;

  SettlementResult result = SettlementResult::success();
  result.position = it->second.position;
  return result;
}

void InMemoryPositionStore::failNextWrites(int count, std::string error) {
  std::lock_guard lock(mutex_);
  pending_failures_ = count;
  failure_error_ = std::move(error);
}

std::optional<domain::TrackedPosition> InMemoryPositionStore::position(
    const std::string& position_id) const {
  std::lock_guard lock(mutex_);
  auto it = open_.find(position_id);
  if (it == open_.end()) {
    return std::nullopt;
  }
  return it->second.position;
}

std::optional<double> InMemoryPositionStore::capital(
    const std::string& user_id, const std::string& context_id) const {
  std::lock_guard lock(mutex_);
  auto it = accounts_.find({user_id, context_id});
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second.capital;
}

std::size_t InMemoryPositionStore::openCount() const {
  std::lock_guard lock(mutex_);
  return open_.size();
}

std::size_t InMemoryPositionStore::closeCalls() const {
  std::lock_guard lock(mutex_);
  return close_calls_;
}

std::optional<std::string> InMemoryPositionStore::takeInjectedFailureLocked() {
  if (pending_failures_ <= 0) {
    return std::nullopt;
  }
  --pending_failures_;
  return failure_error_;
}

}  // namespace tickrisk
