#pragma once

#include "tickrisk/store/i_position_store.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// InMemoryPositionStore — process-local system of record
// -----------------------------------------------------------------------------
//
// @brief  Accounts and open positions held in memory. Used by the standalone
//         binary (seeded from config) and as the store double in tests.
//
// @details
// Accounts are keyed by (user_id, context_id). Opening a position adds its
// margin to the account's used margin; closing realizes
// risk::unrealizedPnl(side, entry, exit, qty) into capital and releases the
// margin.
//
// Closing an id that was already closed returns the original result again
// (idempotent settlement). Closing an id that never existed is an error.
//
// failNextWrites(n) makes the next n write calls fail with a transient
// error, to exercise the retry path.
//
// Thread model:
//   Every method locks one mutex.
// -----------------------------------------------------------------------------
class InMemoryPositionStore final : public IPositionStore {
 public:
  InMemoryPositionStore() = default;

  InMemoryPositionStore(const InMemoryPositionStore&) = delete;
  InMemoryPositionStore& operator=(const InMemoryPositionStore&) = delete;

  void addAccount(const std::string& user_id, const std::string& context_id,
                  double capital);

  std::vector<domain::TrackedPosition> listOpenPositionsWithSltp() override;
  std::vector<domain::AccountBook> listOpenBooks() override;

  SettlementResult closePosition(const std::string& position_id,
                                 double exit_price,
                                 domain::CloseReason reason) override;

  SettlementResult openPosition(const domain::TrackedPosition& position,
                                double margin_used, double leverage) override;

  SettlementResult modifyPosition(const std::string& position_id,
                                  std::optional<double> stop_loss,
                                  std::optional<double> take_profit) override;

  void failNextWrites(int count, std::string error = "store unavailable");

  std::optional<domain::TrackedPosition> position(
      const std::string& position_id) const;
  std::optional<double> capital(const std::string& user_id,
                                const std::string& context_id) const;
  std::size_t openCount() const;
  std::size_t closeCalls() const;

 private:
  using AccountKey = std::pair<std::string, std::string>;

  struct Account {
    double capital{0.0};
    double used_margin{0.0};
  };

  // Consumes one injected failure, if any.
  std::optional<std::string> takeInjectedFailureLocked();

  mutable std::mutex mutex_;
  std::map<AccountKey, Account> accounts_;
  std::map<std::string, domain::BookPosition> open_;
  std::unordered_map<std::string, SettlementResult> closed_;
  int pending_failures_{0};
  std::string failure_error_;
  std::size_t close_calls_{0};
};

}  // namespace tickrisk
