#pragma once

#include "tickrisk/domain/tracked_position.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// TriggerHit — one position whose stop-loss or take-profit a tick crossed
// -----------------------------------------------------------------------------
struct TriggerHit {
  domain::TrackedPosition position;
  domain::CloseReason reason{domain::CloseReason::StopLoss};
  double price{0.0};  // Realizable price: bid for longs, ask for shorts
};

// -----------------------------------------------------------------------------
// PositionTriggerIndex — open SL/TP positions keyed by symbol
// -----------------------------------------------------------------------------
//
// @brief  In-memory index consulted on every accepted tick. Holds only
//         positions with at least one of stop-loss / take-profit set.
//
// @details
// Trigger rules (see checkTrigger):
//
//   long : stop-loss   when bid <= stop_loss
//          take-profit when bid >= take_profit
//   short: stop-loss   when ask >= stop_loss
//          take-profit when ask <= take_profit
//
// When one tick satisfies both conditions (a gap through both levels, or
// levels set on the wrong side of each other), the result is stop-loss.
//
// evaluate() removes every hit from the index before it returns, under the
// same lock that found it. A later tick can therefore never report the same
// position again, and two concurrent evaluations cannot both claim it.
// Cost is O(k) in the number of positions open on that symbol; no I/O.
//
// Within a symbol, positions are kept ordered by position id so evaluation
// order (and thus queue order for a batch of hits) is deterministic.
//
// The reconciliation sweep rebuilds the whole index with replaceAll().
//
// Thread model:
//   evaluate() runs on the price loop thread; upsert/remove/take come from
//   the engine API, settlement workers and the sweep. All operations take
//   one mutex for their short critical section.
// -----------------------------------------------------------------------------
class PositionTriggerIndex {
 public:
  PositionTriggerIndex() = default;

  PositionTriggerIndex(const PositionTriggerIndex&) = delete;
  PositionTriggerIndex& operator=(const PositionTriggerIndex&) = delete;

  // Inserts or replaces. A position with neither SL nor TP is removed
  // instead, since it can never trigger. A symbol change moves the entry.
  void upsert(domain::TrackedPosition position);

  // Returns false if the id was not indexed.
  bool remove(const std::string& position_id);

  // Removes and returns the entry, if present.
  std::optional<domain::TrackedPosition> take(const std::string& position_id);

  std::vector<domain::TrackedPosition> forSymbol(const std::string& symbol) const;

  // Discards everything and indexes `positions` (skipping those without
  // SL/TP). Returns the number indexed.
  std::size_t replaceAll(const std::vector<domain::TrackedPosition>& positions);

  // Finds and removes every position on `symbol` that this bid/ask triggers.
  std::vector<TriggerHit> evaluate(const std::string& symbol, double bid,
                                   double ask);

  bool contains(const std::string& position_id) const;
  std::size_t size() const;
  std::vector<std::string> symbols() const;

  // Pure trigger rule for one position; stop-loss wins ties.
  static std::optional<domain::CloseReason> checkTrigger(
      const domain::TrackedPosition& position, double bid, double ask);

 private:
  void eraseLocked(const std::string& position_id);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::map<std::string, domain::TrackedPosition>>
      by_symbol_;
  std::unordered_map<std::string, std::string> symbol_of_;
};

}  // namespace tickrisk
