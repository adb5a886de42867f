#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace tickrisk {

// -----------------------------------------------------------------------------
// TradeIdGenerator — lock-free unique trade id source
// -----------------------------------------------------------------------------
//
// @brief  Produces ids of the form "<prefix>-<n>" for QueuedTrade.
//
// @details
// fetch_add with relaxed ordering: only uniqueness matters, not ordering
// relative to other memory operations. Trigger checks on the price loop,
// the reconciliation sweep and external submitters may all draw ids
// concurrently.
//
// The counter can be advanced past ids restored from the queue journal via
// observe(), so replayed trades never collide with new ones.
// -----------------------------------------------------------------------------
class TradeIdGenerator {
 public:
  explicit TradeIdGenerator(std::string prefix = "TRD")
      : prefix_(std::move(prefix)) {}

  TradeIdGenerator(const TradeIdGenerator&) = delete;
  TradeIdGenerator& operator=(const TradeIdGenerator&) = delete;
  TradeIdGenerator(TradeIdGenerator&&) = delete;
  TradeIdGenerator& operator=(TradeIdGenerator&&) = delete;

  std::string next_id() {
    return prefix_ + "-" +
           std::to_string(next_.fetch_add(1, std::memory_order_relaxed));
  }

  // Ensures future ids are strictly greater than `seen`.
  void observe(std::uint64_t seen) {
    std::uint64_t current = next_.load(std::memory_order_relaxed);
    while (current <= seen &&
           !next_.compare_exchange_weak(current, seen + 1,
                                        std::memory_order_relaxed)) {
    }
  }

  const std::string& prefix() const { return prefix_; }

 private:
  std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace tickrisk
