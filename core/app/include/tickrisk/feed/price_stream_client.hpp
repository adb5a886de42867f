#pragma once

#include "tickrisk/domain/feed_state.hpp"
#include "tickrisk/events/event.hpp"
#include "tickrisk/feed/feed_message.hpp"
#include "tickrisk/feed/i_feed_connection.hpp"
#include "tickrisk/pricing/spread_estimator.hpp"
#include "tickrisk/time/i_clock.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tickrisk {

// -----------------------------------------------------------------------------
// StreamSettings — connection and reconnect policy for the price stream
// -----------------------------------------------------------------------------
struct StreamSettings {
  std::string api_key;
  std::vector<std::string> symbols;              // Canonical "BASE/QUOTE"
  std::int64_t reconnect_base_delay_ms{3000};
  int max_reconnect_attempts{10};
  std::int64_t poll_timeout_ms{100};
  std::int64_t auth_timeout_ms{10'000};
};

struct StreamStats {
  std::uint64_t frames{0};
  std::uint64_t quotes_accepted{0};
  std::uint64_t quotes_rejected{0};
  std::uint64_t aggregates{0};
};

// -----------------------------------------------------------------------------
// PriceStreamClient — the single process-wide market-data subscription
// -----------------------------------------------------------------------------
//
// @brief  Drives one feed connection through
//         Disconnected → Connecting → Authenticating → Subscribed,
//         converts feed events into normalized PriceQuotes and writes them
//         into the ingestion channel.
//
// @details
// Session:
//   1. Ask the factory for a fresh IFeedConnection and open() it.
//   2. Send the auth frame; wait up to auth_timeout_ms for a status frame
//      "auth_success". "auth_failed", a timeout or a close ends the attempt.
//   3. Send one subscribe frame naming every configured symbol, so a
//      reconnect always re-subscribes the full set.
//   4. Pump frames until the connection reports Closed or stop() is called.
//
// Reconnect:
//   After any failed or closed session, attempt n (1-based) waits
//   reconnect_base_delay_ms * 1.5^(n-1). The counter resets only when a
//   session reaches Subscribed. Once more than max_reconnect_attempts have
//   been needed the client enters Disabled, logs at CRITICAL, and its run()
//   returns; streaming stays off for the life of the process.
//
// Conversion:
//   Quote     → bid/ask taken as-is, normalized; rejected when a side is
//               missing or bid >= ask. An accepted quote's spread is fed to
//               the SpreadEstimator.
//   Aggregate → bid/ask synthesized from the bar close and the current
//               estimated spread for the symbol.
//   Status    → logged; drives the handshake.
// Feed symbols ("C:EURUSD", "EUR-USD") are canonicalised to "EUR/USD".
//
// Output:
//   Every accepted quote is passed to event_sink as a PriceTickEvent, and
//   every state change as a FeedStatusEvent, in arrival order. The sink is
//   normally EventLoopThread::push of the price loop, which makes this the
//   producer side of the ingestion channel.
//
// Thread model:
//   run() blocks on the calling thread (StreamIngestionThread).
//   stop(), state(), reconnectAttempts() and stats() are safe from any
//   thread. stop() interrupts a backoff wait immediately and is final: a
//   stopped client is not restarted.
// -----------------------------------------------------------------------------
class PriceStreamClient {
 public:
  using EventSink = std::function<void(Event)>;

  PriceStreamClient(feed::FeedConnectionFactory connection_factory,
                    StreamSettings settings,
                    SpreadEstimator& spreads,
                    const IClock& clock,
                    EventSink event_sink);

  PriceStreamClient(const PriceStreamClient&) = delete;
  PriceStreamClient& operator=(const PriceStreamClient&) = delete;

  void run();
  void stop();

  // Wait before reconnect attempt `attempt` (1-based):
  // base_ms * 1.5^(attempt - 1), truncated to whole milliseconds.
  static std::int64_t backoffDelayMs(std::int64_t base_ms, int attempt);

  domain::FeedState state() const { return state_.load(); }
  int reconnectAttempts() const { return attempt_.load(); }
  StreamStats stats() const;

  // Converts one decoded message. Public so tests can drive conversion
  // without a transport.
  void handleMessage(const feed::FeedMessage& message);

 private:
  enum class AuthOutcome { Authenticated, Rejected, Failed };

  AuthOutcome authenticate(feed::IFeedConnection& connection);
  void pump(feed::IFeedConnection& connection);

  void onQuote(const feed::QuoteMessage& m);
  void onAggregate(const feed::AggregateMessage& m);
  void onStatus(const feed::StatusMessage& m);

  // Returns false if stop() was requested during the wait.
  bool waitBackoff(std::int64_t delay_ms);

  void transition(domain::FeedState next, const std::string& detail);

  feed::FeedConnectionFactory connection_factory_;
  StreamSettings settings_;
  SpreadEstimator& spreads_;
  const IClock& clock_;
  EventSink event_sink_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<domain::FeedState> state_{domain::FeedState::Disconnected};
  std::atomic<int> attempt_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::atomic<std::uint64_t> frames_{0};
  std::atomic<std::uint64_t> quotes_accepted_{0};
  std::atomic<std::uint64_t> quotes_rejected_{0};
  std::atomic<std::uint64_t> aggregates_{0};
};

}  // namespace tickrisk
