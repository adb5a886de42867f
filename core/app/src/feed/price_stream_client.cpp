#include "tickrisk/feed/price_stream_client.hpp"

#include "tickrisk/pricing/instrument_catalog.hpp"
#include "tickrisk/pricing/quote_normalizer.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <utility>

namespace tickrisk {

PriceStreamClient::PriceStreamClient(
    feed::FeedConnectionFactory connection_factory, StreamSettings settings,
    SpreadEstimator& spreads, const IClock& clock, EventSink event_sink)
    : connection_factory_(std::move(connection_factory)),
      settings_(std::move(settings)),
      spreads_(spreads),
      clock_(clock),
      event_sink_(std::move(event_sink)) {}

// -----------------------------------------------------------------------------
// run(): session loop with capped exponential backoff
// -----------------------------------------------------------------------------
void PriceStreamClient::run() {
  while (!stop_requested_.load()) {
    transition(domain::FeedState::Connecting,
               "attempt " + std::to_string(attempt_.load()));

    std::unique_ptr<feed::IFeedConnection> connection;
    if (connection_factory_) {
      connection = connection_factory_();
    }

    if (connection && connection->open()) {
      transition(domain::FeedState::Authenticating, "");
      const AuthOutcome outcome = authenticate(*connection);

      if (outcome == AuthOutcome::Authenticated) {
        if (connection->send(
                feed::FeedMessageParser::subscribeFrame(settings_.symbols))) {
          attempt_.store(0);
          transition(domain::FeedState::Subscribed,
                     std::to_string(settings_.symbols.size()) + " symbols");
          pump(*connection);
        } else {
          std::cerr << "[PriceStream] ERROR: subscribe request could not be "
                       "sent.\n";
        }
      } else if (outcome == AuthOutcome::Rejected) {
        std::cerr << "[PriceStream] ERROR: authentication rejected by feed.\n";
      } else if (!stop_requested_.load()) {
        std::cerr << "[PriceStream] ERROR: authentication did not complete.\n";
      }
      connection->close();
    } else {
      std::cerr << "[PriceStream] ERROR: could not open feed connection.\n";
    }

    if (stop_requested_.load()) {
      break;
    }

    transition(domain::FeedState::Disconnected, "connection lost");

    const int next_attempt = attempt_.load() + 1;
    if (next_attempt > settings_.max_reconnect_attempts) {
      transition(domain::FeedState::Disabled, "reconnect cap reached");
      std::cerr << "[PriceStream] CRITICAL: giving up after "
                << settings_.max_reconnect_attempts
                << " reconnect attempts. Streaming disabled; prices now come "
                   "from fetch and fallback tiers only.\n";
      return;
    }
    attempt_.store(next_attempt);

    const auto delay_ms =
        backoffDelayMs(settings_.reconnect_base_delay_ms, next_attempt);
    std::cout << "[PriceStream] reconnect attempt " << next_attempt << "/"
              << settings_.max_reconnect_attempts << " in " << delay_ms
              << " ms\n";

    if (!waitBackoff(delay_ms)) {
      break;
    }
  }

  if (state_.load() != domain::FeedState::Disabled) {
    transition(domain::FeedState::Disconnected, "stopped");
  }
}

std::int64_t PriceStreamClient::backoffDelayMs(std::int64_t base_ms,
                                               int attempt) {
  if (attempt < 1) {
    return base_ms;
  }
  return static_cast<std::int64_t>(static_cast<double>(base_ms) *
                                   std::pow(1.5, attempt - 1));
}

// -----------------------------------------------------------------------------
// stop(): final; wakes any backoff wait
// -----------------------------------------------------------------------------
void PriceStreamClient::stop() {
  {
    std::lock_guard lock(stop_mutex_);
    stop_requested_.store(true);
  }
  stop_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// authenticate(): send credentials, wait for auth_success / auth_failed
// -----------------------------------------------------------------------------
PriceStreamClient::AuthOutcome PriceStreamClient::authenticate(
    feed::IFeedConnection& connection) {
  if (!connection.send(feed::FeedMessageParser::authFrame(settings_.api_key))) {
    return AuthOutcome::Failed;
  }

  const auto poll = std::chrono::milliseconds(settings_.poll_timeout_ms);
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(settings_.auth_timeout_ms);

  while (!stop_requested_.load() &&
         std::chrono::steady_clock::now() < deadline) {
    feed::RecvResult r = connection.receive(poll);
    if (r.status == feed::RecvStatus::Closed) {
      return AuthOutcome::Failed;
    }
    if (r.status == feed::RecvStatus::Timeout) {
      continue;
    }

    frames_.fetch_add(1);
    for (const auto& message : feed::FeedMessageParser::parse(r.frame)) {
      if (const auto* status = std::get_if<feed::StatusMessage>(&message)) {
        onStatus(*status);
        if (status->isAuthSuccess()) {
          return AuthOutcome::Authenticated;
        }
        if (status->isAuthFailure()) {
          return AuthOutcome::Rejected;
        }
        continue;
      }
      handleMessage(message);
    }
  }
  return AuthOutcome::Failed;
}

// -----------------------------------------------------------------------------
// pump(): receive until the session closes or stop() is requested
// -----------------------------------------------------------------------------
void PriceStreamClient::pump(feed::IFeedConnection& connection) {
  const auto poll = std::chrono::milliseconds(settings_.poll_timeout_ms);

  while (!stop_requested_.load()) {
    feed::RecvResult r = connection.receive(poll);
    if (r.status == feed::RecvStatus::Closed) {
      std::cerr << "[PriceStream] ERROR: feed connection closed "
                   "unexpectedly.\n";
      return;
    }
    if (r.status == feed::RecvStatus::Timeout) {
      continue;
    }

    frames_.fetch_add(1);
    for (const auto& message : feed::FeedMessageParser::parse(r.frame)) {
      handleMessage(message);
    }
  }
}

// -----------------------------------------------------------------------------
// handleMessage(): exhaustive dispatch over the message kinds
// -----------------------------------------------------------------------------
void PriceStreamClient::handleMessage(const feed::FeedMessage& message) {
  if (const auto* q = std::get_if<feed::QuoteMessage>(&message)) {
    onQuote(*q);
  } else if (const auto* a = std::get_if<feed::AggregateMessage>(&message)) {
    onAggregate(*a);
  } else if (const auto* s = std::get_if<feed::StatusMessage>(&message)) {
    onStatus(*s);
  }
}

void PriceStreamClient::onQuote(const feed::QuoteMessage& m) {
  auto symbol = InstrumentCatalog::canonicalSymbol(m.pair);
  if (!symbol || !m.bid || !m.ask) {
    quotes_rejected_.fetch_add(1);
    std::cerr << "[PriceStream] rejected quote for '" << m.pair
              << "': missing symbol, bid or ask.\n";
    return;
  }

  domain::PriceQuote q;
  q.symbol = *symbol;
  q.bid = *m.bid;
  q.ask = *m.ask;
  q.timestamp_ms = m.timestamp_ms > 0 ? m.timestamp_ms : clock_.now_ms();
  q.source = domain::QuoteSource::Stream;

  auto normalized = QuoteNormalizer::normalize(std::move(q));
  if (!normalized) {
    quotes_rejected_.fetch_add(1);
    std::cerr << "[PriceStream] rejected quote for " << *symbol
              << ": bid=" << *m.bid << " ask=" << *m.ask << "\n";
    return;
  }

  spreads_.observe(normalized->symbol, normalized->spread);
  quotes_accepted_.fetch_add(1);
  if (event_sink_) {
    event_sink_(PriceTickEvent{std::move(*normalized)});
  }
}

void PriceStreamClient::onAggregate(const feed::AggregateMessage& m) {
  auto symbol = InstrumentCatalog::canonicalSymbol(m.pair);
  if (!symbol) {
    quotes_rejected_.fetch_add(1);
    return;
  }

  const std::int64_t ts = m.end_ms > 0 ? m.end_ms : clock_.now_ms();
  auto quote = spreads_.syntheticQuote(*symbol, m.close, ts,
                                       domain::QuoteSource::Stream);
  if (!quote) {
    quotes_rejected_.fetch_add(1);
    std::cerr << "[PriceStream] rejected aggregate for " << *symbol
              << ": close=" << m.close << "\n";
    return;
  }

  aggregates_.fetch_add(1);
  if (event_sink_) {
    event_sink_(PriceTickEvent{std::move(*quote)});
  }
}

void PriceStreamClient::onStatus(const feed::StatusMessage& m) {
  if (m.isAuthFailure()) {
    std::cerr << "[PriceStream] ERROR: feed status auth_failed: " << m.message
              << "\n";
    return;
  }
  std::cout << "[PriceStream] feed status " << m.status
            << (m.message.empty() ? "" : ": " + m.message) << "\n";
}

// -----------------------------------------------------------------------------
// waitBackoff(): interruptible sleep
// -----------------------------------------------------------------------------
bool PriceStreamClient::waitBackoff(std::int64_t delay_ms) {
  std::unique_lock lock(stop_mutex_);
  stop_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms),
                    [this] { return stop_requested_.load(); });
  return !stop_requested_.load();
}

void PriceStreamClient::transition(domain::FeedState next,
                                   const std::string& detail) {
  state_.store(next);
  std::cout << "[PriceStream] " << domain::toString(next)
            << (detail.empty() ? "" : " (" + detail + ")") << "\n";
  if (event_sink_) {
    event_sink_(FeedStatusEvent{next, attempt_.load(), detail});
  }
}

StreamStats PriceStreamClient::stats() const {
  StreamStats s;
  s.frames = frames_.load();
  s.quotes_accepted = quotes_accepted_.load();
  s.quotes_rejected = quotes_rejected_.load();
  s.aggregates = aggregates_.load();
  return s;
}

}  // namespace tickrisk
