#include "tickrisk/network/stream_ingestion_thread.hpp"

#include <iostream>
#include <utility>

namespace tickrisk {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred client construction
// -----------------------------------------------------------------------------
StreamIngestionThread::StreamIngestionThread(
    feed::FeedConnectionFactory connection_factory, StreamSettings settings,
    SpreadEstimator& spreads, const IClock& clock,
    PriceStreamClient::EventSink event_sink)
    : connection_factory_(std::move(connection_factory)),
      settings_(std::move(settings)),
      spreads_(spreads),
      clock_(clock),
      event_sink_(std::move(event_sink)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
StreamIngestionThread::~StreamIngestionThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create client and spawn the ingestion thread
// -----------------------------------------------------------------------------
void StreamIngestionThread::start() {
  if (thread_.joinable()) {
    return;
  }

  client_ = std::make_unique<PriceStreamClient>(
      connection_factory_, settings_, spreads_, clock_, event_sink_);

  thread_ = std::thread([this] {
    std::cout << "[StreamIngestionThread] streaming "
              << settings_.symbols.size() << " symbols.\n";
    client_->run();
    std::cout << "[StreamIngestionThread] stream loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal client and join
// -----------------------------------------------------------------------------
void StreamIngestionThread::stop() {
  if (client_) {
    client_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  client_.reset();
}

domain::FeedState StreamIngestionThread::state() const {
  return client_ ? client_->state() : domain::FeedState::Disconnected;
}

int StreamIngestionThread::reconnectAttempts() const {
  return client_ ? client_->reconnectAttempts() : 0;
}

StreamStats StreamIngestionThread::stats() const {
  return client_ ? client_->stats() : StreamStats{};
}

}  // namespace tickrisk
