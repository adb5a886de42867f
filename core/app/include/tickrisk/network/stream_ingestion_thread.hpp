#pragma once

#include "tickrisk/feed/price_stream_client.hpp"

#include <memory>
#include <thread>

namespace tickrisk {

// -----------------------------------------------------------------------------
// StreamIngestionThread — owns the thread that runs the price stream
// -----------------------------------------------------------------------------
//
// @brief  Runs PriceStreamClient::run() on a dedicated thread.
//
// @details
// The client is created in start(), not in the constructor, so that the
// engine can be fully wired (price loop subscribers registered) before the
// first tick is pushed.
//
// Thread model:
//   start()/stop() from the owning thread (PriceRiskEngine, on main).
//   The client's sink is invoked on the ingestion thread.
//
// Ownership:
//   Owns the client and the thread. Holds a reference to the spread
//   estimator and clock; both must outlive this object.
// -----------------------------------------------------------------------------
class StreamIngestionThread {
 public:
  StreamIngestionThread(feed::FeedConnectionFactory connection_factory,
                        StreamSettings settings,
                        SpreadEstimator& spreads,
                        const IClock& clock,
                        PriceStreamClient::EventSink event_sink);

  ~StreamIngestionThread();

  StreamIngestionThread(const StreamIngestionThread&) = delete;
  StreamIngestionThread& operator=(const StreamIngestionThread&) = delete;
  StreamIngestionThread(StreamIngestionThread&&) = delete;
  StreamIngestionThread& operator=(StreamIngestionThread&&) = delete;

  void start();
  void stop();

  // Disconnected before start() and after stop().
  domain::FeedState state() const;
  int reconnectAttempts() const;
  StreamStats stats() const;

 private:
  feed::FeedConnectionFactory connection_factory_;
  StreamSettings settings_;
  SpreadEstimator& spreads_;
  const IClock& clock_;
  PriceStreamClient::EventSink event_sink_;

  std::unique_ptr<PriceStreamClient> client_;
  std::thread thread_;
};

}  // namespace tickrisk
