#pragma once

#include "tickrisk/feed/i_feed_connection.hpp"

#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace tickrisk {
namespace feed {

// -----------------------------------------------------------------------------
// ZmqFeedConnection — feed session over a ZeroMQ DEALER socket
// -----------------------------------------------------------------------------
//
// @brief  Carries the JSON auth/subscribe handshake and the event stream
//         over one DEALER socket connected to the feed endpoint.
//
// @details
// DEALER gives a bidirectional, unsolicited message stream (the feed pushes
// events without a request per event), which a REQ/REP pair cannot.
//
// ZeroMQ reconnects transparently underneath and never reports a peer
// disconnect, so "connection closed" is inferred from silence: if no frame
// arrives for idle_timeout, receive() reports Closed and the stream client
// runs its reconnect logic. The feed is expected to send at least a
// heartbeat/status frame inside that window.
//
// Errors from libzmq (zmq::error_t) are caught here and logged; they surface
// as false / Closed.
//
// Ownership:
//   Owns its zmq context and socket; both are released by close() or the
//   destructor. linger is 0 so close never blocks on unsent frames.
// -----------------------------------------------------------------------------
class ZmqFeedConnection final : public IFeedConnection {
 public:
  ZmqFeedConnection(std::string endpoint, std::chrono::milliseconds idle_timeout);
  ~ZmqFeedConnection() override;

  ZmqFeedConnection(const ZmqFeedConnection&) = delete;
  ZmqFeedConnection& operator=(const ZmqFeedConnection&) = delete;

  bool open() override;
  bool send(const std::string& frame) override;
  RecvResult receive(std::chrono::milliseconds timeout) override;
  void close() override;

 private:
  std::string endpoint_;
  std::chrono::milliseconds idle_timeout_;
  std::chrono::steady_clock::time_point last_frame_at_{};

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace feed
}  // namespace tickrisk
