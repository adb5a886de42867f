#include "tickrisk/feed/zmq_feed_connection.hpp"

#include <iostream>
#include <utility>

namespace tickrisk {
namespace feed {

ZmqFeedConnection::ZmqFeedConnection(std::string endpoint,
                                     std::chrono::milliseconds idle_timeout)
    : endpoint_(std::move(endpoint)), idle_timeout_(idle_timeout) {}

ZmqFeedConnection::~ZmqFeedConnection() { close(); }

// -----------------------------------------------------------------------------
// open(): create the DEALER socket and start the async connect
// -----------------------------------------------------------------------------
bool ZmqFeedConnection::open() {
  close();
  try {
    context_ = std::make_unique<zmq::context_t>(1);
    socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::dealer);
    socket_->set(zmq::sockopt::linger, 0);
    socket_->connect(endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqFeedConnection] ERROR: connect to " << endpoint_
              << " failed: " << e.what() << "\n";
    socket_.reset();
    context_.reset();
    return false;
  }
  last_frame_at_ = std::chrono::steady_clock::now();
  return true;
}

bool ZmqFeedConnection::send(const std::string& frame) {
  if (!socket_) {
    return false;
  }
  try {
    zmq::message_t msg(frame.data(), frame.size());
    return socket_->send(msg, zmq::send_flags::none).has_value();
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqFeedConnection] ERROR: send failed: " << e.what()
              << "\n";
    return false;
  }
}

// -----------------------------------------------------------------------------
// receive(): timed recv; prolonged silence is reported as Closed
// -----------------------------------------------------------------------------
RecvResult ZmqFeedConnection::receive(std::chrono::milliseconds timeout) {
  if (!socket_) {
    return {RecvStatus::Closed, {}};
  }

  zmq::message_t msg;
  try {
    socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout.count()));
    auto result = socket_->recv(msg, zmq::recv_flags::none);
    if (result.has_value()) {
      last_frame_at_ = std::chrono::steady_clock::now();
      return {RecvStatus::Frame, msg.to_string()};
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqFeedConnection] ERROR: recv failed: " << e.what()
              << "\n";
    return {RecvStatus::Closed, {}};
  }

  if (std::chrono::steady_clock::now() - last_frame_at_ > idle_timeout_) {
    std::cerr << "[ZmqFeedConnection] no frame for " << idle_timeout_.count()
              << " ms; treating connection as closed.\n";
    return {RecvStatus::Closed, {}};
  }
  return {RecvStatus::Timeout, {}};
}

void ZmqFeedConnection::close() {
  socket_.reset();
  context_.reset();
}

}  // namespace feed
}  // namespace tickrisk
