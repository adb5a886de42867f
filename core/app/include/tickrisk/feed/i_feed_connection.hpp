#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tickrisk {
namespace feed {

enum class RecvStatus { Frame, Timeout, Closed };

struct RecvResult {
  RecvStatus status{RecvStatus::Timeout};
  std::string frame;
};

// -----------------------------------------------------------------------------
// IFeedConnection — one transport session to the market-data feed
// -----------------------------------------------------------------------------
//
// @brief  Minimal message-oriented transport the stream client drives:
//         open, send text frames, receive text frames with a timeout, close.
//
// @details
// A connection object represents exactly one session. After receive()
// reports Closed, or after close(), the object is discarded and the client
// asks its factory for a fresh one on the next reconnect attempt.
//
// Implementations do not throw; transport errors surface as open() or
// send() returning false, or receive() returning Closed.
//
// Thread model:
//   Used only from the stream client thread.
// -----------------------------------------------------------------------------
class IFeedConnection {
 public:
  virtual ~IFeedConnection() = default;

  virtual bool open() = 0;
  virtual bool send(const std::string& frame) = 0;
  virtual RecvResult receive(std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
};

using FeedConnectionFactory = std::function<std::unique_ptr<IFeedConnection>()>;

}  // namespace feed
}  // namespace tickrisk
