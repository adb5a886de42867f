#pragma once

#include "tickrisk/concurrent/thread_safe_queue.hpp"
#include "tickrisk/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tickrisk {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ operations surface: command REP + telemetry PUB
// -----------------------------------------------------------------------------
//
// @brief  One thread serving operator commands and broadcasting engine
//         telemetry as JSON.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (default tcp://127.0.0.1:5557):
//      One JSON object per message, "type" first:
//        position_triggered, margin_status, trade_settled, trade_dropped,
//        feed_status
//      Events arrive via pushTelemetry() from the telemetry loop and are
//      buffered in a ThreadSafeQueue, so serialization and socket I/O
//      never run on the price loop.
//
//   2. REP socket (default tcp://127.0.0.1:5556):
//      Each request string goes to the command handler
//      (PriceRiskEngine::executeCommand) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO bounds each poll so the thread alternates between
//      commands and telemetry.
//
// Thread model:
//   start()/stop() from the owner. pushTelemetry() from any thread. The
//   command handler runs on the IPC thread.
//
// Ownership:
//   Owned by PriceRiskEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Throws zmq::error_t if an
  // endpoint cannot be bound.
  void start();

  void stop();

  void pushTelemetry(Event event);

  // JSON for one telemetry event, or std::nullopt for event types that are
  // not broadcast (price ticks).
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tickrisk
