#include "tickrisk/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cmath>
#include <iostream>
#include <utility>

namespace tickrisk {

namespace {

nlohmann::json positionJson(const domain::TrackedPosition& p) {
  nlohmann::json j;
  j["position_id"] = p.position_id;
  j["user_id"] = p.user_id;
  j["context_id"] = p.context_id;
  j["symbol"] = p.symbol;
  j["side"] = domain::toString(p.side);
  j["entry_price"] = p.entry_price;
  j["quantity"] = p.quantity;
  j["stop_loss"] = p.stop_loss ? nlohmann::json(*p.stop_loss) : nlohmann::json();
  j["take_profit"] =
      p.take_profit ? nlohmann::json(*p.take_profit) : nlohmann::json();
  return j;
}

std::string formatTriggered(const PositionTriggeredEvent& e) {
  nlohmann::json j;
  j["type"] = "position_triggered";
  j["trade_id"] = e.trade_id;
  j["reason"] = domain::toString(e.reason);
  j["trigger_price"] = e.trigger_price;
  j["position"] = positionJson(e.position);
  return j.dump();
}

std::string formatMarginStatus(const MarginStatusEvent& e) {
  nlohmann::json j;
  j["type"] = "margin_status";
  j["user_id"] = e.user_id;
  j["context_id"] = e.context_id;
  j["status"] = domain::toString(e.snapshot.status);
  j["equity"] = e.snapshot.equity;
  j["used_margin"] = e.snapshot.used_margin;
  j["free_margin"] = e.snapshot.free_margin;
  // JSON has no infinity; an account with no margin in use reports null.
  j["margin_level"] = std::isfinite(e.snapshot.margin_level)
                          ? nlohmann::json(e.snapshot.margin_level)
                          : nlohmann::json();
  j["liquidated_positions"] = e.liquidated_positions;
  return j.dump();
}

std::string formatSettled(const TradeSettledEvent& e) {
  nlohmann::json j;
  j["type"] = "trade_settled";
  j["trade"] = domain::toJson(e.trade);
  j["realized_pnl"] = e.realized_pnl;
  return j.dump();
}

std::string formatDropped(const TradeDroppedEvent& e) {
  nlohmann::json j;
  j["type"] = "trade_dropped";
  j["trade"] = domain::toJson(e.trade);
  j["error"] = e.error;
  return j.dump();
}

std::string formatFeedStatus(const FeedStatusEvent& e) {
  nlohmann::json j;
  j["type"] = "feed_status";
  j["state"] = domain::toString(e.state);
  j["attempt"] = e.attempt;
  j["detail"] = e.detail;
  return j.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (!json_str) {
      continue;
    }
    zmq::message_t msg(json_str->data(), json_str->size());
    try {
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] ERROR: telemetry publish failed: " << e.what()
                << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<PositionTriggeredEvent>(&event)) {
    return formatTriggered(*e);
  }
  if (auto* e = std::get_if<MarginStatusEvent>(&event)) {
    return formatMarginStatus(*e);
  }
  if (auto* e = std::get_if<TradeSettledEvent>(&event)) {
    return formatSettled(*e);
  }
  if (auto* e = std::get_if<TradeDroppedEvent>(&event)) {
    return formatDropped(*e);
  }
  if (auto* e = std::get_if<FeedStatusEvent>(&event)) {
    return formatFeedStatus(*e);
  }
  return std::nullopt;
}

}  // namespace tickrisk
