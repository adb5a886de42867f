#include "tickrisk/config/engine_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tickrisk {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

}  // namespace

EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  EngineConfig c;

  if (auto feed = j.find("feed"); feed != j.end()) {
    readIfPresent(*feed, "endpoint", c.feed_endpoint);
    readIfPresent(*feed, "api_key", c.feed_api_key);
    readIfPresent(*feed, "symbols", c.symbols);
    readIfPresent(*feed, "idle_timeout_ms", c.feed_idle_timeout_ms);
    readIfPresent(*feed, "reconnect_base_delay_ms", c.reconnect_base_delay_ms);
    readIfPresent(*feed, "max_reconnect_attempts", c.max_reconnect_attempts);
  }

  if (auto rest = j.find("rest"); rest != j.end()) {
    readIfPresent(*rest, "base_url", c.rest_base_url);
    readIfPresent(*rest, "timeout_ms", c.rest_timeout_ms);
  }

  if (auto cache = j.find("cache"); cache != j.end()) {
    readIfPresent(*cache, "stream_ttl_ms", c.cache.stream_ttl_ms);
    readIfPresent(*cache, "local_ttl_ms", c.cache.local_ttl_ms);
    readIfPresent(*cache, "shared_ttl_ms", c.cache.shared_ttl_ms);
    readIfPresent(*cache, "fetch_cooldown_ms", c.cache.fetch_cooldown_ms);
    readIfPresent(*cache, "stale_after_ms", c.cache.stale_after_ms);
    readIfPresent(*cache, "static_fallback", c.static_fallback);
  }

  if (auto risk = j.find("risk"); risk != j.end()) {
    readIfPresent(*risk, "liquidation", c.risk.liquidation);
    readIfPresent(*risk, "margin_call", c.risk.margin_call);
    readIfPresent(*risk, "warning", c.risk.warning);
    readIfPresent(*risk, "safe", c.risk.safe);
    readIfPresent(*risk, "max_positions", c.risk.max_positions);
    readIfPresent(*risk, "max_leverage", c.risk.max_leverage);
    readIfPresent(*risk, "max_lot_size", c.risk.max_lot_size);
  }

  if (auto ipc = j.find("ipc"); ipc != j.end()) {
    readIfPresent(*ipc, "command_endpoint", c.ipc_cmd_endpoint);
    readIfPresent(*ipc, "telemetry_endpoint", c.ipc_pub_endpoint);
  }

  readIfPresent(j, "sweep_interval_ms", c.sweep_interval_ms);
  readIfPresent(j, "settlement_workers", c.settlement_workers);
  readIfPresent(j, "trade_max_retries", c.trade_max_retries);
  readIfPresent(j, "journal_path", c.journal_path);

  if (auto accounts = j.find("accounts"); accounts != j.end()) {
    for (const auto& a : *accounts) {
      AccountSeed seed;
      seed.user_id = a.at("user_id").get<std::string>();
      seed.context_id = a.value("context_id", std::string{});
      seed.capital = a.at("capital").get<double>();
      c.accounts.push_back(std::move(seed));
    }
  }

  return c;
}

void validateEngineConfig(const EngineConfig& c) {
  auto fail = [](const std::string& what) {
    throw std::runtime_error("invalid config: " + what);
  };
  if (c.cache.stream_ttl_ms <= 0 || c.cache.local_ttl_ms <= 0 ||
      c.cache.shared_ttl_ms <= 0 || c.cache.stale_after_ms <= 0) {
    fail("cache TTLs must be positive");
  }
  if (c.cache.fetch_cooldown_ms < 0) {
    fail("cache.fetch_cooldown_ms must not be negative");
  }
  if (c.reconnect_base_delay_ms <= 0 || c.max_reconnect_attempts < 0) {
    fail("feed reconnect settings out of range");
  }
  if (c.sweep_interval_ms <= 0) {
    fail("sweep_interval_ms must be positive");
  }
  if (c.settlement_workers < 1) {
    fail("settlement_workers must be at least 1");
  }
  if (c.trade_max_retries < 0) {
    fail("trade_max_retries must not be negative");
  }
  if (!(c.risk.liquidation < c.risk.margin_call &&
        c.risk.margin_call < c.risk.warning && c.risk.warning <= c.risk.safe)) {
    fail("risk thresholds must satisfy liquidation < margin_call < warning <= safe");
  }
  if (c.risk.max_positions < 1 || c.risk.max_leverage < 1.0 ||
      c.risk.max_lot_size <= 0.0) {
    fail("risk limits out of range");
  }
}

// -----------------------------------------------------------------------------
// loadEngineConfig(): file → JSON → struct, then env override
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file: " + path);
  }

  EngineConfig config;
  try {
    config = engineConfigFromJson(nlohmann::json::parse(in));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("malformed config " + path + ": " + e.what());
  }

  if (const char* key = std::getenv(kFeedApiKeyEnv); key != nullptr && *key) {
    config.feed_api_key = key;
  }

  validateEngineConfig(config);

  std::cout << "[Config] loaded " << path << " (feed="
            << (config.feed_endpoint.empty() ? "off" : config.feed_endpoint)
            << ", rest=" << (config.rest_base_url.empty() ? "off" : "on")
            << ", workers=" << config.settlement_workers << ")\n";
  return config;
}

}  // namespace tickrisk
