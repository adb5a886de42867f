#pragma once

#include "tickrisk/domain/risk_thresholds.hpp"
#include "tickrisk/pricing/tiered_price_cache.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tickrisk {

// Seed account for the in-memory position store used by the standalone
// binary.
struct AccountSeed {
  std::string user_id;
  std::string context_id;
  double capital{0.0};
};

// -----------------------------------------------------------------------------
// EngineConfig — every tunable of PriceRiskEngine, with working defaults
// -----------------------------------------------------------------------------
//
// @details
// An empty endpoint or URL disables that component:
//   feed_endpoint  ""  → no streaming; prices come from fetch/fallback only
//   rest_base_url  ""  → no upstream fetch tier
//   ipc endpoints  ""  → no command/telemetry sockets
//   journal_path   ""  → the trade queue is memory-only
//
// JSON layout accepted by loadEngineConfig() (every key optional):
//
//   {
//     "feed":  {"endpoint", "api_key", "symbols": [...], "idle_timeout_ms",
//               "reconnect_base_delay_ms", "max_reconnect_attempts"},
//     "rest":  {"base_url", "timeout_ms"},
//     "cache": {"stream_ttl_ms", "local_ttl_ms", "shared_ttl_ms",
//               "fetch_cooldown_ms", "stale_after_ms", "static_fallback"},
//     "risk":  {"liquidation", "margin_call", "warning", "safe",
//               "max_positions", "max_leverage", "max_lot_size"},
//     "ipc":   {"command_endpoint", "telemetry_endpoint"},
//     "sweep_interval_ms", "settlement_workers", "trade_max_retries",
//     "journal_path",
//     "accounts": [{"user_id", "context_id", "capital"}]
//   }
// -----------------------------------------------------------------------------
struct EngineConfig {
  // Feed
  std::string feed_endpoint;
  std::string feed_api_key;
  std::vector<std::string> symbols;  // Empty: every catalog symbol
  std::int64_t feed_idle_timeout_ms{30'000};
  std::int64_t reconnect_base_delay_ms{3000};
  int max_reconnect_attempts{10};

  // Upstream fetch
  std::string rest_base_url;
  long rest_timeout_ms{5000};

  CacheTimings cache;
  bool static_fallback{true};

  domain::RiskThresholds risk;

  std::int64_t sweep_interval_ms{30'000};
  int settlement_workers{2};
  int trade_max_retries{3};
  std::string journal_path;

  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  std::vector<AccountSeed> accounts;
};

constexpr const char* kFeedApiKeyEnv = "TICKRISK_FEED_API_KEY";

// Applies every key present in `j` over the defaults. Throws
// nlohmann::json::exception on a key of the wrong type.
EngineConfig engineConfigFromJson(const nlohmann::json& j);

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads and parses the file, then applies the TICKRISK_FEED_API_KEY
//         environment override.
//
// @throws std::runtime_error if the file cannot be read, is not valid JSON,
//         or holds an out-of-range value.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

// Rejects values no component can run with (non-positive TTLs, zero
// workers, thresholds out of order). Throws std::runtime_error.
void validateEngineConfig(const EngineConfig& config);

}  // namespace tickrisk
