// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for tickrisk::EngineConfig loading and validation.
//
// Validates:
//   - Missing keys keep their defaults; present keys override
//   - Account seeds are read
//   - validateEngineConfig() rejects inconsistent thresholds and ranges
//   - loadEngineConfig() reports unreadable / malformed files and applies the
//     TICKRISK_FEED_API_KEY override
// =============================================================================

#include "tickrisk/config/engine_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

TEST(EngineConfigTest, DefaultsWhenEmpty) {
  auto c = tickrisk::engineConfigFromJson(nlohmann::json::object());

  EXPECT_TRUE(c.feed_endpoint.empty());
  EXPECT_EQ(c.max_reconnect_attempts, 10);
  EXPECT_EQ(c.reconnect_base_delay_ms, 3000);
  EXPECT_EQ(c.cache.stream_ttl_ms, 10'000);
  EXPECT_EQ(c.cache.fetch_cooldown_ms, 2'000);
  EXPECT_TRUE(c.static_fallback);
  EXPECT_DOUBLE_EQ(c.risk.liquidation, 50.0);
  EXPECT_EQ(c.settlement_workers, 2);
  EXPECT_EQ(c.trade_max_retries, 3);
  EXPECT_EQ(c.sweep_interval_ms, 30'000);
  EXPECT_EQ(c.ipc_cmd_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_NO_THROW(tickrisk::validateEngineConfig(c));
}

TEST(EngineConfigTest, OverridesFromJson) {
  auto j = nlohmann::json::parse(R"({
    "feed": {"endpoint": "tcp://feed:9000", "symbols": ["EUR/USD", "USD/JPY"],
             "max_reconnect_attempts": 4},
    "rest": {"base_url": "https://quotes.example", "timeout_ms": 1500},
    "cache": {"stream_ttl_ms": 5000, "static_fallback": false},
    "risk": {"liquidation": 30, "margin_call": 80, "max_positions": 3},
    "ipc": {"command_endpoint": "", "telemetry_endpoint": ""},
    "sweep_interval_ms": 1000,
    "settlement_workers": 4,
    "accounts": [{"user_id": "u1", "context_id": "cup", "capital": 2500.5}]
  })");

  auto c = tickrisk::engineConfigFromJson(j);

  EXPECT_EQ(c.feed_endpoint, "tcp://feed:9000");
  ASSERT_EQ(c.symbols.size(), 2u);
  EXPECT_EQ(c.symbols[1], "USD/JPY");
  EXPECT_EQ(c.max_reconnect_attempts, 4);
  EXPECT_EQ(c.rest_base_url, "https://quotes.example");
  EXPECT_EQ(c.rest_timeout_ms, 1500);
  EXPECT_EQ(c.cache.stream_ttl_ms, 5000);
  EXPECT_EQ(c.cache.local_ttl_ms, 15'000);
  EXPECT_FALSE(c.static_fallback);
  EXPECT_DOUBLE_EQ(c.risk.liquidation, 30.0);
  EXPECT_DOUBLE_EQ(c.risk.warning, 150.0);
  EXPECT_EQ(c.risk.max_positions, 3);
  EXPECT_TRUE(c.ipc_cmd_endpoint.empty());
  EXPECT_EQ(c.settlement_workers, 4);
  ASSERT_EQ(c.accounts.size(), 1u);
  EXPECT_EQ(c.accounts[0].context_id, "cup");
  EXPECT_DOUBLE_EQ(c.accounts[0].capital, 2500.5);
  EXPECT_NO_THROW(tickrisk::validateEngineConfig(c));
}

// -----------------------------------------------------------------------------
// Validation: a misordered band or non-positive interval is fatal.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, ValidationRejectsBadValues) {
  tickrisk::EngineConfig c;
  c.risk.liquidation = 120.0;
  EXPECT_THROW(tickrisk::validateEngineConfig(c), std::runtime_error);

  tickrisk::EngineConfig workers;
  workers.settlement_workers = 0;
  EXPECT_THROW(tickrisk::validateEngineConfig(workers), std::runtime_error);

  tickrisk::EngineConfig ttl;
  ttl.cache.stream_ttl_ms = 0;
  EXPECT_THROW(tickrisk::validateEngineConfig(ttl), std::runtime_error);
}

TEST(EngineConfigTest, WrongTypeThrowsJsonError) {
  auto j = nlohmann::json::parse(R"({"settlement_workers": "many"})");
  EXPECT_THROW(tickrisk::engineConfigFromJson(j), nlohmann::json::exception);
}

class EngineConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path = fs::temp_directory_path() /
           (std::string("tickrisk_config_") +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() +
            ".json");
  }
  void TearDown() override {
    fs::remove(path);
    ::unsetenv(tickrisk::kFeedApiKeyEnv);
  }

  void write(const std::string& text) {
    std::ofstream out(path);
    out << text;
  }

  fs::path path;
};

TEST_F(EngineConfigFileTest, MissingFileThrows) {
  EXPECT_THROW(tickrisk::loadEngineConfig(path.string()), std::runtime_error);
}

TEST_F(EngineConfigFileTest, MalformedFileThrowsRuntimeError) {
  write("{\"feed\": ");
  EXPECT_THROW(tickrisk::loadEngineConfig(path.string()), std::runtime_error);
}

// -----------------------------------------------------------------------------
// The environment wins over the file for the feed credential.
// -----------------------------------------------------------------------------
TEST_F(EngineConfigFileTest, EnvironmentOverridesApiKey) {
  write(R"({"feed": {"api_key": "from-file"}})");

  auto from_file = tickrisk::loadEngineConfig(path.string());
  EXPECT_EQ(from_file.feed_api_key, "from-file");

  ::setenv(tickrisk::kFeedApiKeyEnv, "from-env", 1);
  auto from_env = tickrisk::loadEngineConfig(path.string());
  EXPECT_EQ(from_env.feed_api_key, "from-env");
}
