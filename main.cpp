// -----------------------------------------------------------------------------
// tickrisk — single executable entry point.
//
//   1) Load EngineConfig from the JSON file named on the command line
//      (default: config/tickrisk.json). TICKRISK_FEED_API_KEY overrides the
//      feed key.
//   2) Initialise libcurl once for the process (the REST fetch tier).
//   3) Seed the in-memory position store with the configured accounts.
//   4) Start the PriceRiskEngine and block until SIGINT/SIGTERM.
//   5) Stop the engine (joins every thread) and clean up libcurl.
//
// Thread layout: see PriceRiskEngine. The main thread only waits.
// -----------------------------------------------------------------------------

#include "tickrisk/config/engine_config.hpp"
#include "tickrisk/engine/price_risk_engine.hpp"
#include "tickrisk/store/in_memory_position_store.hpp"
#include "tickrisk/store/logging_notification_sink.hpp"
#include "tickrisk/store/static_risk_settings_store.hpp"
#include "tickrisk/time/system_clock.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Set by the signal handler, polled by main(). Lock-free atomic<bool> store
// is async-signal-safe.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : std::string("config/tickrisk.json");

  // -------------------------------------------------------------------------
  // 1) Configuration. Any problem here is fatal: log and exit non-zero.
  // -------------------------------------------------------------------------
  tickrisk::EngineConfig config;
  try {
    config = tickrisk::loadEngineConfig(config_path);
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) libcurl global state, before any RestQuoteFetcher is constructed.
  // -------------------------------------------------------------------------
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "[main] ERROR: curl_global_init failed.\n";
    return 1;
  }

  int exit_code = 0;
  {
    // -----------------------------------------------------------------------
    // 3) Collaborators. The standalone binary keeps the system of record in
    //    memory; a deployment supplies its own IPositionStore.
    // -----------------------------------------------------------------------
    tickrisk::SystemClock clock;
    tickrisk::InMemoryPositionStore store;
    for (const auto& account : config.accounts) {
      store.addAccount(account.user_id, account.context_id, account.capital);
    }
    tickrisk::StaticRiskSettingsStore settings(config.risk);
    tickrisk::LoggingNotificationSink notifications;

    // -----------------------------------------------------------------------
    // 4) Engine.
    // -----------------------------------------------------------------------
    tickrisk::PriceRiskEngine engine(config, clock, store, settings,
                                     notifications);

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    try {
      engine.start();

      std::cout << "[main] running. Press Ctrl-C to shut down.\n";
      while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
      std::cout << "\n[main] shutdown requested. Stopping engine...\n";
    } catch (const std::exception& e) {
      std::cerr << "[main] ERROR: engine failed: " << e.what() << "\n";
      exit_code = 1;
    }

    // -----------------------------------------------------------------------
    // 5) Clean shutdown: joins every engine thread.
    // -----------------------------------------------------------------------
    engine.stop();
  }

  curl_global_cleanup();
  return exit_code;
}
