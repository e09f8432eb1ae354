// -----------------------------------------------------------------------------
// intraday_ledger: single executable entry point.
//
//   intraday_ledger [config.json] [instrument_index]
//
//   1) Load the AppConfig (default "config.json").
//   2) Build a TradingSession for the selected instrument (default 0).
//   3) start(): IPC server, price-tick loop, market-data feed.
//   4) Wait for SIGINT/SIGTERM.
//   5) stop(): joins all threads; paper sessions export their trades.
//
// Commands arrive on the IPC REP socket ("BUY 2", "SELL 1", "CLOSE_ALL",
// "STATE", ...). Live mode needs a broker client, which this binary does not
// provide; configure "mode": "paper" to run it standalone.
// -----------------------------------------------------------------------------

#include "intraday/config/app_config.hpp"
#include "intraday/engine/trading_session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the signal handler; polled by main. Lock-free atomic stores are
// async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void shutdown_handler(int /*signum*/) { g_shutdown_requested.store(true); }

}  // namespace

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : "config.json";

  std::size_t instrument_index = 0;
  if (argc > 2) {
    try {
      instrument_index = static_cast<std::size_t>(std::stoul(argv[2]));
    } catch (const std::exception&) {
      std::cerr << "[main] invalid instrument index: " << argv[2] << "\n";
      return EXIT_FAILURE;
    }
  }

  intraday::AppConfig config;
  try {
    config = intraday::AppConfig::load(config_path);
  } catch (const intraday::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  try {
    intraday::TradingSession session(std::move(config), instrument_index);

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    session.start();
    std::cout << "[main] session running. Press Ctrl-C to shut down.\n";

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] shutdown requested. Stopping session...\n";
    session.stop();

    if (auto exported = session.finalExport(); exported && exported->ok()) {
      std::cout << "[main] trades exported: " << exported->path << "\n";
    }
  } catch (const intraday::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
