#pragma once

#include "intraday/config/app_config.hpp"
#include "intraday/engine/price_tick_loop.hpp"
#include "intraday/execution/i_broker_client.hpp"
#include "intraday/execution/i_trader.hpp"
#include "intraday/ledger/position_manager.hpp"
#include "intraday/ledger/session_reporter.hpp"
#include "intraday/logging/logger.hpp"
#include "intraday/market/quote_book.hpp"
#include "intraday/network/ipc_server.hpp"
#include "intraday/network/market_data_thread.hpp"
#include "intraday/time/live_time_provider.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// TradingSession
// -----------------------------------------------------------------------------
//
// @brief  Owns every component of one trading session and exposes the
//         operator command set.
//
// @details
// Built from an AppConfig and the index of the instrument to trade. The
// trading mode picks the trader variant and the ledger mode:
//
//   paper → PaperTrader over the QuoteBook, PositionManager in simulation
//           mode (closed trades reconstructed, exported on stop()).
//   live  → LiveTrader over the IBrokerClient passed in, PositionManager
//           with simulation mode off. Requires a non-null broker.
//
// The clock mode picks what timestamps the ledger and logs:
//   wall   → LiveTimeProvider.
//   replay → SimulationTimeProvider, advanced by the market-data feed.
//
// Thread layout (after start()):
//
//   ipc thread          → IpcServer, runs executeCommand()
//   market_data thread  → MarketDataGateway → QuoteBook::update()
//   price_tick thread   → PriceTickLoop (mark-to-market refresh)
//   main thread         → start(), wait for a signal, stop()
//
// Components whose endpoint is empty in the config are not created, and a
// zero price_poll_interval_ms disables the price-tick thread. Unit tests use
// this to drive the session through executeCommand() with no sockets.
//
// Commands (executeCommand):
//   "PING"          → {"status":"ok","response":"PONG"}
//   "STATE"         → {"status":"ok","state":{...}}
//   "TRADES"        → {"status":"ok","trades":[...],"stats":{...}}
//   "STATS"         → {"status":"ok","stats":{...}}
//   "BUY n"/"SELL n"→ {"status":"ok","order":{...}}
//   "CLOSE_ALL"     → sells every open lot
//   "INSTRUMENT i"  → switches to configured instrument i (0-based)
//   "EXPORT"        → writes the session's trades to CSV
//   other           → {"status":"error","response":"Unknown command: ..."}
// Every failure answers {"status":"error","response":"<reason>"}. After any
// command that can change the ledger the state is published on the PUB
// socket as {"type":"state", ...}.
//
// Ownership:
//   TradingSession
//    ├── live_clock_ / sim_clock_   (value members; clock_ refers to one)
//    ├── logger_                    (unique_ptr<Logger>)
//    ├── positions_                 (unique_ptr<PositionManager>)
//    ├── quotes_                    (QuoteBook, value member)
//    ├── trader_                    (unique_ptr<ITrader>)
//    ├── price_loop_                (unique_ptr<PriceTickLoop>)
//    ├── market_data_thread_        (unique_ptr<MarketDataThread>)
//    ├── ipc_server_                (unique_ptr<IpcServer>)
//    └── broker_                    (IBrokerClient*, non-owning)
// -----------------------------------------------------------------------------
class TradingSession {
 public:
  // @throws ConfigError when instrument_index is out of range, or live mode
  //         is configured without a broker client.
  explicit TradingSession(AppConfig config, std::size_t instrument_index = 0,
                          IBrokerClient* broker = nullptr);

  ~TradingSession();

  TradingSession(const TradingSession&) = delete;
  TradingSession& operator=(const TradingSession&) = delete;
  TradingSession(TradingSession&&) = delete;
  TradingSession& operator=(TradingSession&&) = delete;

  // Starts IPC, the price-tick loop and the market-data feed (last).
  // Idempotent.
  void start();

  // Stops all threads. In paper mode exports the session's trades.
  // Idempotent.
  void stop();

  // Thread-safe. Returns a JSON response string.
  std::string executeCommand(const std::string& cmd);

  // The state document published after mutations.
  nlohmann::json stateJson() const;

  // Result of the export done by stop(); empty until then.
  std::optional<ExportResult> finalExport() const;

  const AppConfig& config() const { return config_; }
  Logger& logger() { return *logger_; }
  PositionManager& positions() { return *positions_; }
  QuoteBook& quoteBook() { return quotes_; }
  ITrader& trader() { return *trader_; }
  PriceTickLoop& priceTickLoop() { return *price_loop_; }
  SimulationTimeProvider& simulationClock() { return sim_clock_; }
  bool isPaper() const { return config_.mode == TradingMode::Paper; }

 private:
  nlohmann::json placeOrder(domain::Side side, std::int64_t lots);
  nlohmann::json closeAll();
  nlohmann::json changeInstrument(const std::string& arg);
  nlohmann::json exportTrades();

  void broadcastState();

  static nlohmann::json error(const std::string& message);

  AppConfig config_;
  IBrokerClient* broker_;

  LiveTimeProvider live_clock_;
  SimulationTimeProvider sim_clock_;
  const ITimeProvider& clock_;

  std::unique_ptr<Logger> logger_;
  std::unique_ptr<PositionManager> positions_;
  QuoteBook quotes_;
  std::unique_ptr<ITrader> trader_;
  std::unique_ptr<PriceTickLoop> price_loop_;

  std::unique_ptr<MarketDataThread> market_data_thread_;
  std::unique_ptr<IpcServer> ipc_server_;

  // Serializes command handling (IPC thread, tests, signal-driven stop()).
  mutable std::mutex command_mutex_;
  std::optional<ExportResult> final_export_;
  bool running_{false};
};

}  // namespace intraday
